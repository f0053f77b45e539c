// Helpers for reading /proc and /sys with optional root remap
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wattrec::util {

// Map an absolute /proc path to an alternate root if WATTREC_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if WATTREC_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Apply whichever of the two remaps matches the path prefix.
auto map_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read the first unsigned integer of a file (sysfs counters). nullopt on error.
auto read_file_u64(const std::string& abs) -> std::optional<uint64_t>;

// List directory entries (names only, sorted). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

} // namespace wattrec::util
