#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string_view>
#include "collectors/IPowerBackend.hpp"

namespace wattrec::collectors {

enum class PowerBackendKind { Auto, Rapl, Powermetrics, Battery, None };

// "auto", "rapl", "powermetrics", "battery", "none" (case-insensitive)
[[nodiscard]] std::optional<PowerBackendKind> parse_power_backend_kind(std::string_view s);
[[nodiscard]] const char* to_string(PowerBackendKind kind);

// Backend that fits the platform this binary was built for.
[[nodiscard]] PowerBackendKind platform_power_backend();

// Auto resolves through platform_power_backend(). 'timeout' bounds each
// helper process the backend spawns.
[[nodiscard]] std::unique_ptr<IPowerBackend> make_power_backend(
    PowerBackendKind kind, std::chrono::milliseconds timeout = std::chrono::milliseconds(1000));

} // namespace wattrec::collectors
