#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static std::string tmp_path(const char* suffix) {
  auto p = std::filesystem::temp_directory_path() /
           (std::string("wattrec_test_toml_") + suffix + "_" + std::to_string(::getpid()) + ".toml");
  return p.string();
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(toml_load_missing_file) {
  wattrec::util::TomlReader tr;
  ASSERT_TRUE(!tr.load(tmp_path("nonexistent")));
}

TEST(toml_load_basic) {
  auto path = tmp_path("basic");
  write_file(path,
    "[output]\n"
    "dir = \"/var/tmp/runs\"\n"
    "\n"
    "[sampling]\n"
    "interval_ms = 500\n"
    "\n"
    "[log]\n"
    "verbose = true\n"
  );
  wattrec::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("output", "dir"), "/var/tmp/runs");
  ASSERT_EQ(tr.get_int("sampling", "interval_ms"), 500);
  ASSERT_EQ(tr.get_bool("log", "verbose", false), true);
  remove_file(path);
}

TEST(toml_defaults_for_missing_keys) {
  auto path = tmp_path("defaults");
  write_file(path, "[power]\nbackend = rapl\n");
  wattrec::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("power", "missing_key", "fallback"), "fallback");
  ASSERT_EQ(tr.get_int("power", "timeout_ms", 1000), 1000);
  ASSERT_EQ(tr.get_bool("power", "missing_bool", true), true);
  ASSERT_EQ(tr.get_string("nosection", "key", "nope"), "nope");
  ASSERT_TRUE(tr.has("power", "backend"));
  ASSERT_TRUE(!tr.has("power", "timeout_ms"));
  ASSERT_TRUE(!tr.has("nosection", "backend"));
  remove_file(path);
}

TEST(toml_bool_and_int_coercion) {
  auto path = tmp_path("coerce");
  write_file(path,
    "[b]\n"
    "a = True\n"
    "b = 0\n"
    "c = junk\n"
    "n = -7\n"
    "s = hello\n"
  );
  wattrec::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_bool("b", "a"), true);
  ASSERT_EQ(tr.get_bool("b", "b", true), false);
  ASSERT_EQ(tr.get_bool("b", "c", true), true);
  ASSERT_EQ(tr.get_bool("b", "c", false), false);
  ASSERT_EQ(tr.get_int("b", "n"), -7);
  ASSERT_EQ(tr.get_int("b", "s", 99), 99);
  remove_file(path);
}

TEST(toml_quotes_and_comments) {
  auto path = tmp_path("comments");
  write_file(path,
    "# wattrec settings\n"
    "[ output ]  \n"
    "  dir = '~/runs'   # single quotes\n"
    "  tag = \"#1 run\"\n"
    "[power]\n"
    "backend = \"powermetrics\" # macOS only\n"
    "timeout_ms = 750#tight\n"
  );
  wattrec::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("output", "dir"), "~/runs");
  ASSERT_EQ(tr.get_string("output", "tag"), "#1 run");
  ASSERT_EQ(tr.get_string("power", "backend"), "powermetrics");
  ASSERT_EQ(tr.get_int("power", "timeout_ms"), 750);
  remove_file(path);
}

TEST(toml_later_key_wins) {
  auto path = tmp_path("dup");
  write_file(path, "[sampling]\ninterval_ms = 200\n[sampling]\ninterval_ms = 300\n");
  wattrec::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("sampling", "interval_ms"), 300);
  remove_file(path);
}

TEST(toml_global_keys_no_section) {
  auto path = tmp_path("global");
  write_file(path, "key = value\n[sec]\nother = 1\n");
  wattrec::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("", "key"), "value");
  ASSERT_EQ(tr.get_int("sec", "other"), 1);
  remove_file(path);
}
