#pragma once
/*
 * RcConfig
 *
 * Purpose: run-time settings read from ~/.wrapviewrc, one command per line:
 *   set log <path>
 *   set loglevel debug|info|warn|error|off
 *   set filler <char>
 * Lines starting with '#' or '"' are comments; a leading ':' is allowed.
 * Bad lines become diagnostics and never abort start-up.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "config.hpp"
#include "log.hpp"

struct Settings {
  std::optional<std::filesystem::path> log_path;
  LogLevel log_level = LogLevel::Info;
  char filler = WV_DEFAULT_FILLER;
};

class RcConfig {
public:
  RcConfig(Settings& settings, std::vector<std::string>& diagnostics);
  void execute_line(std::string line);
  // false when the file exists but can not be read; a missing file is fine
  bool load_file(const std::filesystem::path& path);
private:
  void register_commands();
  Settings& settings_;
  std::vector<std::string>& diagnostics_;
  CommandRegistry registry_;
};

std::optional<std::filesystem::path> default_rc_path();
