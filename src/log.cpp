#include "log.hpp"
#include <cerrno>
#include <cstring>

std::optional<LogLevel> parse_log_level(std::string_view s) {
  if (s == "debug") return LogLevel::Debug;
  if (s == "info") return LogLevel::Info;
  if (s == "warn") return LogLevel::Warn;
  if (s == "error") return LogLevel::Error;
  if (s == "off") return LogLevel::Off;
  return std::nullopt;
}

std::string_view log_level_name(LogLevel l) {
  switch (l) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info: return "info";
    case LogLevel::Warn: return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off: break;
  }
  return "off";
}

bool Logger::open(const std::filesystem::path& path, std::string& msg) {
  std::FILE* f = std::fopen(path.c_str(), "a");
  if (!f) { msg = "can not open log file: " + path.string() + " (" + std::strerror(errno) + ")"; return false; }
  file_.reset(f);
  msg = "logging to " + path.string();
  return true;
}

bool Logger::enabled(LogLevel l) const {
  return file_ && l != LogLevel::Off && level_ != LogLevel::Off && l >= level_;
}

void Logger::write(LogLevel l, std::string_view msg) {
  fmt::print(file_.get(), "[{}] {}\n", log_level_name(l), msg);
  std::fflush(file_.get());
}
