#pragma once
/*
 * Logger
 *
 * Purpose: leveled diagnostic log appended to a file, formatted with fmt.
 * Note: never writes to the terminal (the renderer owns it); disabled until
 *       open() succeeds.
 */
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/format.h>

enum class LogLevel { Debug, Info, Warn, Error, Off };

std::optional<LogLevel> parse_log_level(std::string_view s);
std::string_view log_level_name(LogLevel l);

class Logger {
public:
  bool open(const std::filesystem::path& path, std::string& msg);
  bool is_open() const { return file_ != nullptr; }
  void set_level(LogLevel l) { level_ = l; }
  LogLevel level() const { return level_; }
  bool enabled(LogLevel l) const;

  template <typename... Args>
  void log(LogLevel l, fmt::format_string<Args...> f, Args&&... args) {
    if (!enabled(l)) return;
    write(l, fmt::format(f, std::forward<Args>(args)...));
  }
  template <typename... Args>
  void debug(fmt::format_string<Args...> f, Args&&... args) { log(LogLevel::Debug, f, std::forward<Args>(args)...); }
  template <typename... Args>
  void info(fmt::format_string<Args...> f, Args&&... args) { log(LogLevel::Info, f, std::forward<Args>(args)...); }
  template <typename... Args>
  void warn(fmt::format_string<Args...> f, Args&&... args) { log(LogLevel::Warn, f, std::forward<Args>(args)...); }
  template <typename... Args>
  void error(fmt::format_string<Args...> f, Args&&... args) { log(LogLevel::Error, f, std::forward<Args>(args)...); }

private:
  struct FileCloser { void operator()(std::FILE* f) const { std::fclose(f); } };
  void write(LogLevel l, std::string_view msg);
  std::unique_ptr<std::FILE, FileCloser> file_;
  LogLevel level_ = LogLevel::Info;
};
