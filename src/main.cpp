#include "terminal.hpp"
#include "posix_terminal.hpp"
#include "session.hpp"
#include "rc_config.hpp"
#include "log.hpp"
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <utility>

int main(int argc, char** argv) {
  Settings settings;
  std::vector<std::string> diagnostics;
  RcConfig rc(settings, diagnostics);
  if (auto p = default_rc_path()) rc.load_file(*p);
  if (const char* env = std::getenv(WV_LOG_ENV); env && *env) settings.log_path = std::filesystem::path(env);

  Logger log;
  log.set_level(settings.log_level);
  if (settings.log_path) {
    std::string m;
    if (!log.open(*settings.log_path, m)) fmt::print(stderr, "wrapview: {}\n", m);
  }
  for (const auto& d : diagnostics) log.warn("config: {}", d);

  TextBuffer buf;
  if (argc >= 2) {
    std::filesystem::path path(argv[1]);
    bool ok = true; std::string m;
    buf = TextBuffer::from_file(path, m, ok);
    if (ok) log.info("{} ({} lines)", m, buf.line_count());
    else log.warn("{}; starting with an empty buffer", m);
  }

  PosixTerminal io;
  SessionEnd end;
  std::string err;
  {
    Terminal term(io);
    Session session(std::move(buf), io, log);
    session.renderer().set_filler(settings.filler);
    end = session.run();
    err = session.error();
  }
  log.info("session ended: {}", session_end_name(end));
  if (end == SessionEnd::TerminalError) {
    fmt::print(stderr, "wrapview: {}\n", err);
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
