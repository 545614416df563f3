#include "session.hpp"
#include "iterminal.hpp"
#include "log.hpp"
#include "config.hpp"
#include "window_size.hpp"
#include <utility>

std::string_view session_end_name(SessionEnd e) {
  switch (e) {
    case SessionEnd::Interrupted: return "interrupted";
    case SessionEnd::EndOfInput: return "end of input";
    case SessionEnd::TerminalError: break;
  }
  return "terminal error";
}

Session::Session(TextBuffer buf, ITerminal& term, Logger& log)
  : buf_(std::move(buf)), model_(buf_), term_(term), log_(log) {}

bool Session::refresh() {
  WindowSize ws;
  std::string msg;
  if (!query_window_size(term_, ws, msg)) {
    error_ = msg;
    log_.error("window size query failed: {}", msg);
    return false;
  }
  if (model_.set_window_size(ws)) log_.info("window size {}x{}", ws.width, ws.height);
  const std::string& frame = renderer_.render(buf_, model_.viewport(), model_.cursor());
  if (!term_.write(frame)) {
    error_ = "write to terminal failed";
    log_.error("{} ({} bytes)", error_, frame.size());
    return false;
  }
  term_.flush();
  renderer_.clear();
  return true;
}

void Session::step(const KeyEvent& ev) {
  model_.apply(ev);
  const Cursor& c = model_.cursor();
  log_.debug("key {} -> line {} byte {} at {},{}{}", static_cast<int>(ev.key), c.line, c.byte,
             c.pos.row, c.pos.col, c.is_at_eol ? " eol" : "");
}

SessionEnd Session::run() {
  log_.info("session start: {} lines", buf_.line_count());
  for (;;) {
    if (!refresh()) return SessionEnd::TerminalError;
    KeyEvent ev;
    switch (decoder_.read_key(term_, ev)) {
      case InputDecoder::ReadResult::EndOfInput:
        return SessionEnd::EndOfInput;
      case InputDecoder::ReadResult::Unrecognized:
        log_.debug("dropped unrecognized escape sequence");
        continue;
      case InputDecoder::ReadResult::Key:
        break;
    }
    if (ev.key == Key::Char && ev.ch == WV_INTERRUPT_BYTE) return SessionEnd::Interrupted;
    step(ev);
  }
}
