#include "session.hpp"
#include "headless_terminal.hpp"
#include "log.hpp"
#include <cassert>
#include <string>

static const std::string kReply = "\x1b[24;80R";
static const std::string kProbe = "\x1b[999C\x1b[999B\x1b[6n";
static const std::string kDown = "\x1b[B";

static size_t count(const std::string& hay, const std::string& needle) {
  size_t n = 0;
  for (size_t p = hay.find(needle); p != std::string::npos; p = hay.find(needle, p + 1)) n++;
  return n;
}

static void test_interrupt_ends_session() {
  Logger log;
  HeadlessTerminal t(kReply + kDown + kReply + "\x03" + kReply);
  Session s(TextBuffer({"one", "two", "three"}), t, log);
  assert(s.run() == SessionEnd::Interrupted);
  assert(s.model().cursor().line == 1);
  assert(s.model().cursor().pos.row == 1);
  // two refresh cycles, each a probe followed by one frame
  assert(count(t.output(), kProbe) == 2);
  assert(count(t.output(), "\x1b[?25l") == 2);
  assert(t.unread() == kReply.size());
  const std::string& out = t.output();
  assert(out.compare(out.size() - 12, 12, "\x1b[2;1H\x1b[?25h") == 0);
  assert(s.error().empty());
}

static void test_end_of_input() {
  Logger log;
  HeadlessTerminal t(kReply);
  Session s(TextBuffer(), t, log);
  assert(s.run() == SessionEnd::EndOfInput);

  HeadlessTerminal cut(kReply + "\x1b[");
  Session s2(TextBuffer(), cut, log);
  assert(s2.run() == SessionEnd::EndOfInput);
}

static void test_query_failure() {
  Logger log;
  HeadlessTerminal t;
  Session s(TextBuffer({"x"}), t, log);
  assert(s.run() == SessionEnd::TerminalError);
  assert(!s.error().empty());

  HeadlessTerminal mute(kReply);
  mute.set_fail_writes(true);
  Session s2(TextBuffer({"x"}), mute, log);
  assert(s2.run() == SessionEnd::TerminalError);
}

static void test_wrapped_scenario() {
  Logger log;
  std::string input = kReply;
  for (int i = 0; i < 3; ++i) input += kDown + kReply;
  input += "\x03";
  HeadlessTerminal t(input);
  Session s(TextBuffer({"hello", "", std::string(100, 'a')}), t, log);
  assert(s.run() == SessionEnd::Interrupted);
  const Cursor& c = s.model().cursor();
  assert(c.line == 2 && c.pos.row == 3 && c.pos.col == 0 && c.byte == 80);
  const std::string& out = t.output();
  assert(out.compare(out.size() - 12, 12, "\x1b[4;1H\x1b[?25h") == 0);
  // probe flush plus frame flush per refresh
  assert(t.flushes().size() == 8);
}

static void test_unrecognized_and_plain_keys_are_ignored() {
  Logger log;
  HeadlessTerminal t(kReply + "\x1b[Z" + kReply + "q" + kReply + "\x1b[3~" + kReply + "\x03");
  Session s(TextBuffer({"a", "b"}), t, log);
  assert(s.run() == SessionEnd::Interrupted);
  assert(s.model().cursor().line == 0);
  assert(count(t.output(), kProbe) == 4);
}

static void test_resize_between_refreshes() {
  Logger log;
  HeadlessTerminal t(kReply + kDown + "\x1b[24;50R" + "\x03");
  Session s(TextBuffer({std::string(120, 'a')}), t, log);
  assert(s.run() == SessionEnd::Interrupted);
  const Viewport& vp = s.model().viewport();
  assert(vp.window_width == 50 && vp.window_height == 24);
  const Cursor& c = s.model().cursor();
  assert(c.byte == 80 && c.pos.row == 1 && c.pos.col == 30);
}

static void test_step() {
  Logger log;
  HeadlessTerminal t(kReply);
  Session s(TextBuffer({"a", "b", "c"}), t, log);
  assert(s.refresh());
  s.step(KeyEvent{Key::End, 0});
  assert(s.model().cursor().line == 2);
  s.step(KeyEvent{Key::PageUp, 0});
  assert(s.model().cursor().line == 0);
  assert(s.renderer().frame().empty());
}

int main() {
  test_interrupt_ends_session();
  test_end_of_input();
  test_query_failure();
  test_wrapped_scenario();
  test_unrecognized_and_plain_keys_are_ignored();
  test_resize_between_refreshes();
  test_step();
  return 0;
}
