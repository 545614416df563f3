#include "input.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <string>
#include <vector>

struct Decoded {
  std::vector<KeyEvent> keys;
  int dropped = 0;
};

static Decoded decode_all(const std::string& bytes) {
  InputDecoder d;
  Decoded r;
  for (unsigned char b : bytes) {
    KeyEvent ev;
    switch (d.feed(b, ev)) {
      case InputDecoder::Status::Key: r.keys.push_back(ev); break;
      case InputDecoder::Status::Dropped: r.dropped++; break;
      case InputDecoder::Status::Pending: break;
    }
  }
  assert(d.idle());
  return r;
}

static Key single_key(const std::string& bytes) {
  Decoded r = decode_all(bytes);
  assert(r.keys.size() == 1);
  assert(r.dropped == 0);
  return r.keys[0].key;
}

static void test_plain_bytes() {
  Decoded r = decode_all("ab\x03");
  assert(r.keys.size() == 3);
  assert(r.keys[0].key == Key::Char && r.keys[0].ch == 'a');
  assert(r.keys[1].key == Key::Char && r.keys[1].ch == 'b');
  assert(r.keys[2].key == Key::Char && r.keys[2].ch == 0x03);
  // digits, '[' and '~' are plain outside a sequence
  Decoded d = decode_all("[5~O");
  assert(d.keys.size() == 4);
  for (const auto& k : d.keys) assert(k.key == Key::Char);
}

static void test_csi_letters() {
  assert(single_key("\x1b[A") == Key::ArrowUp);
  assert(single_key("\x1b[B") == Key::ArrowDown);
  assert(single_key("\x1b[C") == Key::ArrowRight);
  assert(single_key("\x1b[D") == Key::ArrowLeft);
  assert(single_key("\x1b[H") == Key::Home);
  assert(single_key("\x1b[F") == Key::End);
}

static void test_csi_tilde() {
  assert(single_key("\x1b[1~") == Key::Home);
  assert(single_key("\x1b[7~") == Key::Home);
  assert(single_key("\x1b[4~") == Key::End);
  assert(single_key("\x1b[8~") == Key::End);
  assert(single_key("\x1b[3~") == Key::Delete);
  assert(single_key("\x1b[5~") == Key::PageUp);
  assert(single_key("\x1b[6~") == Key::PageDown);
}

static void test_ss3() {
  assert(single_key("\x1bOH") == Key::Home);
  assert(single_key("\x1bOF") == Key::End);
  Decoded r = decode_all("\x1bOA");
  assert(r.keys.empty() && r.dropped == 1);
}

static void test_unrecognized() {
  Decoded z = decode_all("\x1b[Z");
  assert(z.keys.empty() && z.dropped == 1);
  // unknown digit: the '~' is still consumed
  Decoded two = decode_all("\x1b[2~x");
  assert(two.dropped == 1);
  assert(two.keys.size() == 1 && two.keys[0].ch == 'x');
  // digit not followed by '~': the third byte belongs to the sequence
  Decoded bad = decode_all("\x1b[5xq");
  assert(bad.dropped == 1);
  assert(bad.keys.size() == 1 && bad.keys[0].ch == 'q');
  // unknown introducer: exactly two bytes follow ESC
  Decoded intro = decode_all("\x1bxyq");
  assert(intro.dropped == 1);
  assert(intro.keys.size() == 1 && intro.keys[0].ch == 'q');
  // a second ESC is just b1 of the first sequence
  Decoded esc = decode_all("\x1b\x1b[A");
  assert(esc.dropped == 1);
  assert(esc.keys.size() == 1 && esc.keys[0].key == Key::Char && esc.keys[0].ch == 'A');
}

static void test_read_key() {
  HeadlessTerminal t(std::string("\x1b[Z\x1b[5~z"));
  InputDecoder d;
  KeyEvent ev;
  assert(d.read_key(t, ev) == InputDecoder::ReadResult::Unrecognized);
  assert(d.read_key(t, ev) == InputDecoder::ReadResult::Key);
  assert(ev.key == Key::PageUp);
  assert(d.read_key(t, ev) == InputDecoder::ReadResult::Key);
  assert(ev.key == Key::Char && ev.ch == 'z');
  assert(d.read_key(t, ev) == InputDecoder::ReadResult::EndOfInput);
}

static void test_short_read() {
  HeadlessTerminal t(std::string("\x1b["));
  InputDecoder d;
  KeyEvent ev;
  assert(d.read_key(t, ev) == InputDecoder::ReadResult::EndOfInput);
  assert(d.idle());
  HeadlessTerminal t2(std::string("\x1b[6"));
  assert(d.read_key(t2, ev) == InputDecoder::ReadResult::EndOfInput);
  assert(d.idle());
}

int main() {
  test_plain_bytes();
  test_csi_letters();
  test_csi_tilde();
  test_ss3();
  test_unrecognized();
  test_read_key();
  test_short_read();
  return 0;
}
