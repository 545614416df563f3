#include "window_size.hpp"
#include "iterminal.hpp"
#include "config.hpp"
#include <fmt/format.h>

static constexpr std::string_view kProbe = "\x1b[999C\x1b[999B\x1b[6n";
static constexpr int kMaxCoordDigits = 5;

static bool parse_number(std::string_view s, size_t& i, int& out) {
  size_t begin = i;
  int v = 0;
  while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
    if (i - begin >= kMaxCoordDigits) return false;
    v = v * 10 + (s[i] - '0');
    i++;
  }
  if (i == begin) return false;
  out = v;
  return true;
}

std::optional<Position> parse_cursor_report(std::string_view reply) {
  size_t esc = reply.rfind(static_cast<char>(WV_ESC_BYTE));
  if (esc == std::string_view::npos) return std::nullopt;
  size_t i = esc + 1;
  if (i >= reply.size() || reply[i] != '[') return std::nullopt;
  i++;
  int row = 0, col = 0;
  if (!parse_number(reply, i, row)) return std::nullopt;
  if (i >= reply.size() || reply[i] != ';') return std::nullopt;
  i++;
  if (!parse_number(reply, i, col)) return std::nullopt;
  if (i + 1 != reply.size() || reply[i] != 'R') return std::nullopt;
  if (row < 1 || col < 1) return std::nullopt;
  return Position{col - 1, row - 1};
}

bool query_window_size(ITerminal& term, WindowSize& out, std::string& msg) {
  if (!term.write(kProbe)) { msg = "can not write cursor position request"; return false; }
  term.flush();
  std::string reply;
  unsigned char b = 0;
  // typed-ahead input may precede the report; only bytes from the last ESC count
  for (;;) {
    if (!term.read_byte(b)) { msg = "input closed while waiting for cursor position report"; return false; }
    if (b == WV_ESC_BYTE) reply.clear();
    else if (reply.empty()) continue;
    reply.push_back(static_cast<char>(b));
    if (b == 'R') break;
    if (reply.size() >= WV_CURSOR_REPORT_MAX) {
      msg = fmt::format("cursor position report exceeds {} bytes", WV_CURSOR_REPORT_MAX);
      return false;
    }
  }
  std::optional<Position> p = parse_cursor_report(reply);
  if (!p) { msg = fmt::format("malformed cursor position report ({} bytes)", reply.size()); return false; }
  out = WindowSize{p->col + 1, p->row + 1};
  return true;
}
