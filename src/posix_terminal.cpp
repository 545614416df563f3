#include "posix_terminal.hpp"
#include <cerrno>
#include <termios.h>

PosixTerminal::PosixTerminal(int in_fd, int out_fd) : in_fd_(in_fd), out_fd_(out_fd) {}

bool PosixTerminal::read_byte(unsigned char& out) {
  for (;;) {
    ssize_t n = ::read(in_fd_, &out, 1);
    if (n == 1) return true;
    if (n < 0 && errno == EINTR) continue;
    return false;
  }
}

bool PosixTerminal::write(std::string_view bytes) {
  const char* p = bytes.data();
  size_t remain = bytes.size();
  while (remain > 0) {
    ssize_t w = ::write(out_fd_, p, remain);
    if (w < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    p += w;
    remain -= static_cast<size_t>(w);
  }
  return true;
}

void PosixTerminal::flush() {
  if (::isatty(out_fd_)) ::tcdrain(out_fd_);
}
