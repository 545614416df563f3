#pragma once
/*
 * PosixTerminal
 *
 * Purpose: ITerminal over raw file descriptors (stdin/stdout by default).
 * Note: tty mode is owned by the Terminal RAII wrapper, not by this class.
 */
#include "iterminal.hpp"
#include <unistd.h>

class PosixTerminal : public ITerminal {
public:
  explicit PosixTerminal(int in_fd = STDIN_FILENO, int out_fd = STDOUT_FILENO);
  bool read_byte(unsigned char& out) override;
  bool write(std::string_view bytes) override;
  void flush() override;
private:
  int in_fd_;
  int out_fd_;
};
