#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract byte-level terminal backend (blocking read, verbatim write).
 * Goal: decouple from concrete impls (posix fds/headless), enable testing.
 */
#include <string_view>

class ITerminal {
public:
  virtual ~ITerminal() = default;
  // false on end of input or read error
  virtual bool read_byte(unsigned char& out) = 0;
  virtual bool write(std::string_view bytes) = 0;
  virtual void flush() = 0;
};
