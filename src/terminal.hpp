#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses tty mode setup/teardown.
 * Usage: construct in main before the session; destructor restores the
 *        original attributes and clears the screen on every exit path.
 * Note: manages terminal modes (raw/noecho), not rendering; output goes
 *       through an ITerminal as raw control sequences.
 */
class ITerminal;

class Terminal {
public:
  explicit Terminal(ITerminal& io);
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
private:
  ITerminal& io_;
};
