#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main before the editor; destructor restores the tty,
 * including when an exception unwinds out of the main loop.
 * Note: raw/noecho/nonl with keypad off, so escape sequences reach the
 * input decoder as plain bytes. Throws std::runtime_error when stdin is not
 * a tty or the curses screen can not be created.
 */
struct screen;

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
private:
  screen* screen_ = nullptr;
};
