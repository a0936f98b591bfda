#include "terminal.hpp"
#include <ncurses.h>
#include <locale.h>
#include <stdexcept>
#include <unistd.h>

Terminal::Terminal() {
  if (!::isatty(STDIN_FILENO)) throw std::runtime_error("stdin is not a terminal");
  setlocale(LC_ALL, "");
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) throw std::runtime_error("can not initialize terminal");
  set_term(screen_);
  if (raw() == ERR || noecho() == ERR) {
    endwin();
    delscreen(screen_);
    throw std::runtime_error("can not enter raw mode");
  }
  nonl();
  keypad(stdscr, FALSE);
  intrflush(stdscr, FALSE);
}

Terminal::~Terminal() {
  endwin();
  delscreen(screen_);
}
