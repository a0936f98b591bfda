#include "ncurses_terminal.hpp"
#include <ncurses.h>
#include <algorithm>
#include "config.hpp"

static constexpr int ESC = 27;

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

std::string NcursesTerminal::read_available() {
  std::string out;
  int ch = ERR;
  wtimeout(stdscr, -1);
  do { ch = wgetch(stdscr); } while (ch == ERR);
  if (ch == KEY_RESIZE) return out;
  out.push_back(static_cast<char>(ch));
  // a lone ESC may be the head of a sequence still in flight; anything else
  // only drains bytes that are already buffered
  wtimeout(stdscr, ch == ESC ? KILN_ESC_DELAY_MS : 0);
  while ((ch = wgetch(stdscr)) != ERR) {
    if (ch == KEY_RESIZE) { ungetch(KEY_RESIZE); break; }
    out.push_back(static_cast<char>(ch));
    wtimeout(stdscr, 0);
  }
  wtimeout(stdscr, -1);
  return out;
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = (int)text.size();
  if (hl_start < 0) hl_start = 0;
  if (hl_len < 0) hl_len = 0;
  hl_start = std::min(hl_start, len);
  int hl_end = std::min(len, hl_start + hl_len);
  if (hl_start > 0) {
    mvaddnstr(row, col, text.c_str(), hl_start);
  }
  if (hl_end > hl_start) {
    attron(A_REVERSE);
    mvaddnstr(row, col + hl_start, text.c_str() + hl_start, hl_end - hl_start);
    attroff(A_REVERSE);
  }
  if (hl_end < len) {
    mvaddnstr(row, col + hl_end, text.c_str() + hl_end, len - hl_end);
  }
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}
