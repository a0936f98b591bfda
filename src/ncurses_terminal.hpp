#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and byte input.
 * Note: initialization/teardown is managed by Terminal RAII wrapper. curses
 * stays out of this header; its clear()/refresh()/move() macros would eat the
 * ITerminal method names.
 */
#include "iterminal.hpp"

class NcursesTerminal : public ITerminal {
public:
  TermSize get_size() const override;
  std::string read_available() override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
};
