#pragma once
/*
 * ITerminal
 *
 * Purpose: terminal I/O port (size, raw byte input, frame drawing).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 * Input: read_available() is the only call that may block. It returns at
 * least one byte, or an empty string when woken by a resize.
 */
#include <string>

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual std::string read_available() = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
};
