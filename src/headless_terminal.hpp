#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render checks.
 * Input: scripted chunks returned one per read_available(); a resize chunk
 * changes the reported size and wakes the reader with no bytes.
 * Output: a rows x cols character grid plus a highlight mask and the cursor
 * cell, as they stood at the last refresh().
 */
#include "iterminal.hpp"
#include <deque>
#include <string>
#include <vector>

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  void feed(const std::string& bytes);
  void feed_resize(int rows, int cols);
  bool input_empty() const { return input_.empty(); }

  TermSize get_size() const override;
  std::string read_available() override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;

  // last presented frame
  std::string row_text(int row) const;
  bool highlighted(int row, int col) const;
  int cursor_row() const { return shown_cur_row_; }
  int cursor_col() const { return shown_cur_col_; }
  int frame_count() const { return frames_; }

private:
  struct Chunk { std::string bytes; bool resize = false; TermSize size{}; };
  void put(int row, int col, const std::string& text, int hl_start, int hl_len);
  void reset_grid();

  TermSize size_;
  std::deque<Chunk> input_;
  std::vector<std::string> grid_;
  std::vector<std::string> hl_;
  std::vector<std::string> shown_grid_;
  std::vector<std::string> shown_hl_;
  int cur_row_ = 0, cur_col_ = 0;
  int shown_cur_row_ = 0, shown_cur_col_ = 0;
  int frames_ = 0;
};
