#include "headless_terminal.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : size_{rows, cols} {
  reset_grid();
  shown_grid_ = grid_;
  shown_hl_ = hl_;
}

void HeadlessTerminal::reset_grid() {
  grid_.assign(static_cast<size_t>(std::max(0, size_.rows)), std::string(static_cast<size_t>(std::max(0, size_.cols)), ' '));
  hl_.assign(grid_.size(), std::string(static_cast<size_t>(std::max(0, size_.cols)), '.'));
}

void HeadlessTerminal::feed(const std::string& bytes) {
  input_.push_back(Chunk{bytes, false, {}});
}

void HeadlessTerminal::feed_resize(int rows, int cols) {
  input_.push_back(Chunk{std::string(), true, TermSize{rows, cols}});
}

TermSize HeadlessTerminal::get_size() const { return size_; }

std::string HeadlessTerminal::read_available() {
  // a real terminal would block forever here; a test that runs dry is broken
  if (input_.empty()) throw std::runtime_error("headless terminal: input exhausted");
  Chunk c = std::move(input_.front());
  input_.pop_front();
  if (c.resize) {
    size_ = c.size;
    reset_grid();
    return std::string();
  }
  return c.bytes;
}

void HeadlessTerminal::clear() { reset_grid(); }

void HeadlessTerminal::put(int row, int col, const std::string& text, int hl_start, int hl_len) {
  if (row < 0 || row >= size_.rows) return;
  for (int i = 0; i < (int)text.size(); ++i) {
    int c = col + i;
    if (c < 0) continue;
    if (c >= size_.cols) break;
    grid_[row][c] = text[i];
    hl_[row][c] = (i >= hl_start && i < hl_start + hl_len) ? '#' : '.';
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  put(row, col, text, 0, 0);
}

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  put(row, col, text, std::max(0, hl_start), std::max(0, hl_len));
}

void HeadlessTerminal::move_cursor(int row, int col) {
  cur_row_ = row;
  cur_col_ = col;
}

void HeadlessTerminal::refresh() {
  shown_grid_ = grid_;
  shown_hl_ = hl_;
  shown_cur_row_ = cur_row_;
  shown_cur_col_ = cur_col_;
  frames_++;
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= size_.rows) return;
  for (int c = std::max(0, col); c < size_.cols; ++c) {
    grid_[row][c] = ' ';
    hl_[row][c] = '.';
  }
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= (int)shown_grid_.size()) return std::string();
  std::string s = shown_grid_[row];
  while (!s.empty() && s.back() == ' ') s.pop_back();
  return s;
}

bool HeadlessTerminal::highlighted(int row, int col) const {
  if (row < 0 || row >= (int)shown_hl_.size()) return false;
  if (col < 0 || col >= (int)shown_hl_[row].size()) return false;
  return shown_hl_[row][col] == '#';
}
