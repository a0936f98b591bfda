#include "text_buffer.hpp"
#include <algorithm>
#include "config.hpp"

static inline bool is_control(unsigned char c) {
  return c < 0x20 || c == 0x7f;
}

int cx_to_rx(std::string_view chars, int cx) {
  int rx = 0;
  int n = std::min<int>(cx, static_cast<int>(chars.size()));
  for (int i = 0; i < n; ++i) {
    if (chars[i] == '\t') rx += (KILN_TAB_STOP - 1) - (rx % KILN_TAB_STOP);
    rx++;
  }
  return rx;
}

int rx_to_cx(std::string_view chars, int rx) {
  int cur_rx = 0;
  int cx = 0;
  for (; cx < static_cast<int>(chars.size()); ++cx) {
    if (chars[cx] == '\t') cur_rx += (KILN_TAB_STOP - 1) - (cur_rx % KILN_TAB_STOP);
    cur_rx++;
    if (cur_rx > rx) return cx;
  }
  return cx;
}

std::string render_row(std::string_view chars) {
  std::string out;
  out.reserve(chars.size());
  for (char ch : chars) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (ch == '\t') {
      out.push_back(' ');
      while (out.size() % KILN_TAB_STOP != 0) out.push_back(' ');
    } else if (is_control(c)) {
      out.push_back('?');
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

TextBuffer::TextBuffer() {}

bool TextBuffer::empty() const { return rows_.empty(); }
int TextBuffer::line_count() const { return static_cast<int>(rows_.size()); }

const std::string& TextBuffer::line(int r) const {
  static const std::string none;
  if (!valid_row(r)) return none;
  return rows_[r].chars;
}

const std::string& TextBuffer::render(int r) const {
  static const std::string none;
  if (!valid_row(r)) return none;
  return rows_[r].render;
}

int TextBuffer::line_size(int r) const { return static_cast<int>(line(r).size()); }

void TextBuffer::ensure_not_empty() {
  if (rows_.empty()) rows_.emplace_back();
}

void TextBuffer::update_row(Row& r) {
  r.render = render_row(r.chars);
}

void TextBuffer::init_from_lines(const std::vector<std::string>& src) {
  rows_.clear();
  rows_.reserve(src.size());
  for (const auto& s : src) {
    Row r;
    r.chars = s;
    update_row(r);
    rows_.push_back(std::move(r));
  }
  ensure_not_empty();
}

void TextBuffer::init_from_lines(std::vector<std::string>&& src) {
  rows_.clear();
  rows_.reserve(src.size());
  for (auto& s : src) {
    Row r;
    r.chars = std::move(s);
    update_row(r);
    rows_.push_back(std::move(r));
  }
  src.clear();
  ensure_not_empty();
}

std::vector<std::string> TextBuffer::lines() const {
  std::vector<std::string> out;
  out.reserve(rows_.size());
  for (const auto& r : rows_) out.push_back(r.chars);
  return out;
}

void TextBuffer::insert_line(int row, std::string_view s) {
  if (row < 0 || row > line_count()) return;
  Row r;
  r.chars = std::string(s);
  update_row(r);
  rows_.insert(rows_.begin() + row, std::move(r));
}

void TextBuffer::erase_line(int row) {
  if (!valid_row(row)) return;
  rows_.erase(rows_.begin() + row);
  ensure_not_empty();
}

void TextBuffer::replace_line(int row, std::string_view s) {
  if (!valid_row(row)) return;
  rows_[row].chars = std::string(s);
  update_row(rows_[row]);
}

void TextBuffer::split_line(int row, int col) {
  if (!valid_row(row)) return;
  Row& r = rows_[row];
  if (col < 0 || col > static_cast<int>(r.chars.size())) return;
  std::string tail = r.chars.substr(static_cast<size_t>(col));
  r.chars.erase(static_cast<size_t>(col));
  update_row(r);
  insert_line(row + 1, tail);
}

void TextBuffer::join_with_next(int row) {
  if (!valid_row(row) || !valid_row(row + 1)) return;
  rows_[row].chars += rows_[row + 1].chars;
  update_row(rows_[row]);
  rows_.erase(rows_.begin() + row + 1);
}

void TextBuffer::insert_char(int row, int col, char c) {
  if (!valid_row(row)) return;
  Row& r = rows_[row];
  if (col < 0 || col > static_cast<int>(r.chars.size())) return;
  r.chars.insert(r.chars.begin() + col, c);
  update_row(r);
}

void TextBuffer::delete_char(int row, int col) {
  if (!valid_row(row)) return;
  Row& r = rows_[row];
  if (col < 0 || col >= static_cast<int>(r.chars.size())) return;
  r.chars.erase(r.chars.begin() + col);
  update_row(r);
}

void TextBuffer::append_string(int row, std::string_view s) {
  if (!valid_row(row)) return;
  rows_[row].chars.append(s);
  update_row(rows_[row]);
}
