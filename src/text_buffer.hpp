#pragma once
/*
 * TextBuffer
 *
 * Purpose: the row store. Ordered rows of raw bytes, each with its rendered
 * (tab-expanded) form kept next to it.
 * Invariant: every mutating call refreshes the render of the rows it touched
 * before returning, so render(r) is never stale.
 * Contract: row/col arguments must already be in range; the edit engine and
 * the cursor controller clamp before calling. Out-of-range calls are ignored.
 */
#include <string>
#include <string_view>
#include <vector>

struct Row {
  std::string chars;
  std::string render;
};

// column of raw index cx inside the rendered form of chars
int cx_to_rx(std::string_view chars, int cx);
// inverse of cx_to_rx: raw index whose rendered span covers rx
int rx_to_cx(std::string_view chars, int rx);
std::string render_row(std::string_view chars);

class TextBuffer {
public:
  TextBuffer();

  bool empty() const;
  int line_count() const;
  const std::string& line(int r) const;
  const std::string& render(int r) const;
  int line_size(int r) const;
  void ensure_not_empty();

  void init_from_lines(const std::vector<std::string>& lines);
  void init_from_lines(std::vector<std::string>&& lines);
  std::vector<std::string> lines() const;

  void insert_line(int row, std::string_view s);
  void erase_line(int row);
  void replace_line(int row, std::string_view s);

  // row becomes chars[0, col); chars[col, end) is inserted as row + 1
  void split_line(int row, int col);
  // appends row + 1 onto row and erases row + 1
  void join_with_next(int row);

  void insert_char(int row, int col, char c);
  void delete_char(int row, int col);
  void append_string(int row, std::string_view s);

private:
  void update_row(Row& r);
  bool valid_row(int row) const { return row >= 0 && row < static_cast<int>(rows_.size()); }

  std::vector<Row> rows_;
};
