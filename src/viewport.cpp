#include "viewport.hpp"
#include <algorithm>

void set_screen_size(EditorState& st, TermSize sz) {
  st.screen_rows = std::max(1, sz.rows - 2);
  st.screen_cols = std::max(1, sz.cols);
}

void clamp_cursor(EditorState& st) {
  st.buf.ensure_not_empty();
  int n = st.buf.line_count();
  st.cur.row = std::clamp(st.cur.row, 0, n - 1);
  st.cur.col = std::clamp(st.cur.col, 0, st.buf.line_size(st.cur.row));
}

bool is_navigation_key(KeyCode key) {
  switch (key) {
    case KeyCode::Up: case KeyCode::Down: case KeyCode::Left: case KeyCode::Right:
    case KeyCode::Home: case KeyCode::End: case KeyCode::PageUp: case KeyCode::PageDown:
      return true;
    default:
      return false;
  }
}

void move_cursor(EditorState& st, KeyCode key) {
  clamp_cursor(st);
  Cursor& cur = st.cur;
  int last = st.buf.line_count() - 1;
  switch (key) {
    case KeyCode::Left:
      if (cur.col > 0) cur.col--;
      else if (cur.row > 0) { cur.row--; cur.col = st.buf.line_size(cur.row); }
      break;
    case KeyCode::Right:
      if (cur.col < st.buf.line_size(cur.row)) cur.col++;
      else if (cur.row < last) { cur.row++; cur.col = 0; }
      break;
    case KeyCode::Up:
      if (cur.row > 0) cur.row--;
      break;
    case KeyCode::Down:
      if (cur.row < last) cur.row++;
      break;
    case KeyCode::Home:
      cur.col = 0;
      break;
    case KeyCode::End:
      cur.col = st.buf.line_size(cur.row);
      break;
    case KeyCode::PageUp:
      cur.row = std::max(0, cur.row - st.screen_rows);
      break;
    case KeyCode::PageDown:
      cur.row = std::min(last, cur.row + st.screen_rows);
      break;
    default:
      break;
  }
  clamp_cursor(st);
  scroll(st);
}

void scroll(EditorState& st) {
  clamp_cursor(st);
  Cursor& cur = st.cur;
  Viewport& vp = st.vp;
  cur.rx = cx_to_rx(st.buf.line(cur.row), cur.col);
  if (cur.row < vp.top_line) vp.top_line = cur.row;
  if (cur.row >= vp.top_line + st.screen_rows) vp.top_line = cur.row - st.screen_rows + 1;
  if (cur.rx < vp.left_col) vp.left_col = cur.rx;
  if (cur.rx >= vp.left_col + st.screen_cols) vp.left_col = cur.rx - st.screen_cols + 1;
  if (vp.top_line < 0) vp.top_line = 0;
  if (vp.left_col < 0) vp.left_col = 0;
}

void center_on_row(EditorState& st, int row) {
  int max_top = std::max(0, st.buf.line_count() - st.screen_rows);
  st.vp.top_line = std::clamp(row - st.screen_rows / 2, 0, max_top);
  scroll(st);
}
