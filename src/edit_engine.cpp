#include "edit_engine.hpp"
#include "viewport.hpp"

void insert_char(EditorState& st, char c) {
  clamp_cursor(st);
  st.buf.insert_char(st.cur.row, st.cur.col, c);
  st.cur.col++;
  st.modified = true;
  scroll(st);
}

void insert_newline(EditorState& st) {
  clamp_cursor(st);
  st.buf.split_line(st.cur.row, st.cur.col);
  st.cur.row++;
  st.cur.col = 0;
  st.modified = true;
  scroll(st);
}

void backspace(EditorState& st) {
  clamp_cursor(st);
  Cursor& cur = st.cur;
  if (cur.col > 0) {
    st.buf.delete_char(cur.row, cur.col - 1);
    cur.col--;
  } else if (cur.row > 0) {
    int prev_len = st.buf.line_size(cur.row - 1);
    st.buf.join_with_next(cur.row - 1);
    cur.row--;
    cur.col = prev_len;
  } else {
    return;
  }
  st.modified = true;
  scroll(st);
}

void delete_forward(EditorState& st) {
  clamp_cursor(st);
  const Cursor& cur = st.cur;
  if (cur.col < st.buf.line_size(cur.row)) {
    st.buf.delete_char(cur.row, cur.col);
  } else if (cur.row + 1 < st.buf.line_count()) {
    st.buf.join_with_next(cur.row);
  } else {
    return;
  }
  st.modified = true;
  scroll(st);
}
