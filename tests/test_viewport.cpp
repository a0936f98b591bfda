#include "viewport.hpp"
#include "config.hpp"
#include <cassert>
#include <random>
#include <string>
#include <vector>

static EditorState make_state(const std::vector<std::string>& lines, int rows = 10, int cols = 20) {
  EditorState st;
  st.buf.init_from_lines(lines);
  set_screen_size(st, TermSize{rows + 2, cols});
  scroll(st);
  return st;
}

static void check_invariants(const EditorState& st) {
  assert(st.cur.row >= 0 && st.cur.row < st.buf.line_count());
  assert(st.cur.col >= 0 && st.cur.col <= st.buf.line_size(st.cur.row));
  assert(st.cur.rx == cx_to_rx(st.buf.line(st.cur.row), st.cur.col));
  assert(st.cur.row >= st.vp.top_line && st.cur.row < st.vp.top_line + st.screen_rows);
  assert(st.cur.rx >= st.vp.left_col && st.cur.rx < st.vp.left_col + st.screen_cols);
}

static void test_screen_size_excludes_bars() {
  EditorState st;
  set_screen_size(st, TermSize{24, 80});
  assert(st.screen_rows == 22);
  assert(st.screen_cols == 80);
  set_screen_size(st, TermSize{2, 5});
  assert(st.screen_rows == 1);
}

static void test_horizontal_wraps_across_rows() {
  EditorState st = make_state({"ab", "cd"});
  move_cursor(st, KeyCode::End);
  assert(st.cur.col == 2);
  move_cursor(st, KeyCode::Right);
  assert(st.cur.row == 1 && st.cur.col == 0);
  move_cursor(st, KeyCode::Left);
  assert(st.cur.row == 0 && st.cur.col == 2);
  move_cursor(st, KeyCode::Home);
  move_cursor(st, KeyCode::Left);
  assert(st.cur.row == 0 && st.cur.col == 0);
  // end of the last row stays put
  st.cur = Cursor{1, 2, 0};
  move_cursor(st, KeyCode::Right);
  assert(st.cur.row == 1 && st.cur.col == 2);
}

static void test_vertical_clamps_column() {
  EditorState st = make_state({"long line here", "ab", "x"});
  move_cursor(st, KeyCode::End);
  move_cursor(st, KeyCode::Down);
  assert(st.cur.row == 1 && st.cur.col == 2);
  move_cursor(st, KeyCode::Down);
  assert(st.cur.row == 2 && st.cur.col == 1);
  move_cursor(st, KeyCode::Down);
  assert(st.cur.row == 2);
  move_cursor(st, KeyCode::Up);
  move_cursor(st, KeyCode::Up);
  move_cursor(st, KeyCode::Up);
  assert(st.cur.row == 0 && st.cur.col == 1);
}

static void test_page_moves_and_scrolls() {
  std::vector<std::string> lines;
  for (int i = 0; i < 50; ++i) lines.push_back("line " + std::to_string(i));
  EditorState st = make_state(lines, 10, 20);
  move_cursor(st, KeyCode::PageDown);
  assert(st.cur.row == 10);
  assert(st.vp.top_line == 1);
  check_invariants(st);
  for (int i = 0; i < 10; ++i) move_cursor(st, KeyCode::PageDown);
  assert(st.cur.row == 49);
  assert(st.vp.top_line == 40);
  move_cursor(st, KeyCode::PageUp);
  assert(st.cur.row == 39);
  assert(st.vp.top_line == 39);
}

static void test_tab_render_column_drives_horizontal_scroll() {
  EditorState st = make_state({"\t\t\tend"}, 5, 10);
  move_cursor(st, KeyCode::End);
  assert(st.cur.col == 6);
  assert(st.cur.rx == 3 * KILN_TAB_STOP + 3);
  check_invariants(st);
  move_cursor(st, KeyCode::Home);
  assert(st.vp.left_col == 0);
}

static void test_center_on_row() {
  std::vector<std::string> lines(100, "x");
  EditorState st = make_state(lines, 10, 20);
  st.cur.row = 50;
  center_on_row(st, 50);
  assert(st.vp.top_line == 45);
  check_invariants(st);
  st.cur.row = 98;
  center_on_row(st, 98);
  assert(st.vp.top_line == 90);
  check_invariants(st);
}

static void test_random_walk_keeps_invariants() {
  std::vector<std::string> lines;
  std::mt19937 rng(7);
  for (int i = 0; i < 40; ++i) {
    std::string s;
    int n = (int)(rng() % 60);
    for (int j = 0; j < n; ++j) s.push_back((rng() % 7 == 0) ? '\t' : char('a' + rng() % 26));
    lines.push_back(s);
  }
  EditorState st = make_state(lines, 8, 16);
  const KeyCode keys[] = {KeyCode::Up, KeyCode::Down, KeyCode::Left, KeyCode::Right,
                          KeyCode::Home, KeyCode::End, KeyCode::PageUp, KeyCode::PageDown};
  for (int i = 0; i < 2000; ++i) {
    move_cursor(st, keys[rng() % 8]);
    check_invariants(st);
  }
}

int main() {
  test_screen_size_excludes_bars();
  test_horizontal_wraps_across_rows();
  test_vertical_clamps_column();
  test_page_moves_and_scrolls();
  test_tab_render_column_drives_horizontal_scroll();
  test_center_on_row();
  test_random_walk_keeps_invariants();
  return 0;
}
