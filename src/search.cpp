#include "search.hpp"
#include <vector>
#include "viewport.hpp"

// Knuth-Morris-Pratt over one row. border[i] is the length of the longest
// proper prefix of query[0..i] that is also a suffix of it.
static std::vector<size_t> border_table(const std::string& query) {
  std::vector<size_t> border(query.size(), 0);
  size_t k = 0;
  for (size_t i = 1; i < query.size(); ++i) {
    while (k > 0 && query[i] != query[k]) k = border[k - 1];
    if (query[i] == query[k]) ++k;
    border[i] = k;
  }
  return border;
}

// Calls on_hit(col) for each match starting at or after `from`, overlapping
// matches included. Stops early when on_hit returns false.
template <typename OnHit>
static void scan_row(const std::string& row, const std::string& query, size_t from, OnHit on_hit) {
  if (query.empty() || from >= row.size()) return;
  const std::vector<size_t> border = border_table(query);
  size_t k = 0;
  for (size_t i = from; i < row.size(); ++i) {
    while (k > 0 && row[i] != query[k]) k = border[k - 1];
    if (row[i] == query[k]) ++k;
    if (k < query.size()) continue;
    if (!on_hit(static_cast<int>(i + 1 - query.size()))) return;
    k = border[k - 1];
  }
}

int find_first_in_row(const std::string& row, const std::string& query, size_t from) {
  int col = -1;
  scan_row(row, query, from, [&](int c) { col = c; return false; });
  return col;
}

int find_last_in_row(const std::string& row, const std::string& query) {
  int col = -1;
  scan_row(row, query, 0, [&](int c) { col = c; return true; });
  return col;
}

std::string search_prompt(const SearchState& s, bool found) {
  if (!found && !s.query.empty()) return "Search: " + s.query + " (not found)";
  return "Search: " + s.query + " (Use ESC/Arrows/Enter)";
}

void search_begin(EditorState& st) {
  scroll(st);
  SearchState s;
  s.saved_cur = st.cur;
  s.saved_vp = st.vp;
  st.search = s;
  set_status(st, search_prompt(*st.search, true));
}

static void restore_snapshot(EditorState& st) {
  st.cur = st.search->saved_cur;
  st.vp = st.search->saved_vp;
}

bool search_step(EditorState& st) {
  SearchState& s = *st.search;
  if (s.query.empty()) {
    restore_snapshot(st);
    s.last_match = -1;
    s.match_col = -1;
    return false;
  }
  int n = st.buf.line_count();
  int dir = s.direction == SearchDirection::Forward ? 1 : -1;
  // after an edit the start row itself is the first candidate
  int current = s.last_match >= 0 ? s.last_match : s.saved_cur.row - dir;
  for (int i = 0; i < n; ++i) {
    current += dir;
    if (current < 0) current = n - 1;
    else if (current >= n) current = 0;
    const std::string& line = st.buf.line(current);
    int pos = dir > 0 ? find_first_in_row(line, s.query, 0) : find_last_in_row(line, s.query);
    if (pos < 0) continue;
    s.last_match = current;
    s.match_col = pos;
    st.cur.row = current;
    st.cur.col = pos;
    center_on_row(st, current);
    return true;
  }
  return false;
}

SearchOutcome search_handle_key(EditorState& st, const Key& key) {
  if (!st.search) return SearchOutcome::Confirmed;
  SearchState& s = *st.search;
  switch (key.code) {
    case KeyCode::Escape:
      restore_snapshot(st);
      st.search.reset();
      set_status(st, "search cancelled");
      return SearchOutcome::Cancelled;
    case KeyCode::Enter:
      st.search.reset();
      set_status(st, "");
      return SearchOutcome::Confirmed;
    case KeyCode::Backspace:
      if (!s.query.empty()) s.query.pop_back();
      s.last_match = -1;
      s.direction = SearchDirection::Forward;
      break;
    case KeyCode::Up: case KeyCode::Left:
      s.direction = SearchDirection::Backward;
      break;
    case KeyCode::Down: case KeyCode::Right:
      s.direction = SearchDirection::Forward;
      break;
    case KeyCode::Char:
      s.query.push_back(static_cast<char>(key.ch));
      s.last_match = -1;
      s.direction = SearchDirection::Forward;
      break;
    default:
      return SearchOutcome::Active;
  }
  bool found = search_step(st);
  set_status(st, search_prompt(s, found || s.query.empty()));
  return SearchOutcome::Active;
}
