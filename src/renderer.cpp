#include "renderer.hpp"
#include <algorithm>
#include <sstream>
#include "config.hpp"

static bool show_welcome(const EditorState& st) {
  return !st.modified && st.buf.line_count() == 1 && st.buf.line(0).empty();
}

static void render_welcome(ITerminal& term, int row, int cols) {
  std::string text = "kiln editor -- version " KILN_VERSION;
  if ((int)text.size() > cols) text.resize(static_cast<size_t>(cols));
  int padding = (cols - (int)text.size()) / 2;
  std::string line;
  if (padding > 0) {
    line = "~" + std::string(static_cast<size_t>(padding - 1), ' ');
  }
  line += text;
  term.draw_text(row, 0, line);
  term.clear_to_eol(row, (int)line.size());
}

void Renderer::draw_rows(ITerminal& term, const EditorState& st) const {
  const Viewport& vp = st.vp;
  int cols = st.screen_cols;
  for (int y = 0; y < st.screen_rows; ++y) {
    int filerow = vp.top_line + y;
    if (filerow >= st.buf.line_count()) {
      if (show_welcome(st) && y == st.screen_rows / 3) {
        render_welcome(term, y, cols);
        continue;
      }
      term.draw_text(y, 0, "~");
      term.clear_to_eol(y, 1);
      continue;
    }
    const std::string& r = st.buf.render(filerow);
    int len = std::clamp((int)r.size() - vp.left_col, 0, cols);
    std::string vis = len > 0 ? r.substr(static_cast<size_t>(vp.left_col), static_cast<size_t>(len)) : std::string();
    if (st.search && st.search->last_match == filerow && st.search->match_col >= 0) {
      const std::string& raw = st.buf.line(filerow);
      int m0 = cx_to_rx(raw, st.search->match_col);
      int m1 = cx_to_rx(raw, st.search->match_col + (int)st.search->query.size());
      int hs = std::max(0, m0 - vp.left_col);
      int he = std::max(0, std::min(m1 - vp.left_col, len));
      term.draw_highlighted(y, 0, vis, hs, std::max(0, he - hs));
    } else {
      term.draw_text(y, 0, vis);
    }
    term.clear_to_eol(y, (int)vis.size());
  }
}

std::string Renderer::status_line(const EditorState& st) {
  std::string name = st.file_path ? st.file_path->string() : std::string("[untitled]");
  if (name.size() > 20) name.resize(20);
  std::ostringstream left;
  left << name << " - " << st.buf.line_count() << " lines" << (st.modified ? " (modified)" : "");
  std::ostringstream right;
  right << (st.cur.row + 1) << "/" << st.buf.line_count();
  std::string l = left.str();
  std::string r = right.str();
  int cols = st.screen_cols;
  if ((int)l.size() > cols) l.resize(static_cast<size_t>(cols));
  int gap = cols - (int)l.size() - (int)r.size();
  if (gap >= 0) return l + std::string(static_cast<size_t>(gap), ' ') + r;
  return l + std::string(static_cast<size_t>(cols - (int)l.size()), ' ');
}

void Renderer::draw_status_bar(ITerminal& term, const EditorState& st) const {
  std::string bar = status_line(st);
  term.draw_highlighted(st.screen_rows, 0, bar, 0, (int)bar.size());
}

void Renderer::draw_message_bar(ITerminal& term, const EditorState& st, Clock::time_point now) const {
  int row = st.screen_rows + 1;
  if (status_visible(st.status, now)) {
    std::string msg = st.status.text;
    if ((int)msg.size() > st.screen_cols) msg.resize(static_cast<size_t>(st.screen_cols));
    term.draw_text(row, 0, msg);
    term.clear_to_eol(row, (int)msg.size());
  } else {
    term.clear_to_eol(row, 0);
  }
}

void Renderer::render(ITerminal& term, const EditorState& st, Clock::time_point now) const {
  term.clear();
  draw_rows(term, st);
  draw_status_bar(term, st);
  draw_message_bar(term, st, now);
  int screen_row = st.cur.row - st.vp.top_line;
  int screen_col = st.cur.rx - st.vp.left_col;
  screen_row = std::clamp(screen_row, 0, st.screen_rows - 1);
  screen_col = std::clamp(screen_col, 0, st.screen_cols - 1);
  term.move_cursor(screen_row, screen_col);
  term.refresh();
}
