#include "editor.hpp"
#include <stdexcept>
#include <string>
#include <vector>
#include "edit_engine.hpp"
#include "search.hpp"
#include "viewport.hpp"

Editor::Editor(ITerminal& term, IFilePort& files, const std::filesystem::path& file)
    : term(term), files(files) {
  TermSize sz = term.get_size();
  if (sz.rows <= 0 || sz.cols <= 0) throw std::runtime_error("can not determine terminal size");
  set_screen_size(st, sz);
  open(file);
}

void Editor::open(const std::filesystem::path& path) {
  std::vector<std::string> lines;
  std::string msg;
  st.load_failed = !files.load(path, lines, msg);
  if (st.load_failed) lines.clear();
  st.disk_empty = lines.empty();
  st.buf.init_from_lines(std::move(lines));
  st.file_path = path;
  st.modified = false;
  st.cur = Cursor{};
  st.vp = Viewport{};
  scroll(st);
  set_status(st, msg + " | Ctrl-S = save | Ctrl-Q = quit | Ctrl-F = find");
}

void Editor::run() {
  while (!should_quit) {
    render();
    process_key(input.next_key(term));
  }
}

void Editor::render(Clock::time_point now) {
  renderer.render(term, st, now);
}

void Editor::handle_resize() {
  set_screen_size(st, term.get_size());
  scroll(st);
}

bool Editor::save() {
  if (!st.file_path) { set_status(st, "no file name, can not save"); return false; }
  if (st.load_failed && !overwrite_armed) {
    set_status(st, "WARNING!!! " + st.file_path->string() + " could not be read. Press Ctrl-S again to overwrite it.");
    overwrite_armed = true;
    return false;
  }
  std::vector<std::string> lines = st.buf.lines();
  bool lone_empty = lines.size() == 1 && lines[0].empty();
  if (lone_empty && st.disk_empty) lines.clear();
  std::string msg;
  bool ok = files.save(*st.file_path, lines, msg);
  if (ok) {
    st.modified = false;
    st.load_failed = false;
    st.disk_empty = lines.empty();
  }
  set_status(st, msg);
  return ok;
}

void Editor::find() {
  search_begin(st);
  for (;;) {
    render();
    Key key = input.next_key(term);
    if (key.code == KeyCode::Resize) { handle_resize(); continue; }
    if (search_handle_key(st, key) != SearchOutcome::Active) break;
  }
  scroll(st);
}

void Editor::request_quit() {
  if (st.modified && quit_times > 0) {
    set_status(st, "WARNING!!! File has unsaved changes. Press Ctrl-Q " + std::to_string(quit_times) + " more times to quit.");
    quit_times--;
    return;
  }
  should_quit = true;
}

bool Editor::process_key(const Key& key) {
  bool is_quit = key.code == KeyCode::Ctrl && key.ch == 'Q';
  bool is_save = key.code == KeyCode::Ctrl && key.ch == 'S';
  if (!is_save) overwrite_armed = false;
  switch (key.code) {
    case KeyCode::Resize: handle_resize(); break;
    case KeyCode::Ctrl:
      switch (key.ch) {
        case 'Q': request_quit(); break;
        case 'S': save(); break;
        case 'F': find(); break;
        default: break; // Ctrl-L, Ctrl-C and friends only redraw
      }
      break;
    case KeyCode::Enter: insert_newline(st); break;
    case KeyCode::Backspace: backspace(st); break;
    case KeyCode::Delete: delete_forward(st); break;
    case KeyCode::Char: insert_char(st, static_cast<char>(key.ch)); break;
    case KeyCode::Escape:
    case KeyCode::None:
      break;
    default:
      if (is_navigation_key(key.code)) move_cursor(st, key.code);
      break;
  }
  if (!is_quit) quit_times = KILN_QUIT_TIMES;
  return !should_quit;
}
