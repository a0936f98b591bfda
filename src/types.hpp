#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs (Cursor/Viewport/StatusMessage/EditorState).
 * Principle: carry simple state; behaviour lives in the modules that take
 * EditorState by reference (edit/search/viewport) or by const reference (renderer).
 */
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include "config.hpp"
#include "text_buffer.hpp"

using Clock = std::chrono::steady_clock;

// rx is the column in the rendered row; recomputed by scroll() after every move
struct Cursor { int row = 0; int col = 0; int rx = 0; };
struct Viewport { int top_line = 0; int left_col = 0; };

inline bool operator==(const Cursor& a, const Cursor& b) {
  return a.row == b.row && a.col == b.col && a.rx == b.rx;
}
inline bool operator==(const Viewport& a, const Viewport& b) {
  return a.top_line == b.top_line && a.left_col == b.left_col;
}

struct StatusMessage {
  std::string text;
  Clock::time_point time{};
};

enum class SearchDirection { Forward, Backward };

struct SearchState {
  std::string query;
  int last_match = -1;          // row of the current match, -1 if none
  int match_col = -1;
  SearchDirection direction = SearchDirection::Forward;
  Cursor saved_cur;
  Viewport saved_vp;
};

struct EditorState {
  TextBuffer buf;
  Cursor cur;
  Viewport vp;
  int screen_rows = 1;          // text area only, status and message bars excluded
  int screen_cols = 1;
  std::optional<std::filesystem::path> file_path;
  bool modified = false;
  // the file exists but could not be read; saving would replace it unseen
  bool load_failed = false;
  // the file on disk has no lines, so a lone empty row saves as zero bytes
  bool disk_empty = false;
  StatusMessage status;
  std::optional<SearchState> search;
};

inline void set_status(EditorState& st, std::string text, Clock::time_point now = Clock::now()) {
  st.status.text = std::move(text);
  st.status.time = now;
}

inline bool status_visible(const StatusMessage& msg, Clock::time_point now) {
  if (msg.text.empty()) return false;
  return now - msg.time < std::chrono::seconds(KILN_MESSAGE_TIMEOUT_SEC);
}
