#pragma once
/*
 * Viewport
 *
 * Purpose: cursor movement, clamping and scroll offsets.
 * Invariant: after scroll() the cursor row lies in
 * [top_line, top_line + screen_rows) and cur.rx in [left_col, left_col + screen_cols).
 * Movement wraps across rows: Right at end of line goes to the next row,
 * Left at column 0 goes to the end of the previous row.
 */
#include "iterminal.hpp"
#include "input.hpp"
#include "types.hpp"

// text area is the terminal minus the status and message bars
void set_screen_size(EditorState& st, TermSize sz);
void clamp_cursor(EditorState& st);
void move_cursor(EditorState& st, KeyCode key);
// recompute cur.rx and pull the viewport onto the cursor
void scroll(EditorState& st);
// put row in the middle of the text area where the buffer allows it
void center_on_row(EditorState& st, int row);
bool is_navigation_key(KeyCode key);
