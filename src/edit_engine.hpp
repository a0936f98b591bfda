#pragma once
/*
 * EditEngine
 *
 * Purpose: buffer mutations at the cursor (insert char/newline, backspace,
 * forward delete). Each call is total over a clamped cursor, marks the
 * buffer modified when it changed something, and leaves the viewport
 * scrolled onto the new cursor.
 */
#include "types.hpp"

void insert_char(EditorState& st, char c);
void insert_newline(EditorState& st);
void backspace(EditorState& st);
void delete_forward(EditorState& st);
