#pragma once
/*
 * Renderer
 *
 * Purpose: draw one full frame: text rows, status bar, message bar, cursor.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: reads EditorState through a const reference; scrolling is the
 * viewport module's job, done before render() is called.
 */
#include <string>
#include "iterminal.hpp"
#include "types.hpp"

class Renderer {
public:
  void render(ITerminal& term, const EditorState& st, Clock::time_point now) const;

  static std::string status_line(const EditorState& st);

private:
  void draw_rows(ITerminal& term, const EditorState& st) const;
  void draw_status_bar(ITerminal& term, const EditorState& st) const;
  void draw_message_bar(ITerminal& term, const EditorState& st, Clock::time_point now) const;
};
