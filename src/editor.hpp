#pragma once
/*
 * Editor
 *
 * Purpose: the session loop. Read one key, dispatch it (quit/save/find,
 * navigation, edits), render, repeat.
 * Ownership: owns the EditorState; the terminal and file ports are borrowed
 * and must outlive the Editor.
 * Errors: save/load failures become a status message; the only throw is from
 * the constructor when the terminal size is unusable. After a failed load,
 * Ctrl-S must be pressed twice in a row before the file is overwritten.
 */
#include <filesystem>
#include "file_port.hpp"
#include "input.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"
#include "types.hpp"

class Editor {
public:
  Editor(ITerminal& term, IFilePort& files, const std::filesystem::path& file);
  void run();

  // false once the key ended the session
  bool process_key(const Key& key);
  void render(Clock::time_point now = Clock::now());
  bool save();
  void find();
  void handle_resize();

  const EditorState& state() const { return st; }
  EditorState& state() { return st; }
  bool quitting() const { return should_quit; }

private:
  void open(const std::filesystem::path& path);
  void request_quit();

  ITerminal& term;
  IFilePort& files;
  InputDecoder input;
  Renderer renderer;
  EditorState st;
  int quit_times = KILN_QUIT_TIMES;
  bool should_quit = false;
  bool overwrite_armed = false;
};
