#pragma once
/*
 * Input
 *
 * Purpose: decode raw terminal bytes into logical keys.
 * Design: small state machine (ground -> esc -> csi/ss3) feeding a table of
 * known sequences; adding a key is one table row.
 * Note: next_key() is the only place the editor blocks. Unknown sequences
 * decode to KeyCode::None, never an error.
 */
#include <deque>
#include <string>
#include <string_view>
#include "iterminal.hpp"

enum class KeyCode {
  None,
  Char,
  Ctrl,
  Enter,
  Backspace,
  Escape,
  Up,
  Down,
  Left,
  Right,
  Home,
  End,
  PageUp,
  PageDown,
  Delete,
  Resize,
};

struct Key {
  KeyCode code = KeyCode::None;
  unsigned char ch = 0;  // byte for Char, upper-case letter for Ctrl
};

inline bool operator==(const Key& a, const Key& b) { return a.code == b.code && a.ch == b.ch; }

constexpr unsigned char ctrl_key(char k) { return static_cast<unsigned char>(k) & 0x1f; }

class InputDecoder {
public:
  // blocks on term.read_available() only when no bytes are pending
  Key next_key(ITerminal& term);
  bool has_pending() const { return !pending_.empty(); }
  void reset();

private:
  enum class State { Ground, Esc, Csi, Ss3 };

  Key decode_pending();
  static Key decode_plain(unsigned char c);
  static Key lookup(std::string_view seq);

  std::deque<unsigned char> pending_;
};
