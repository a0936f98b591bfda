#include "input.hpp"

static constexpr unsigned char ESC = 27;
static constexpr unsigned char DEL = 127;
// longest CSI body we bother to collect before calling it garbage
static constexpr size_t MAX_SEQ_LEN = 16;

struct SeqEntry { std::string_view seq; KeyCode code; };

// bytes after ESC
static constexpr SeqEntry kSequences[] = {
  {"[A", KeyCode::Up},
  {"[B", KeyCode::Down},
  {"[C", KeyCode::Right},
  {"[D", KeyCode::Left},
  {"[H", KeyCode::Home},
  {"[F", KeyCode::End},
  {"[1~", KeyCode::Home},
  {"[7~", KeyCode::Home},
  {"[4~", KeyCode::End},
  {"[8~", KeyCode::End},
  {"[3~", KeyCode::Delete},
  {"[5~", KeyCode::PageUp},
  {"[6~", KeyCode::PageDown},
  {"OA", KeyCode::Up},
  {"OB", KeyCode::Down},
  {"OC", KeyCode::Right},
  {"OD", KeyCode::Left},
  {"OH", KeyCode::Home},
  {"OF", KeyCode::End},
};

static inline bool is_csi_final(unsigned char c) { return c >= 0x40 && c <= 0x7e; }

Key InputDecoder::next_key(ITerminal& term) {
  if (pending_.empty()) {
    std::string bytes = term.read_available();
    if (bytes.empty()) return Key{KeyCode::Resize, 0};
    for (char b : bytes) pending_.push_back(static_cast<unsigned char>(b));
  }
  return decode_pending();
}

void InputDecoder::reset() { pending_.clear(); }

Key InputDecoder::decode_plain(unsigned char c) {
  switch (c) {
    case '\r': case '\n': return Key{KeyCode::Enter, c};
    case DEL: case 8: return Key{KeyCode::Backspace, c};
    case '\t': return Key{KeyCode::Char, c};
    case ESC: return Key{KeyCode::Escape, c};
    default: break;
  }
  if (c < 0x20) return Key{KeyCode::Ctrl, static_cast<unsigned char>(c | 0x40)};
  return Key{KeyCode::Char, c};
}

Key InputDecoder::lookup(std::string_view seq) {
  for (const auto& e : kSequences) {
    if (e.seq == seq) return Key{e.code, 0};
  }
  return Key{KeyCode::None, 0};
}

Key InputDecoder::decode_pending() {
  State state = State::Ground;
  std::string seq;
  size_t used = 0;
  auto consume = [&](size_t n) { pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(n)); };

  while (used < pending_.size()) {
    unsigned char c = pending_[used];
    switch (state) {
      case State::Ground:
        used++;
        if (c != ESC) { consume(used); return decode_plain(c); }
        state = State::Esc;
        break;
      case State::Esc:
        if (c == '[') { seq.push_back('['); used++; state = State::Csi; break; }
        if (c == 'O') { seq.push_back('O'); used++; state = State::Ss3; break; }
        // ESC ESC: the first one stands alone, the second starts over
        if (c == ESC) { consume(used); return Key{KeyCode::Escape, ESC}; }
        consume(used + 1);
        return Key{KeyCode::None, 0};
      case State::Csi:
        seq.push_back(static_cast<char>(c));
        used++;
        if (is_csi_final(c)) { consume(used); return lookup(seq); }
        if (seq.size() >= MAX_SEQ_LEN) { consume(used); return Key{KeyCode::None, 0}; }
        break;
      case State::Ss3:
        seq.push_back(static_cast<char>(c));
        used++;
        consume(used);
        return lookup(seq);
    }
  }
  // input ran out inside a sequence: the user pressed ESC on its own, or the
  // tail never arrived in time
  consume(used);
  return Key{KeyCode::Escape, ESC};
}
