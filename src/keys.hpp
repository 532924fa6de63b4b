#pragma once
/*
 * Keys
 *
 * Purpose: key/modifier model shared by key sources and the shortcut resolver.
 * Text form: "primary+shift+z", "ctrl+left", "cmd+a", "f3" (case-insensitive).
 */
#include <cstdint>
#include <string>
#include <string_view>

enum class NamedKey {
  None,
  Left, Right, Up, Down,
  Home, End, PageUp, PageDown,
  Backspace, Delete, Enter, Escape, Tab, Space, Insert,
  F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12
};

/* either a named key or the character a key produced */
struct Key {
  NamedKey named = NamedKey::None;
  char32_t ch = 0;

  static Key character(char32_t c) { return Key{NamedKey::None, c}; }
  static Key of(NamedKey k) { return Key{k, 0}; }
  bool is_character() const { return named == NamedKey::None; }
  bool operator==(const Key&) const = default;
};

enum Modifier : uint8_t {
  MOD_NONE = 0,
  MOD_SHIFT = 1 << 0,
  MOD_CONTROL = 1 << 1,
  MOD_ALT = 1 << 2,
  MOD_SUPER = 1 << 3,   /* command key / windows key */
  MOD_PRIMARY = 1 << 4  /* logical: whichever physical modifier the platform uses for shortcuts */
};

struct Modifiers {
  uint8_t bits = MOD_NONE;

  bool has(Modifier m) const { return (bits & m) != 0; }
  bool empty() const { return bits == MOD_NONE; }
  Modifiers with(Modifier m) const { return Modifiers{static_cast<uint8_t>(bits | m)}; }
  Modifiers without(Modifier m) const { return Modifiers{static_cast<uint8_t>(bits & ~m)}; }
  bool operator==(const Modifiers&) const = default;
};

struct KeyEvent {
  Key key;
  Modifiers mods;

  static KeyEvent character(char32_t c, Modifiers m = {}) { return {Key::character(c), m}; }
  static KeyEvent named(NamedKey k, Modifiers m = {}) { return {Key::of(k), m}; }
  bool operator==(const KeyEvent&) const = default;
};

/* key + required modifier set; character keys are stored lower-cased */
struct Chord {
  Key key;
  Modifiers mods;

  static Chord from_event(const KeyEvent& ev);
  bool operator==(const Chord&) const = default;
};

struct ChordHash {
  size_t operator()(const Chord& c) const {
    return (static_cast<size_t>(c.key.ch) << 16) ^ (static_cast<size_t>(c.key.named) << 8) ^ c.mods.bits;
  }
};

char32_t fold_key_char(char32_t c);
const char* named_key_name(NamedKey k);
bool parse_chord(std::string_view text, Chord& out);
std::string chord_to_string(const Chord& c);
