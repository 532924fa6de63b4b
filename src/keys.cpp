#include "keys.hpp"
#include <cctype>
#include <vector>
#include "utf8.hpp"

static constexpr struct { NamedKey key; const char* name; } kNamedKeys[] = {
  {NamedKey::Left, "left"}, {NamedKey::Right, "right"}, {NamedKey::Up, "up"}, {NamedKey::Down, "down"},
  {NamedKey::Home, "home"}, {NamedKey::End, "end"}, {NamedKey::PageUp, "pageup"}, {NamedKey::PageDown, "pagedown"},
  {NamedKey::Backspace, "backspace"}, {NamedKey::Delete, "delete"}, {NamedKey::Enter, "enter"},
  {NamedKey::Escape, "escape"}, {NamedKey::Tab, "tab"}, {NamedKey::Space, "space"}, {NamedKey::Insert, "insert"},
  {NamedKey::F1, "f1"}, {NamedKey::F2, "f2"}, {NamedKey::F3, "f3"}, {NamedKey::F4, "f4"},
  {NamedKey::F5, "f5"}, {NamedKey::F6, "f6"}, {NamedKey::F7, "f7"}, {NamedKey::F8, "f8"},
  {NamedKey::F9, "f9"}, {NamedKey::F10, "f10"}, {NamedKey::F11, "f11"}, {NamedKey::F12, "f12"},
};

static constexpr struct { Modifier mod; const char* name; } kModifierNames[] = {
  {MOD_PRIMARY, "primary"}, {MOD_CONTROL, "ctrl"}, {MOD_ALT, "alt"}, {MOD_SHIFT, "shift"}, {MOD_SUPER, "cmd"},
};

char32_t fold_key_char(char32_t c) {
  if (c >= U'A' && c <= U'Z') return c - U'A' + U'a';
  return c;
}

Chord Chord::from_event(const KeyEvent& ev) {
  Chord c{ev.key, ev.mods};
  if (c.key.is_character()) {
    if (c.key.ch == U' ') c.key = Key::of(NamedKey::Space);
    else c.key.ch = fold_key_char(c.key.ch);
  }
  return c;
}

const char* named_key_name(NamedKey k) {
  for (const auto& e : kNamedKeys) if (e.key == k) return e.name;
  return "";
}

static std::string to_lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

bool parse_chord(std::string_view text, Chord& out) {
  std::vector<std::string> parts;
  size_t st = 0;
  while (st <= text.size()) {
    size_t pos = text.find('+', st);
    /* "primary++" names the plus key itself */
    if (pos == st && pos + 1 == text.size()) pos = std::string_view::npos;
    if (pos == std::string_view::npos) { parts.emplace_back(text.substr(st)); break; }
    parts.emplace_back(text.substr(st, pos - st));
    st = pos + 1;
  }
  if (parts.empty() || parts.back().empty()) return false;
  Chord c;
  for (size_t i = 0; i + 1 < parts.size(); ++i) {
    std::string m = to_lower(parts[i]);
    if (m == "primary" || m == "mod") c.mods = c.mods.with(MOD_PRIMARY);
    else if (m == "ctrl" || m == "control") c.mods = c.mods.with(MOD_CONTROL);
    else if (m == "alt" || m == "option" || m == "opt") c.mods = c.mods.with(MOD_ALT);
    else if (m == "shift") c.mods = c.mods.with(MOD_SHIFT);
    else if (m == "cmd" || m == "command" || m == "super" || m == "meta" || m == "win") c.mods = c.mods.with(MOD_SUPER);
    else return false;
  }
  std::string key = to_lower(parts.back());
  for (const auto& e : kNamedKeys) {
    if (key == e.name) { c.key = Key::of(e.key); out = c; return true; }
  }
  if (key == "esc") { c.key = Key::of(NamedKey::Escape); out = c; return true; }
  if (key == "del") { c.key = Key::of(NamedKey::Delete); out = c; return true; }
  if (key == "return") { c.key = Key::of(NamedKey::Enter); out = c; return true; }
  std::u32string chars = utf8_decode(parts.back());
  if (chars.size() != 1) return false;
  c.key = chars[0] == U' ' ? Key::of(NamedKey::Space) : Key::character(fold_key_char(chars[0]));
  out = c;
  return true;
}

std::string chord_to_string(const Chord& c) {
  std::string out;
  for (const auto& e : kModifierNames) {
    if (c.mods.has(e.mod)) { out += e.name; out += '+'; }
  }
  if (c.key.is_character()) utf8_append(out, c.key.ch);
  else out += named_key_name(c.key.named);
  return out;
}
