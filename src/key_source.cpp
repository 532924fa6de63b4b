#include "key_source.hpp"
#include "utf8.hpp"

void ScriptedKeySource::push_text(std::string_view utf8) {
  for (char32_t c : utf8_decode(utf8)) {
    if (c == U'\n') events_.push_back(KeyEvent::named(NamedKey::Enter));
    else if (c == U'\t') events_.push_back(KeyEvent::named(NamedKey::Tab));
    else if (c >= U'A' && c <= U'Z') events_.push_back(KeyEvent::character(c, Modifiers{MOD_SHIFT}));
    else events_.push_back(KeyEvent::character(c));
  }
}

bool ScriptedKeySource::push_chord(std::string_view chord, Modifier physical_primary) {
  Chord c;
  if (!parse_chord(chord, c)) return false;
  Modifiers mods = c.mods;
  if (mods.has(MOD_PRIMARY)) mods = mods.without(MOD_PRIMARY).with(physical_primary);
  events_.push_back(KeyEvent{c.key, mods});
  return true;
}

std::optional<KeyEvent> ScriptedKeySource::next_key() {
  if (events_.empty()) return std::nullopt;
  KeyEvent ev = events_.front();
  events_.pop_front();
  return ev;
}
