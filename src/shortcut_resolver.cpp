#include "shortcut_resolver.hpp"
#include <algorithm>
#include "utf8.hpp"

const char* platform_name(Platform p) {
  switch (p) {
    case Platform::Linux: return "linux";
    case Platform::Windows: return "windows";
    case Platform::MacOS: return "mac";
  }
  return "unknown";
}

bool parse_platform(std::string_view name, Platform& out) {
  if (name == "linux") { out = Platform::Linux; return true; }
  if (name == "windows" || name == "win") { out = Platform::Windows; return true; }
  if (name == "mac" || name == "macos" || name == "osx") { out = Platform::MacOS; return true; }
  return false;
}

void ShortcutTable::bind(ShortcutBinding b) {
  b.seq = ++next_seq_;
  auto& map = b.platform ? overrides_[static_cast<size_t>(*b.platform)] : portable_;
  Chord key = b.chord;
  map[key] = std::move(b);
}

bool ShortcutTable::unbind(const Chord& chord, std::optional<Platform> platform) {
  auto& map = platform ? overrides_[static_cast<size_t>(*platform)] : portable_;
  return map.erase(chord) > 0;
}

void ShortcutTable::clear() {
  portable_.clear();
  for (auto& m : overrides_) m.clear();
}

const ShortcutBinding* ShortcutTable::find(const Chord& chord, std::optional<Platform> platform) const {
  const auto& map = platform ? overrides_[static_cast<size_t>(*platform)] : portable_;
  auto it = map.find(chord);
  return it == map.end() ? nullptr : &it->second;
}

std::vector<ShortcutBinding> ShortcutTable::bindings() const {
  std::vector<ShortcutBinding> out;
  for (const auto& [chord, b] : portable_) out.push_back(b);
  for (const auto& m : overrides_) for (const auto& [chord, b] : m) out.push_back(b);
  std::sort(out.begin(), out.end(), [](const ShortcutBinding& a, const ShortcutBinding& b) {
    return chord_to_string(a.chord) < chord_to_string(b.chord);
  });
  return out;
}

ShortcutResolver::ShortcutResolver(Platform platform)
  : platform_(platform),
    conventions_{{Platform::Linux, MOD_CONTROL}, {Platform::Windows, MOD_CONTROL}, {Platform::MacOS, MOD_SUPER}} {
  load_defaults();
}

void ShortcutResolver::set_platform(Platform p) { platform_ = p; dirty_ = true; }

void ShortcutResolver::set_conventions(std::vector<ModifierConvention> conventions) {
  conventions_ = std::move(conventions);
  dirty_ = true;
}

Modifier ShortcutResolver::primary_modifier() const {
  for (const auto& c : conventions_) if (c.platform == platform_) return c.primary;
  return MOD_CONTROL;
}

Modifiers ShortcutResolver::normalize(Modifiers raw) const {
  Modifier primary = primary_modifier();
  if (raw.has(primary)) return raw.without(primary).with(MOD_PRIMARY);
  return raw;
}

void ShortcutResolver::bind(ShortcutBinding b) {
  table_.bind(std::move(b));
  dirty_ = true;
}

bool ShortcutResolver::bind(std::string_view chord, std::string_view command, std::string description,
                            std::optional<Platform> platform) {
  ShortcutBinding b;
  if (!parse_chord(chord, b.chord)) return false;
  if (!parse_command(command, b.action)) return false;
  b.description = description.empty() ? std::string(command) : std::move(description);
  b.platform = platform;
  bind(std::move(b));
  return true;
}

bool ShortcutResolver::unbind(std::string_view chord, std::optional<Platform> platform) {
  Chord c;
  if (!parse_chord(chord, c)) return false;
  return unbind(c, platform);
}

bool ShortcutResolver::unbind(const Chord& chord, std::optional<Platform> platform) {
  dirty_ = true;
  return table_.unbind(chord, platform);
}

void ShortcutResolver::clear() {
  table_.clear();
  dirty_ = true;
}

/*
 * "ctrl+k" and "primary+k" normalize to the same chord on linux; within a layer
 * the later bind wins. Overrides for the current platform always beat portable.
 */
void ShortcutResolver::compile() const {
  compiled_.clear();
  auto add_layer = [&](const std::unordered_map<Chord, ShortcutBinding, ChordHash>& layer) {
    std::vector<const ShortcutBinding*> order;
    order.reserve(layer.size());
    for (const auto& [chord, b] : layer) order.push_back(&b);
    std::sort(order.begin(), order.end(), [](const ShortcutBinding* a, const ShortcutBinding* b) {
      return a->seq < b->seq;
    });
    for (const ShortcutBinding* b : order) compiled_[Chord{b->chord.key, normalize(b->chord.mods)}] = b;
  };
  add_layer(table_.portable());
  add_layer(table_.overrides(platform_));
  dirty_ = false;
}

Resolution ShortcutResolver::resolve(const KeyEvent& ev) const {
  if (dirty_) compile();
  Chord chord = Chord::from_event(ev);
  chord.mods = normalize(chord.mods);
  Resolution r;
  if (auto it = compiled_.find(chord); it != compiled_.end()) {
    r.kind = Resolution::Kind::Command;
    r.command = it->second->action;
    r.binding = it->second;
    return r;
  }
  char32_t produced = 0;
  if (ev.key.is_character()) {
    if (chord.mods.without(MOD_SHIFT).empty() && is_printable(ev.key.ch)) produced = ev.key.ch;
  } else if (chord.mods.empty()) {
    switch (ev.key.named) {
      case NamedKey::Enter: produced = U'\n'; break;
      case NamedKey::Tab: produced = U'\t'; break;
      case NamedKey::Space: produced = U' '; break;
      default: break;
    }
  }
  if (produced == 0 && ev.key.named == NamedKey::Space && chord.mods == Modifiers{MOD_SHIFT}) produced = U' ';
  if (produced != 0) {
    r.kind = Resolution::Kind::Character;
    r.command = Command::insert_char(produced);
  }
  return r;
}

namespace {
struct DefaultBinding {
  const char* chord;
  const char* command;
  const char* description;
  std::optional<Platform> platform;
};

const DefaultBinding kDefaultBindings[] = {
  /* basic movement */
  {"up", "move_up", "Move cursor up", std::nullopt},
  {"down", "move_down", "Move cursor down", std::nullopt},
  {"left", "move_left", "Move cursor left", std::nullopt},
  {"right", "move_right", "Move cursor right", std::nullopt},
  {"primary+left", "move_word_left", "Move cursor to previous word", std::nullopt},
  {"primary+right", "move_word_right", "Move cursor to next word", std::nullopt},
  {"home", "move_line_start", "Move cursor to line start", std::nullopt},
  {"end", "move_line_end", "Move cursor to line end", std::nullopt},
  {"primary+home", "move_document_start", "Move cursor to document start", std::nullopt},
  {"primary+end", "move_document_end", "Move cursor to document end", std::nullopt},
  {"pageup", "move_page_up", "Move cursor page up", std::nullopt},
  {"pagedown", "move_page_down", "Move cursor page down", std::nullopt},
  /* extending movement */
  {"shift+up", "select_up", "Extend selection up", std::nullopt},
  {"shift+down", "select_down", "Extend selection down", std::nullopt},
  {"shift+left", "select_left", "Extend selection left", std::nullopt},
  {"shift+right", "select_right", "Extend selection right", std::nullopt},
  {"primary+shift+left", "select_word_left", "Extend selection to previous word", std::nullopt},
  {"primary+shift+right", "select_word_right", "Extend selection to next word", std::nullopt},
  {"shift+home", "select_line_start", "Extend selection to line start", std::nullopt},
  {"shift+end", "select_line_end", "Extend selection to line end", std::nullopt},
  {"primary+shift+home", "select_document_start", "Extend selection to document start", std::nullopt},
  {"primary+shift+end", "select_document_end", "Extend selection to document end", std::nullopt},
  /* deletion */
  {"delete", "delete_forward", "Delete character", std::nullopt},
  {"backspace", "delete_backward", "Delete character backward", std::nullopt},
  {"shift+backspace", "delete_backward", "Delete character backward", std::nullopt},
  {"primary+delete", "delete_word_forward", "Delete to next word", std::nullopt},
  {"primary+backspace", "delete_word_backward", "Delete to previous word", std::nullopt},
  {"primary+k", "delete_line", "Delete line", std::nullopt},
  /* selection */
  {"primary+a", "select_all", "Select all", std::nullopt},
  {"primary+l", "select_line", "Select line", std::nullopt},
  {"primary+d", "select_word", "Select word", std::nullopt},
  {"escape", "clear_selection", "Clear selection", std::nullopt},
  /* history and clipboard */
  {"primary+z", "undo", "Undo", std::nullopt},
  {"primary+y", "redo", "Redo", std::nullopt},
  {"primary+shift+z", "redo", "Redo (alternative)", std::nullopt},
  {"primary+x", "cut", "Cut", std::nullopt},
  {"primary+c", "copy", "Copy", std::nullopt},
  {"primary+v", "paste", "Paste", std::nullopt},
  /* search */
  {"f3", "find_next", "Find next", std::nullopt},
  {"shift+f3", "find_previous", "Find previous", std::nullopt},
  {"primary+g", "find_next", "Find next", std::nullopt},
  {"primary+shift+g", "find_previous", "Find previous", std::nullopt},
  /* mac conventions: cmd+arrows jump to line/document ends, option+arrows move by word */
  {"cmd+left", "move_line_start", "Move to line start (mac)", Platform::MacOS},
  {"cmd+right", "move_line_end", "Move to line end (mac)", Platform::MacOS},
  {"cmd+up", "move_document_start", "Move to document start (mac)", Platform::MacOS},
  {"cmd+down", "move_document_end", "Move to document end (mac)", Platform::MacOS},
  {"cmd+shift+left", "select_line_start", "Extend selection to line start (mac)", Platform::MacOS},
  {"cmd+shift+right", "select_line_end", "Extend selection to line end (mac)", Platform::MacOS},
  {"alt+left", "move_word_left", "Move cursor to previous word (mac)", Platform::MacOS},
  {"alt+right", "move_word_right", "Move cursor to next word (mac)", Platform::MacOS},
  {"alt+shift+left", "select_word_left", "Extend selection to previous word (mac)", Platform::MacOS},
  {"alt+shift+right", "select_word_right", "Extend selection to next word (mac)", Platform::MacOS},
  {"alt+backspace", "delete_word_backward", "Delete to previous word (mac)", Platform::MacOS},
  {"alt+delete", "delete_word_forward", "Delete to next word (mac)", Platform::MacOS},
};
}  // namespace

void ShortcutResolver::load_defaults() {
  for (const auto& d : kDefaultBindings) {
    ShortcutBinding b;
    if (!parse_chord(d.chord, b.chord) || !parse_command(d.command, b.action)) continue;
    b.description = d.description;
    b.platform = d.platform;
    table_.bind(std::move(b));
  }
  dirty_ = true;
}
