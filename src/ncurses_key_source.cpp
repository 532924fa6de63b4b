#include "ncurses_key_source.hpp"
#include <cstring>
#include <string>
#include <ncurses.h>

/* xterm modifier parameter: 1 + shift(1) + alt(2) + ctrl(4) */
static Modifiers xterm_modifiers(int param) {
  Modifiers m;
  int bits = param - 1;
  if (bits & 1) m = m.with(MOD_SHIFT);
  if (bits & 2) m = m.with(MOD_ALT);
  if (bits & 4) m = m.with(MOD_CONTROL);
  return m;
}

static constexpr struct { const char* prefix; NamedKey key; } kExtendedNames[] = {
  {"kLFT", NamedKey::Left}, {"kRIT", NamedKey::Right}, {"kUP", NamedKey::Up}, {"kDN", NamedKey::Down},
  {"kHOM", NamedKey::Home}, {"kEND", NamedKey::End}, {"kPRV", NamedKey::PageUp}, {"kNXT", NamedKey::PageDown},
  {"kDC", NamedKey::Delete}, {"kIC", NamedKey::Insert},
};

static std::optional<KeyEvent> translate_code(int code) {
  switch (code) {
    case KEY_LEFT: return KeyEvent::named(NamedKey::Left);
    case KEY_RIGHT: return KeyEvent::named(NamedKey::Right);
    case KEY_UP: return KeyEvent::named(NamedKey::Up);
    case KEY_DOWN: return KeyEvent::named(NamedKey::Down);
    case KEY_HOME: return KeyEvent::named(NamedKey::Home);
    case KEY_END: return KeyEvent::named(NamedKey::End);
    case KEY_PPAGE: return KeyEvent::named(NamedKey::PageUp);
    case KEY_NPAGE: return KeyEvent::named(NamedKey::PageDown);
    case KEY_BACKSPACE: return KeyEvent::named(NamedKey::Backspace);
    case KEY_DC: return KeyEvent::named(NamedKey::Delete);
    case KEY_IC: return KeyEvent::named(NamedKey::Insert);
    case KEY_ENTER: return KeyEvent::named(NamedKey::Enter);
    case KEY_BTAB: return KeyEvent::named(NamedKey::Tab, Modifiers{MOD_SHIFT});
    case KEY_SLEFT: return KeyEvent::named(NamedKey::Left, Modifiers{MOD_SHIFT});
    case KEY_SRIGHT: return KeyEvent::named(NamedKey::Right, Modifiers{MOD_SHIFT});
    case KEY_SR: return KeyEvent::named(NamedKey::Up, Modifiers{MOD_SHIFT});
    case KEY_SF: return KeyEvent::named(NamedKey::Down, Modifiers{MOD_SHIFT});
    case KEY_SHOME: return KeyEvent::named(NamedKey::Home, Modifiers{MOD_SHIFT});
    case KEY_SEND: return KeyEvent::named(NamedKey::End, Modifiers{MOD_SHIFT});
    case KEY_SDC: return KeyEvent::named(NamedKey::Delete, Modifiers{MOD_SHIFT});
    default: break;
  }
  if (code >= KEY_F(1) && code <= KEY_F(12)) {
    return KeyEvent::named(static_cast<NamedKey>(static_cast<int>(NamedKey::F1) + (code - KEY_F(1))));
  }
  const char* name = keyname(code);
  if (!name) return std::nullopt;
  for (const auto& e : kExtendedNames) {
    size_t n = std::strlen(e.prefix);
    if (std::strncmp(name, e.prefix, n) != 0) continue;
    const char* digits = name + n;
    if (*digits < '2' || *digits > '8' || digits[1] != '\0') continue;
    return KeyEvent::named(e.key, xterm_modifiers(*digits - '0'));
  }
  return std::nullopt;
}

static std::optional<KeyEvent> translate_char(char32_t ch) {
  switch (ch) {
    case 0: return KeyEvent::named(NamedKey::Space, Modifiers{MOD_CONTROL});
    case 8: case 127: return KeyEvent::named(NamedKey::Backspace);
    case 9: return KeyEvent::named(NamedKey::Tab);
    case 10: case 13: return KeyEvent::named(NamedKey::Enter);
    case 27: return KeyEvent::named(NamedKey::Escape);
    case 32: return KeyEvent::named(NamedKey::Space);
    default: break;
  }
  if (ch >= 1 && ch <= 26) return KeyEvent::character(U'a' + (ch - 1), Modifiers{MOD_CONTROL});
  if (ch < 32) return std::nullopt;
  if (ch >= U'A' && ch <= U'Z') return KeyEvent::character(ch, Modifiers{MOD_SHIFT});
  return KeyEvent::character(ch);
}

std::optional<KeyEvent> NcursesKeySource::next_key() {
  for (;;) {
    wint_t wch = 0;
    int rc = wget_wch(stdscr, &wch);
    if (rc == ERR) return std::nullopt;
    if (rc == KEY_CODE_YES) {
      if (static_cast<int>(wch) == KEY_RESIZE) return KeyEvent{};
      if (auto ev = translate_code(static_cast<int>(wch))) return ev;
      continue;
    }
    if (wch == 27) {
      /* ESC immediately followed by a key is alt+key */
      nodelay(stdscr, TRUE);
      wint_t next = 0;
      int rc2 = wget_wch(stdscr, &next);
      nodelay(stdscr, FALSE);
      if (rc2 == OK && next != 27) {
        if (auto ev = translate_char(static_cast<char32_t>(next))) { ev->mods = ev->mods.with(MOD_ALT); return ev; }
        continue;
      }
      if (rc2 == KEY_CODE_YES) {
        if (auto ev = translate_code(static_cast<int>(next))) { ev->mods = ev->mods.with(MOD_ALT); return ev; }
        continue;
      }
    }
    if (auto ev = translate_char(static_cast<char32_t>(wch))) return ev;
  }
}
