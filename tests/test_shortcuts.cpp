#include "shortcut_resolver.hpp"
#include <cassert>
#include <string>

static KeyEvent ch(char32_t c, uint8_t mods = MOD_NONE) { return KeyEvent::character(c, Modifiers{mods}); }
static KeyEvent key(NamedKey k, uint8_t mods = MOD_NONE) { return KeyEvent::named(k, Modifiers{mods}); }

static bool resolves_to(const ShortcutResolver& r, const KeyEvent& ev, const char* command) {
  Resolution res = r.resolve(ev);
  return res.kind == Resolution::Kind::Command && command_name(res.command) == command;
}

int main() {
  {
    Chord c;
    assert(parse_chord("Primary+Shift+Z", c));
    assert(c.mods == Modifiers{MOD_PRIMARY | MOD_SHIFT});
    assert(c.key == Key::character(U'z'));
    assert(chord_to_string(c) == "primary+shift+z");
    assert(parse_chord("cmd+left", c));
    assert(chord_to_string(c) == "cmd+left");
    assert(parse_chord("ctrl++", c));
    assert(c.key == Key::character(U'+'));
    assert(parse_chord("f3", c) && c.key == Key::of(NamedKey::F3));
    assert(parse_chord("esc", c) && c.key == Key::of(NamedKey::Escape));
    assert(!parse_chord("hyper+x", c));
    assert(!parse_chord("", c));
    assert(!parse_chord("ctrl+", c));
    assert(!parse_chord("ctrl+xy", c));

    Command cmd;
    assert(parse_command("undo", cmd) && cmd.type == Command::Type::Undo);
    assert(parse_command("select_word", cmd) && cmd.type == Command::Type::SelectWord);
    assert(parse_command("select_word_left", cmd));
    assert(cmd.type == Command::Type::Move && cmd.extend && cmd.movement == Movement::WordLeft);
    assert(parse_command("move_page_down", cmd) && !cmd.extend && cmd.movement == Movement::PageDown);
    assert(!parse_command("move_sideways", cmd));
    assert(!parse_command("find", cmd));
  }
  {
    // control is primary on linux and windows
    ShortcutResolver r(Platform::Linux);
    assert(r.primary_modifier() == MOD_CONTROL);
    assert(resolves_to(r, ch(U'z', MOD_CONTROL), "undo"));
    assert(resolves_to(r, ch(U'Z', MOD_CONTROL | MOD_SHIFT), "redo"));
    assert(resolves_to(r, ch(U'y', MOD_CONTROL), "redo"));
    assert(resolves_to(r, key(NamedKey::Left, MOD_CONTROL), "move_word_left"));
    assert(resolves_to(r, key(NamedKey::Left, MOD_SHIFT), "select_left"));
    assert(resolves_to(r, key(NamedKey::Home), "move_line_start"));
    // exact modifier match only
    assert(r.resolve(ch(U'z', MOD_CONTROL | MOD_ALT)).kind == Resolution::Kind::Unhandled);
    assert(r.resolve(ch(U'z', MOD_SUPER)).kind == Resolution::Kind::Unhandled);
    // mac overrides are inactive here
    assert(r.resolve(key(NamedKey::Left, MOD_ALT)).kind == Resolution::Kind::Unhandled);
    r.set_platform(Platform::Windows);
    assert(resolves_to(r, ch(U'z', MOD_CONTROL), "undo"));
  }
  {
    // cmd is primary on mac, and mac overrides beat portable bindings
    ShortcutResolver r(Platform::MacOS);
    assert(r.primary_modifier() == MOD_SUPER);
    assert(resolves_to(r, ch(U'z', MOD_SUPER), "undo"));
    assert(r.resolve(ch(U'z', MOD_CONTROL)).kind == Resolution::Kind::Unhandled);
    assert(resolves_to(r, key(NamedKey::Left, MOD_SUPER), "move_line_start"));
    assert(resolves_to(r, key(NamedKey::Left, MOD_ALT), "move_word_left"));
    assert(resolves_to(r, key(NamedKey::Backspace, MOD_ALT), "delete_word_backward"));
    assert(resolves_to(r, key(NamedKey::Home, MOD_SUPER), "move_document_start"));
    Resolution res = r.resolve(key(NamedKey::Left, MOD_SUPER));
    assert(res.binding && res.binding->platform == Platform::MacOS);
  }
  {
    // unbound printable keys become text, everything else is unhandled
    ShortcutResolver r(Platform::Linux);
    Resolution res = r.resolve(ch(U'a'));
    assert(res.kind == Resolution::Kind::Character && res.command.ch == U'a');
    res = r.resolve(ch(U'A', MOD_SHIFT));
    assert(res.kind == Resolution::Kind::Character && res.command.ch == U'A');
    res = r.resolve(ch(0x4E16));
    assert(res.kind == Resolution::Kind::Character && res.command.ch == 0x4E16);
    res = r.resolve(key(NamedKey::Enter));
    assert(res.kind == Resolution::Kind::Character && res.command.ch == U'\n');
    res = r.resolve(key(NamedKey::Tab));
    assert(res.kind == Resolution::Kind::Character && res.command.ch == U'\t');
    res = r.resolve(ch(U' '));
    assert(res.kind == Resolution::Kind::Character && res.command.ch == U' ');
    assert(r.resolve(key(NamedKey::F5)).kind == Resolution::Kind::Unhandled);
    assert(r.resolve(ch(U'q', MOD_CONTROL)).kind == Resolution::Kind::Unhandled);
    assert(r.resolve(key(NamedKey::Enter, MOD_CONTROL)).kind == Resolution::Kind::Unhandled);
  }
  {
    // runtime rebinding
    ShortcutResolver r(Platform::Linux);
    assert(r.bind("primary+q", "select_all", "Select everything"));
    assert(resolves_to(r, ch(U'q', MOD_CONTROL), "select_all"));
    assert(r.bind("primary+z", "redo"));
    assert(resolves_to(r, ch(U'z', MOD_CONTROL), "redo"));
    assert(!r.bind("primary+z", "no_such_command"));
    assert(!r.bind("bogus+z", "undo"));
    assert(r.unbind("primary+q"));
    assert(!r.unbind("primary+q"));
    assert(r.resolve(ch(U'q', MOD_CONTROL)).kind == Resolution::Kind::Unhandled);
    // a linux-only override on top of a portable binding
    assert(r.bind("ctrl+left", "move_line_start", "", Platform::Linux));
    assert(resolves_to(r, key(NamedKey::Left, MOD_CONTROL), "move_line_start"));
    assert(r.unbind("ctrl+left", Platform::Linux));
    assert(resolves_to(r, key(NamedKey::Left, MOD_CONTROL), "move_word_left"));

    bool found = false;
    for (const auto& b : r.bindings()) {
      if (chord_to_string(b.chord) == "primary+a") {
        found = true;
        assert(b.description == "Select all");
        assert(!b.platform);
      }
    }
    assert(found);
    r.clear();
    assert(r.bindings().empty());
    assert(r.resolve(ch(U'z', MOD_CONTROL)).kind == Resolution::Kind::Unhandled);
    r.load_defaults();
    assert(resolves_to(r, ch(U'z', MOD_CONTROL), "undo"));
  }
  {
    // conventions are data: make alt the primary modifier on linux
    ShortcutResolver r(Platform::Linux);
    r.set_conventions({{Platform::Linux, MOD_ALT}});
    assert(resolves_to(r, ch(U'z', MOD_ALT), "undo"));
    assert(r.resolve(ch(U'z', MOD_CONTROL)).kind == Resolution::Kind::Unhandled);
    assert(r.normalize(Modifiers{MOD_ALT | MOD_SHIFT}) == (Modifiers{MOD_PRIMARY | MOD_SHIFT}));
  }
  {
    // a physical chord and its primary spelling collide on linux: the later bind wins
    ShortcutResolver r(Platform::Linux);
    for (char32_t k : std::u32string(U"qwertyuiopjbn")) {
      std::string letter(1, static_cast<char>(k));
      assert(r.bind("primary+" + letter, "undo"));
      assert(r.bind("ctrl+" + letter, "redo"));
      assert(resolves_to(r, ch(k, MOD_CONTROL), "redo"));
      assert(r.bind("primary+" + letter, "select_all"));
      assert(resolves_to(r, ch(k, MOD_CONTROL), "select_all"));
      assert(r.unbind("primary+" + letter));
      assert(resolves_to(r, ch(k, MOD_CONTROL), "redo"));
    }
    // a platform override beats a later portable bind of the same chord
    assert(r.bind("ctrl+h", "undo", "", Platform::Linux));
    assert(r.bind("primary+h", "redo"));
    assert(resolves_to(r, ch(U'h', MOD_CONTROL), "undo"));
    // on mac ctrl is not the primary, so the two spellings stay apart
    r.set_platform(Platform::MacOS);
    assert(resolves_to(r, ch(U'q', MOD_CONTROL), "redo"));
    assert(r.resolve(ch(U'q', MOD_SUPER)).kind == Resolution::Kind::Unhandled);
  }
  return 0;
}
