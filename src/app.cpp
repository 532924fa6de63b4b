#include "app.hpp"
#include <system_error>
#include "file_io.hpp"
#include "utf8.hpp"

App::App(ITerminal& term, IKeySource& keys, EditorOptions opts)
    : term_(term), keys_(keys), ed_(opts), settings_(ed_) {
  ed_.set_clipboard(&clipboard_);
  listener_ = ed_.add_listener([this](const EditorEvent& ev) {
    if (ev.type == EditorEvent::Type::StatusMessage) note_ = ev.message;
    else if (ev.type == EditorEvent::Type::TextChanged) quit_armed_ = false;
  });
}

App::~App() {
  ed_.set_clipboard(nullptr);
  ed_.remove_listener(listener_);
}

std::string App::file_label() const {
  return path_ ? path_->string() : std::string();
}

bool App::open(const std::filesystem::path& path) {
  std::error_code ec;
  path_ = path;
  if (!std::filesystem::exists(path, ec)) {
    if (ed_.set_text("") != EditStatus::Ok) { note_ = "editor busy"; return false; }
    note_ = "new file: " + path.string();
    return true;
  }
  std::string text, msg;
  if (!read_text_file(path, text, msg)) { note_ = msg; return false; }
  if (ed_.set_text(text) != EditStatus::Ok) { note_ = "editor busy"; return false; }
  note_ = msg;
  return true;
}

bool App::save() {
  if (!path_) { note_ = "no file name"; return false; }
  std::string msg;
  bool ok = write_text_file(*path_, ed_.text(), msg);
  if (ok) ed_.mark_saved();
  note_ = msg;
  return ok;
}

void App::load_rc() {
  auto p = Settings::default_rc_path();
  std::error_code ec;
  if (!p || !std::filesystem::exists(*p, ec)) return;
  load_rc(*p);
}

bool App::load_rc(const std::filesystem::path& path) {
  std::vector<std::string> errors;
  std::string msg;
  if (!settings_.load_file(path, errors, msg)) { note_ = msg; return false; }
  note_ = errors.empty() ? msg : errors.front();
  return errors.empty();
}

App::HostAction App::host_action(const KeyEvent& ev) const {
  static constexpr struct { const char* chord; HostAction action; } kHostKeys[] = {
    {"primary+s", HostAction::Save}, {"primary+q", HostAction::Quit}, {"primary+f", HostAction::FindPrompt},
  };
  Chord pressed = Chord::from_event(ev);
  pressed.mods = ed_.shortcuts().normalize(pressed.mods);
  for (const auto& h : kHostKeys) {
    Chord c;
    if (parse_chord(h.chord, c) && c == pressed) return h.action;
  }
  return HostAction::None;
}

void App::handle_prompt_key(const KeyEvent& ev) {
  if (ev.key.named == NamedKey::Escape) {
    prompting_ = false;
    note_.clear();
    return;
  }
  if (ev.key.named == NamedKey::Enter) {
    prompting_ = false;
    note_.clear();
    if (prompt_.empty()) return;
    if (ed_.dispatch(Command::find(prompt_)) == EditStatus::Ok) note_ = "found: " + prompt_;
    return;
  }
  if (ev.key.named == NamedKey::Backspace) {
    std::u32string chars = utf8_decode(prompt_);
    if (!chars.empty()) chars.pop_back();
    prompt_ = utf8_encode(chars);
  } else if (ev.key.named == NamedKey::Space) {
    prompt_ += ' ';
  } else if (ev.key.is_character() && ev.mods.without(MOD_SHIFT).empty() && is_printable(ev.key.ch)) {
    utf8_append(prompt_, ev.key.ch);
  }
  note_ = "find: " + prompt_;
}

bool App::handle_key(const KeyEvent& ev) {
  if (ev.key.is_character() && ev.key.ch == 0) return !quit_; /* resize: just redraw */
  if (prompting_) { handle_prompt_key(ev); return true; }
  switch (host_action(ev)) {
    case HostAction::Save:
      /* a failed save keeps the quit confirmation armed */
      if (save()) quit_armed_ = false;
      return true;
    case HostAction::Quit:
      if (ed_.modified() && !quit_armed_) {
        quit_armed_ = true;
        note_ = "unsaved changes; press again to quit";
        return true;
      }
      quit_ = true;
      return false;
    case HostAction::FindPrompt:
      prompting_ = true;
      prompt_.clear();
      note_ = "find: ";
      return true;
    case HostAction::None:
      break;
  }
  quit_armed_ = false;
  EditStatus st = ed_.handle_key(ev);
  if (st == EditStatus::Ok || st == EditStatus::Unhandled) return true;
  note_ = ed_.message().empty() ? std::string(status_name(st)) : ed_.message();
  return true;
}

void App::render() {
  renderer_.render(term_, ed_, vp_, file_label(), note_);
}

void App::run() {
  render();
  while (!quit_) {
    std::optional<KeyEvent> ev = keys_.next_key();
    if (!ev) break;
    if (!handle_key(*ev)) break;
    render();
  }
}
