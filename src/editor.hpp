#pragma once
/*
 * Editor
 *
 * Purpose: command dispatcher. Owns TextBuffer, CursorSelection, UndoManager and
 *          the ShortcutResolver; applies one command at a time and notifies listeners.
 * Rules:
 *   - a command fully commits (text + cursor + history) or leaves no trace;
 *   - listeners run synchronously after commit, in registration order;
 *   - dispatch from inside a listener is rejected with EditStatus::Busy.
 */
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "types.hpp"
#include "config.hpp"
#include "text_buffer.hpp"
#include "cursor.hpp"
#include "undo_manager.hpp"
#include "commands.hpp"
#include "shortcut_resolver.hpp"
#include "clipboard.hpp"

struct EditorOptions {
  size_t undo_depth = HEDIT_UNDO_DEPTH;
  size_t page_lines = HEDIT_PAGE_LINES;
  Platform platform = Platform::Linux;
};

struct EditorEvent {
  enum class Type { TextChanged, CursorMoved, SelectionChanged, StatusMessage };
  Type type = Type::TextChanged;
  Position position;                  /* CursorMoved */
  std::optional<Selection> selection; /* SelectionChanged */
  std::string message;                /* StatusMessage */
};

struct SearchMatch {
  size_t offset = 0;
  Position position;
  size_t length = 0;
  bool operator==(const SearchMatch&) const = default;
};

class Editor {
public:
  using Listener = std::function<void(const EditorEvent&)>;
  using ListenerId = size_t;

  explicit Editor(EditorOptions opts = {});
  explicit Editor(std::string_view text, EditorOptions opts = {});

  EditStatus dispatch(const Command& cmd);
  /* Unhandled when the key maps to neither a binding nor a character */
  EditStatus handle_key(const KeyEvent& ev);

  ListenerId add_listener(Listener l);
  bool remove_listener(ListenerId id);

  const TextBuffer& buffer() const { return buffer_; }
  std::string text() const { return buffer_.text(); }
  const CursorSelection& cursor() const { return cursor_; }
  const UndoManager& history() const { return history_; }
  ShortcutResolver& shortcuts() { return shortcuts_; }
  const ShortcutResolver& shortcuts() const { return shortcuts_; }
  const std::string& message() const { return message_; }
  std::string selected_text() const;

  /* true unless undo/redo lands back on the state of the last mark_saved() */
  bool modified() const { return history_.state_id() != saved_state_; }
  void mark_saved();

  /* not owned; nullptr disables cut/copy/paste */
  void set_clipboard(IClipboard* clipboard) { clipboard_ = clipboard; }

  const std::optional<SearchMatch>& current_match() const { return current_match_; }
  std::vector<SearchMatch> find_all(std::string_view pattern) const;

  /* replaces the whole content; resets cursor and history (not undoable) */
  EditStatus set_text(std::string_view utf8);

  const EditorOptions& options() const { return options_; }
  void set_options(const EditorOptions& opts);

private:
  struct DispatchGuard {
    explicit DispatchGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~DispatchGuard() { flag_ = false; }
    bool& flag_;
  };

  EditStatus execute(const Command& cmd);
  EditStatus apply_edit(const std::vector<Operation>& ops, EditKind kind,
                        const std::function<void()>& place = nullptr);
  EditStatus insert_chars(const std::u32string& text, EditKind kind);
  EditStatus delete_range(size_t start, size_t end, EditKind kind);
  EditStatus delete_selection();
  EditStatus delete_line();
  EditStatus delete_to_line_end();
  EditStatus copy_selection();
  EditStatus paste();
  EditStatus find(const std::string& pattern);
  EditStatus find_next(const std::string& pattern);
  EditStatus find_previous(const std::string& pattern);
  EditStatus replace(const std::string& pattern, const std::string& with);
  EditStatus replace_all(const std::string& pattern, const std::string& with);
  EditStatus undo();
  EditStatus redo();

  /* start of the selection, or the cursor when there is none */
  size_t search_origin() const;
  void select_match(size_t offset, size_t length);
  void set_message(std::string msg);
  void notify(const Cursor& before);

  EditorOptions options_;
  TextBuffer buffer_;
  CursorSelection cursor_;
  UndoManager history_;
  ShortcutResolver shortcuts_;
  IClipboard* clipboard_ = nullptr;

  std::vector<std::pair<ListenerId, Listener>> listeners_;
  ListenerId next_listener_id_ = 1;
  bool dispatching_ = false;

  std::string message_;
  bool message_pending_ = false;
  bool text_changed_ = false;
  uint64_t saved_state_ = 0;
  std::string last_pattern_;
  std::optional<SearchMatch> current_match_;
};
