#include "editor.hpp"
#include <algorithm>
#include "search.hpp"
#include "utf8.hpp"

Editor::Editor(EditorOptions opts)
    : options_(opts), history_(opts.undo_depth), shortcuts_(opts.platform) {}

Editor::Editor(std::string_view text, EditorOptions opts) : Editor(opts) {
  buffer_.set_text(text);
}

void Editor::set_options(const EditorOptions& opts) {
  options_ = opts;
  history_.set_max_depth(opts.undo_depth);
  shortcuts_.set_platform(opts.platform);
}

void Editor::mark_saved() {
  /* later typing must not merge into the saved entry */
  history_.seal();
  saved_state_ = history_.state_id();
}

Editor::ListenerId Editor::add_listener(Listener l) {
  ListenerId id = next_listener_id_++;
  listeners_.emplace_back(id, std::move(l));
  return id;
}

bool Editor::remove_listener(ListenerId id) {
  auto it = std::find_if(listeners_.begin(), listeners_.end(), [&](const auto& e){ return e.first == id; });
  if (it == listeners_.end()) return false;
  listeners_.erase(it);
  return true;
}

void Editor::set_message(std::string msg) {
  message_ = std::move(msg);
  message_pending_ = true;
}

void Editor::notify(const Cursor& before) {
  std::vector<EditorEvent> events;
  const Cursor& now = cursor_.state();
  if (text_changed_) events.push_back(EditorEvent{EditorEvent::Type::TextChanged, now.position, now.selection, {}});
  if (now.position != before.position) {
    events.push_back(EditorEvent{EditorEvent::Type::CursorMoved, now.position, now.selection, {}});
  }
  if (now.selection != before.selection) {
    events.push_back(EditorEvent{EditorEvent::Type::SelectionChanged, now.position, now.selection, {}});
  }
  if (message_pending_) events.push_back(EditorEvent{EditorEvent::Type::StatusMessage, now.position, now.selection, message_});
  text_changed_ = false;
  message_pending_ = false;
  if (events.empty()) return;
  /* a listener may unregister itself while being called */
  auto snapshot = listeners_;
  for (const auto& ev : events) {
    for (const auto& [id, fn] : snapshot) fn(ev);
  }
}

EditStatus Editor::dispatch(const Command& cmd) {
  if (dispatching_) return EditStatus::Busy;
  DispatchGuard guard(dispatching_);
  Cursor before = cursor_.state();
  EditStatus st = execute(cmd);
  notify(before);
  return st;
}

EditStatus Editor::handle_key(const KeyEvent& ev) {
  if (dispatching_) return EditStatus::Busy;
  Resolution r = shortcuts_.resolve(ev);
  switch (r.kind) {
    case Resolution::Kind::Command: return dispatch(r.command);
    case Resolution::Kind::Character: return dispatch(Command::insert_char(r.command.ch));
    case Resolution::Kind::Unhandled: break;
  }
  return EditStatus::Unhandled;
}

EditStatus Editor::set_text(std::string_view utf8) {
  if (dispatching_) return EditStatus::Busy;
  DispatchGuard guard(dispatching_);
  Cursor before = cursor_.state();
  buffer_.set_text(utf8);
  cursor_.reset();
  history_.clear();
  current_match_.reset();
  saved_state_ = history_.state_id();
  text_changed_ = true;
  notify(before);
  return EditStatus::Ok;
}

EditStatus Editor::execute(const Command& cmd) {
  using T = Command::Type;
  if (!cmd.is_edit() && cmd.type != T::Undo && cmd.type != T::Redo) history_.seal();
  switch (cmd.type) {
    /* after the cursor leaves the match, find next/previous start from the cursor */
    case T::Move: case T::MoveTo:
    case T::StartSelection: case T::EndSelection:
    case T::SelectAll: case T::SelectLine: case T::SelectWord: case T::ClearSelection:
      current_match_.reset();
      break;
    default:
      break;
  }
  switch (cmd.type) {
    case T::InsertChar:
      return insert_chars(std::u32string(1, cmd.ch), EditKind::Typing);
    case T::InsertText:
      return insert_chars(utf8_decode(cmd.text), EditKind::Other);
    case T::DeleteBackward: {
      if (cursor_.has_selection()) return delete_selection();
      size_t pos = buffer_.clamped_offset(cursor_.position());
      if (pos == 0) return EditStatus::Ok;
      return delete_range(pos - 1, pos, EditKind::DeleteBackward);
    }
    case T::DeleteForward: {
      if (cursor_.has_selection()) return delete_selection();
      size_t pos = buffer_.clamped_offset(cursor_.position());
      if (pos == buffer_.length()) return EditStatus::Ok;
      return delete_range(pos, pos + 1, EditKind::DeleteForward);
    }
    case T::DeleteWordBackward: {
      size_t pos = buffer_.clamped_offset(cursor_.position());
      return delete_range(prev_word_boundary(buffer_, pos), pos, EditKind::Other);
    }
    case T::DeleteWordForward: {
      size_t pos = buffer_.clamped_offset(cursor_.position());
      return delete_range(pos, next_word_boundary(buffer_, pos), EditKind::Other);
    }
    case T::DeleteToLineEnd:
      return delete_to_line_end();
    case T::DeleteToLineStart: {
      size_t pos = buffer_.clamped_offset(cursor_.position());
      return delete_range(buffer_.line_start(cursor_.position().line), pos, EditKind::Other);
    }
    case T::DeleteLine:
      return delete_line();
    case T::DeleteSelection:
      if (!cursor_.has_selection()) { set_message("no selection"); return EditStatus::NoSelection; }
      return delete_selection();
    case T::Move:
      cursor_.move(buffer_, cmd.movement, cmd.extend, options_.page_lines);
      return EditStatus::Ok;
    case T::MoveTo:
      return cursor_.set_position(buffer_, buffer_.clamp(cmd.position), cmd.extend);
    case T::StartSelection: cursor_.start_selection(); return EditStatus::Ok;
    case T::EndSelection: cursor_.end_selection(); return EditStatus::Ok;
    case T::SelectAll: cursor_.select_all(buffer_); return EditStatus::Ok;
    case T::SelectLine: cursor_.select_line(buffer_); return EditStatus::Ok;
    case T::SelectWord: return cursor_.select_word(buffer_);
    case T::ClearSelection: cursor_.clear_selection(); return EditStatus::Ok;
    case T::Undo: return undo();
    case T::Redo: return redo();
    case T::Boundary: return EditStatus::Ok;
    case T::Copy: return copy_selection();
    case T::Cut: {
      EditStatus st = copy_selection();
      if (st != EditStatus::Ok) return st;
      return delete_selection();
    }
    case T::Paste: return paste();
    case T::Find: return find(cmd.text);
    case T::FindNext: return find_next(cmd.text);
    case T::FindPrevious: return find_previous(cmd.text);
    case T::Replace: return replace(cmd.text, cmd.replacement);
    case T::ReplaceAll: return replace_all(cmd.text, cmd.replacement);
  }
  return EditStatus::Unhandled;
}

/*
 * ops are applied in order, each described against the buffer left by the previous one.
 * The cursor follows every op; the selection is consumed by the edit.
 */
EditStatus Editor::apply_edit(const std::vector<Operation>& ops, EditKind kind, const std::function<void()>& place) {
  if (ops.empty()) return EditStatus::Ok;
  CursorSelection saved = cursor_;
  history_.begin_group(cursor_.state(), kind);
  for (size_t i = 0; i < ops.size(); ++i) {
    CursorSelection::Offsets before = cursor_.offsets(buffer_);
    EditStatus st = ops[i].apply(buffer_);
    if (st != EditStatus::Ok) {
      for (size_t k = i; k-- > 0;) {
        if (ops[k].inverse().apply(buffer_) != EditStatus::Ok) break;
      }
      history_.abort_group();
      cursor_ = saved;
      return st;
    }
    EditDelta d{ops[i].type == Operation::Insert ? EditDelta::Insert : EditDelta::Delete,
                ops[i].offset, ops[i].text.size()};
    cursor_.remap(buffer_, before, d);
    history_.push_op(ops[i]);
  }
  cursor_.clear_selection();
  if (place) place();
  history_.commit_group(cursor_.state());
  current_match_.reset();
  text_changed_ = true;
  return EditStatus::Ok;
}

EditStatus Editor::insert_chars(const std::u32string& text, EditKind kind) {
  std::vector<Operation> ops;
  if (cursor_.has_selection()) {
    CursorSelection::Offsets o = cursor_.offsets(buffer_);
    size_t s = std::min(o.anchor, o.head), e = std::max(o.anchor, o.head);
    ops.push_back(Operation{Operation::Delete, s, buffer_.slice(s, e)});
    if (!text.empty()) ops.push_back(Operation{Operation::Insert, s, text});
    return apply_edit(ops, EditKind::Other);
  }
  if (text.empty()) return EditStatus::Ok;
  size_t pos = buffer_.clamped_offset(cursor_.position());
  ops.push_back(Operation{Operation::Insert, pos, text});
  return apply_edit(ops, text.size() == 1 ? kind : EditKind::Other);
}

EditStatus Editor::delete_range(size_t start, size_t end, EditKind kind) {
  if (start > end || end > buffer_.length()) return EditStatus::InvalidRange;
  if (start == end) return EditStatus::Ok;
  return apply_edit({Operation{Operation::Delete, start, buffer_.slice(start, end)}}, kind);
}

EditStatus Editor::delete_selection() {
  if (!cursor_.has_selection()) return EditStatus::NoSelection;
  CursorSelection::Offsets o = cursor_.offsets(buffer_);
  return delete_range(std::min(o.anchor, o.head), std::max(o.anchor, o.head), EditKind::Other);
}

/* the line and its newline; the last line takes the newline before it */
EditStatus Editor::delete_line() {
  if (buffer_.empty()) return EditStatus::Ok;
  Position p = cursor_.position();
  size_t line = std::min(p.line, buffer_.line_count() - 1);
  size_t start = buffer_.line_start(line);
  size_t end = 0;
  if (line + 1 < buffer_.line_count()) {
    end = buffer_.line_start(line + 1);
  } else {
    end = buffer_.length();
    if (line > 0) start -= 1;
  }
  size_t target_line = line + 1 < buffer_.line_count() ? line : (line > 0 ? line - 1 : 0);
  return apply_edit({Operation{Operation::Delete, start, buffer_.slice(start, end)}}, EditKind::Other, [&]{
    Position at = buffer_.clamp(Position{target_line, p.column});
    cursor_.restore(Cursor{at, std::nullopt, at.column});
  });
}

/* at the end of a line the newline goes, joining the next line */
EditStatus Editor::delete_to_line_end() {
  Position p = cursor_.position();
  size_t pos = buffer_.clamped_offset(p);
  size_t eol = buffer_.line_start(p.line) + buffer_.line_length(p.line);
  if (pos == eol && pos < buffer_.length()) eol = pos + 1;
  return delete_range(pos, eol, EditKind::Other);
}

std::string Editor::selected_text() const {
  if (!cursor_.has_selection()) return {};
  CursorSelection::Offsets o = cursor_.offsets(buffer_);
  return utf8_encode(buffer_.slice(std::min(o.anchor, o.head), std::max(o.anchor, o.head)));
}

EditStatus Editor::copy_selection() {
  if (!cursor_.has_selection()) { set_message("no selection"); return EditStatus::NoSelection; }
  if (!clipboard_) { set_message("no clipboard"); return EditStatus::Unhandled; }
  clipboard_->set_text(selected_text());
  return EditStatus::Ok;
}

EditStatus Editor::paste() {
  if (!clipboard_) { set_message("no clipboard"); return EditStatus::Unhandled; }
  std::u32string text = utf8_decode(clipboard_->get_text());
  if (text.empty()) return EditStatus::Ok;
  return insert_chars(text, EditKind::Other);
}

EditStatus Editor::undo() {
  Cursor cur = cursor_.state();
  EditStatus st = history_.undo(buffer_, cur);
  if (st == EditStatus::NothingToUndo) { set_message("nothing to undo"); return st; }
  if (st != EditStatus::Ok) return st;
  cursor_.restore(cur);
  current_match_.reset();
  text_changed_ = true;
  return st;
}

EditStatus Editor::redo() {
  Cursor cur = cursor_.state();
  EditStatus st = history_.redo(buffer_, cur);
  if (st == EditStatus::NothingToRedo) { set_message("nothing to redo"); return st; }
  if (st != EditStatus::Ok) return st;
  cursor_.restore(cur);
  current_match_.reset();
  text_changed_ = true;
  return st;
}

size_t Editor::search_origin() const {
  CursorSelection::Offsets o = cursor_.offsets(buffer_);
  return o.has_selection ? std::min(o.anchor, o.head) : o.position;
}

void Editor::select_match(size_t offset, size_t length) {
  if (cursor_.select_range(buffer_, offset, offset + length) != EditStatus::Ok) return;
  current_match_ = SearchMatch{offset, buffer_.offset_to_position(offset), length};
}

EditStatus Editor::find(const std::string& pattern) {
  if (pattern.empty()) { set_message("empty search pattern"); return EditStatus::InvalidRange; }
  last_pattern_ = pattern;
  std::u32string pat = utf8_decode(pattern);
  std::u32string hay = buffer_.chars();
  auto hit = kmp_find_first_from(hay, pat, search_origin());
  if (!hit) hit = kmp_find_first_from(hay, pat, 0);
  if (!hit) {
    current_match_.reset();
    set_message("pattern not found: " + pattern);
    return EditStatus::NotFound;
  }
  select_match(*hit, pat.size());
  return EditStatus::Ok;
}

EditStatus Editor::find_next(const std::string& pattern) {
  if (!pattern.empty()) last_pattern_ = pattern;
  if (last_pattern_.empty()) { set_message("no previous search pattern"); return EditStatus::InvalidRange; }
  std::u32string pat = utf8_decode(last_pattern_);
  std::u32string hay = buffer_.chars();
  size_t from = current_match_ ? current_match_->offset + 1 : search_origin();
  auto hit = kmp_find_first_from(hay, pat, from);
  if (!hit) hit = kmp_find_first_from(hay, pat, 0);
  if (!hit) {
    current_match_.reset();
    set_message("pattern not found: " + last_pattern_);
    return EditStatus::NotFound;
  }
  select_match(*hit, pat.size());
  return EditStatus::Ok;
}

EditStatus Editor::find_previous(const std::string& pattern) {
  if (!pattern.empty()) last_pattern_ = pattern;
  if (last_pattern_.empty()) { set_message("no previous search pattern"); return EditStatus::InvalidRange; }
  std::u32string pat = utf8_decode(last_pattern_);
  std::u32string hay = buffer_.chars();
  size_t before = current_match_ ? current_match_->offset : search_origin();
  auto hit = kmp_find_last_before(hay, pat, before);
  if (!hit) hit = kmp_find_last_before(hay, pat, hay.size() + 1);
  if (!hit) {
    current_match_.reset();
    set_message("pattern not found: " + last_pattern_);
    return EditStatus::NotFound;
  }
  select_match(*hit, pat.size());
  return EditStatus::Ok;
}

std::vector<SearchMatch> Editor::find_all(std::string_view pattern) const {
  std::vector<SearchMatch> out;
  std::u32string pat = utf8_decode(pattern);
  std::vector<size_t> hits;
  kmp_find_all(buffer_.chars(), pat, hits);
  out.reserve(hits.size());
  for (size_t h : hits) out.push_back(SearchMatch{h, buffer_.offset_to_position(h), pat.size()});
  return out;
}

EditStatus Editor::replace(const std::string& pattern, const std::string& with) {
  if (pattern.empty()) { set_message("empty search pattern"); return EditStatus::InvalidRange; }
  last_pattern_ = pattern;
  std::u32string pat = utf8_decode(pattern);
  std::u32string rep = utf8_decode(with);
  std::u32string hay = buffer_.chars();
  auto hit = kmp_find_first_from(hay, pat, search_origin());
  if (!hit) hit = kmp_find_first_from(hay, pat, 0);
  if (!hit) { set_message("pattern not found: " + pattern); return EditStatus::NotFound; }
  size_t at = *hit;
  std::vector<Operation> ops{Operation{Operation::Delete, at, pat}};
  if (!rep.empty()) ops.push_back(Operation{Operation::Insert, at, rep});
  return apply_edit(ops, EditKind::Other, [&]{
    Position after = buffer_.offset_to_position(at + rep.size());
    cursor_.restore(Cursor{after, std::nullopt, after.column});
  });
}

/* one history entry per replacement; offsets are searched again after every edit */
EditStatus Editor::replace_all(const std::string& pattern, const std::string& with) {
  if (pattern.empty()) { set_message("empty search pattern"); return EditStatus::InvalidRange; }
  last_pattern_ = pattern;
  std::u32string pat = utf8_decode(pattern);
  std::u32string rep = utf8_decode(with);
  size_t count = 0;
  size_t from = 0;
  while (auto hit = kmp_find_first_from(buffer_.chars(), pat, from)) {
    size_t at = *hit;
    std::vector<Operation> ops{Operation{Operation::Delete, at, pat}};
    if (!rep.empty()) ops.push_back(Operation{Operation::Insert, at, rep});
    if (EditStatus st = apply_edit(ops, EditKind::Other); st != EditStatus::Ok) {
      set_message("replace failed after " + std::to_string(count) + " replacements");
      return st;
    }
    ++count;
    from = at + rep.size();
  }
  if (count == 0) { set_message("pattern not found: " + pattern); return EditStatus::NotFound; }
  set_message(std::to_string(count) + (count == 1 ? " replacement" : " replacements"));
  return EditStatus::Ok;
}
