#include "undo_manager.hpp"
#include <algorithm>

EditStatus Operation::apply(TextBuffer& buf) const {
  if (type == Insert) return buf.insert(offset, text);
  if (buf.slice(offset, offset + text.size()) != text) return EditStatus::InvalidRange;
  return buf.erase(offset, offset + text.size());
}

std::vector<Operation> UndoEntry::inverse() const {
  std::vector<Operation> inv;
  inv.reserve(ops.size());
  for (auto it = ops.rbegin(); it != ops.rend(); ++it) inv.push_back(it->inverse());
  return inv;
}

EditStatus apply_operations(TextBuffer& buf, const std::vector<Operation>& ops) {
  for (size_t i = 0; i < ops.size(); ++i) {
    EditStatus st = ops[i].apply(buf);
    if (st == EditStatus::Ok) continue;
    for (size_t k = i; k-- > 0;) {
      if (ops[k].inverse().apply(buf) != EditStatus::Ok) break;
    }
    return st;
  }
  return EditStatus::Ok;
}

UndoManager::UndoManager(size_t max_depth) : max_depth_(std::max<size_t>(1, max_depth)) {}

void UndoManager::begin_group(const Cursor& pre, EditKind kind) {
  if (!grouping_) {
    grouping_ = true;
    current_.ops.clear();
    current_.pre = pre;
    current_.kind = kind;
  }
}

void UndoManager::push_op(const Operation& op) {
  if (grouping_) {
    current_.ops.push_back(op);
  }
}

void UndoManager::commit_group(const Cursor& post) {
  if (!grouping_) return;
  grouping_ = false;
  current_.post = post;
  if (current_.ops.empty()) return;
  redo_entries_.clear();
  if (open_ && !undo_entries_.empty() && can_merge(undo_entries_.back(), current_)) {
    UndoEntry& last = undo_entries_.back();
    last.ops.insert(last.ops.end(), current_.ops.begin(), current_.ops.end());
    last.post = current_.post;
  } else {
    current_.id = ++next_id_;
    undo_entries_.push_back(current_);
    evict();
  }
  open_ = current_.kind != EditKind::Other;
  current_.ops.clear();
}

void UndoManager::abort_group() {
  grouping_ = false;
  current_.ops.clear();
}

void UndoManager::clear() {
  base_id_ = 0;
  undo_entries_.clear();
  redo_entries_.clear();
  grouping_ = false;
  open_ = false;
  current_.ops.clear();
}

bool UndoManager::can_undo() const { return !undo_entries_.empty(); }
bool UndoManager::can_redo() const { return !redo_entries_.empty(); }

const UndoEntry* UndoManager::last_entry() const {
  return undo_entries_.empty() ? nullptr : &undo_entries_.back();
}

void UndoManager::set_max_depth(size_t depth) {
  max_depth_ = std::max<size_t>(1, depth);
  evict();
}

void UndoManager::evict() {
  while (undo_entries_.size() > max_depth_) {
    base_id_ = undo_entries_.front().id;
    undo_entries_.pop_front();
  }
}

/* next must be one single-char op continuing the previous op in the same direction */
bool UndoManager::can_merge(const UndoEntry& last, const UndoEntry& next) const {
  if (last.kind != next.kind || last.kind == EditKind::Other) return false;
  if (next.ops.size() != 1 || last.ops.empty()) return false;
  const Operation& prev = last.ops.back();
  const Operation& op = next.ops.front();
  if (op.text.size() != 1 || prev.type != op.type) return false;
  switch (last.kind) {
    case EditKind::Typing: return op.type == Operation::Insert && op.offset == prev.offset + prev.text.size();
    case EditKind::DeleteBackward: return op.type == Operation::Delete && op.offset + 1 == prev.offset;
    case EditKind::DeleteForward: return op.type == Operation::Delete && op.offset == prev.offset;
    case EditKind::Other: return false;
  }
  return false;
}

EditStatus UndoManager::undo(TextBuffer& buf, Cursor& cur) {
  open_ = false;
  if (undo_entries_.empty()) return EditStatus::NothingToUndo;
  if (EditStatus st = apply_operations(buf, undo_entries_.back().inverse()); st != EditStatus::Ok) return st;
  UndoEntry e = std::move(undo_entries_.back());
  undo_entries_.pop_back();
  cur = e.pre;
  redo_entries_.push_back(std::move(e));
  return EditStatus::Ok;
}

EditStatus UndoManager::redo(TextBuffer& buf, Cursor& cur) {
  open_ = false;
  if (redo_entries_.empty()) return EditStatus::NothingToRedo;
  if (EditStatus st = apply_operations(buf, redo_entries_.back().forward()); st != EditStatus::Ok) return st;
  UndoEntry e = std::move(redo_entries_.back());
  redo_entries_.pop_back();
  cur = e.post;
  undo_entries_.push_back(std::move(e));
  evict();
  return EditStatus::Ok;
}
