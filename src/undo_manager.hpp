#pragma once
/*
 * UndoManager
 *
 * Purpose: history of committed edits with cursor snapshots; drives undo/redo.
 * Design: an entry is a group of primitive ops plus the cursor before/after.
 *         Consecutive single-char typing / backspace / forward delete merge into
 *         one entry until the session is sealed.
 */
#include <cstdint>
#include <vector>
#include <deque>
#include <string>
#include "types.hpp"
#include "config.hpp"
#include "text_buffer.hpp"

struct Operation {
  enum Type { Insert, Delete } type;
  size_t offset;
  std::u32string text; /* inserted or deleted characters */

  Operation inverse() const { return {type == Insert ? Delete : Insert, offset, text}; }
  EditStatus apply(TextBuffer& buf) const;
  bool operator==(const Operation&) const = default;
};

/* applies ops in order; on failure the already-applied ones are rolled back */
EditStatus apply_operations(TextBuffer& buf, const std::vector<Operation>& ops);

/* which coalescing session an entry belongs to; Other never merges */
enum class EditKind { Typing, DeleteBackward, DeleteForward, Other };

struct UndoEntry {
  std::vector<Operation> ops; /* forward order */
  Cursor pre;
  Cursor post;
  EditKind kind = EditKind::Other;
  uint64_t id = 0;

  std::vector<Operation> forward() const { return ops; }
  std::vector<Operation> inverse() const;
};

class UndoManager {
public:
  explicit UndoManager(size_t max_depth = HEDIT_UNDO_DEPTH);

  void begin_group(const Cursor& pre, EditKind kind = EditKind::Other);
  void push_op(const Operation& op);
  void commit_group(const Cursor& post);
  void abort_group();
  /* end the current coalescing session */
  void seal() { open_ = false; }
  void clear();

  bool can_undo() const;
  bool can_redo() const;
  size_t undo_size() const { return undo_entries_.size(); }
  size_t redo_size() const { return redo_entries_.size(); }
  const UndoEntry* last_entry() const;
  size_t max_depth() const { return max_depth_; }
  /* names the text state the history stands at: the id of the newest undo
     entry, or of the last evicted one once the stack runs empty */
  uint64_t state_id() const { return undo_entries_.empty() ? base_id_ : undo_entries_.back().id; }
  void set_max_depth(size_t depth);

  EditStatus undo(TextBuffer& buf, Cursor& cur);
  EditStatus redo(TextBuffer& buf, Cursor& cur);

private:
  bool can_merge(const UndoEntry& last, const UndoEntry& next) const;
  void evict();

  std::deque<UndoEntry> undo_entries_;
  std::vector<UndoEntry> redo_entries_;
  bool grouping_ = false;
  bool open_ = false; /* last undo entry may still absorb coalescable edits */
  UndoEntry current_;
  size_t max_depth_;
  uint64_t next_id_ = 0;
  uint64_t base_id_ = 0;
};
