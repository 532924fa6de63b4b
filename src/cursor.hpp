#pragma once
/*
 * CursorSelection
 *
 * Purpose: cursor position, optional selection and sticky column over TextBuffer coordinates.
 * Rule: never mutates text; after each buffer edit the owner calls remap() with the
 *       edit delta so positions follow the text they were pointing at.
 */
#include <optional>
#include "types.hpp"
#include "text_buffer.hpp"

/* one primitive buffer edit, described in pre-edit offsets */
struct EditDelta {
  enum Kind { Insert, Delete } kind;
  size_t offset;
  size_t length;
};

/*
 * insert at p: offsets >= p shift right by length.
 * delete [s,e): offsets inside collapse to s, offsets at or after e shift left.
 */
size_t map_offset(size_t offset, const EditDelta& d);

size_t next_word_boundary(const TextBuffer& buf, size_t offset);
size_t prev_word_boundary(const TextBuffer& buf, size_t offset);
size_t first_non_blank_column(const TextBuffer& buf, size_t line);

class CursorSelection {
public:
  struct Offsets {
    size_t position = 0;
    bool has_selection = false;
    size_t anchor = 0;
    size_t head = 0;
  };

  const Cursor& state() const { return cur_; }
  Position position() const { return cur_.position; }
  const std::optional<Selection>& selection() const { return cur_.selection; }
  /* present and non-empty */
  bool has_selection() const { return cur_.selection && !cur_.selection->empty(); }
  bool selecting() const { return selecting_; }

  void restore(const Cursor& c);
  void reset();

  EditStatus set_position(const TextBuffer& buf, Position p, bool extend);
  void move(const TextBuffer& buf, Movement m, bool extend, size_t page_lines);

  void start_selection();
  void end_selection();
  void clear_selection();
  void select_all(const TextBuffer& buf);
  void select_line(const TextBuffer& buf);
  EditStatus select_word(const TextBuffer& buf);
  /* anchor at start, head (and cursor) at end */
  EditStatus select_range(const TextBuffer& buf, size_t start, size_t end);

  Offsets offsets(const TextBuffer& buf) const;
  void remap(const TextBuffer& after, const Offsets& before, const EditDelta& d);

private:
  void place(Position from, Position to, bool extend);

  Cursor cur_;
  bool selecting_ = false;
};
