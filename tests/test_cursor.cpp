#include "cursor.hpp"
#include <cassert>

static Position pos(size_t l, size_t c) { return Position{l, c}; }

int main() {
  // offset remapping through edits
  assert(map_offset(5, {EditDelta::Insert, 2, 3}) == 8);
  assert(map_offset(2, {EditDelta::Insert, 2, 3}) == 5);
  assert(map_offset(1, {EditDelta::Insert, 2, 3}) == 1);
  assert(map_offset(1, {EditDelta::Delete, 2, 3}) == 1);
  assert(map_offset(3, {EditDelta::Delete, 2, 3}) == 2);
  assert(map_offset(5, {EditDelta::Delete, 2, 3}) == 2);
  assert(map_offset(7, {EditDelta::Delete, 2, 3}) == 4);

  {
    // horizontal moves cross line ends
    TextBuffer b("ab\ncd");
    CursorSelection c;
    assert(c.set_position(b, pos(1, 0), false) == EditStatus::Ok);
    c.move(b, Movement::Left, false, 20);
    assert(c.position() == pos(0, 2));
    assert(c.state().sticky_column == 2);
    c.move(b, Movement::Right, false, 20);
    assert(c.position() == pos(1, 0));
    c.move(b, Movement::DocumentEnd, false, 20);
    c.move(b, Movement::Right, false, 20);
    assert(c.position() == pos(1, 2));
    c.move(b, Movement::DocumentStart, false, 20);
    c.move(b, Movement::Left, false, 20);
    assert(c.position() == pos(0, 0));
    assert(c.set_position(b, pos(0, 3), false) == EditStatus::OutOfBounds);
    assert(c.set_position(b, pos(2, 0), false) == EditStatus::OutOfBounds);
    assert(c.position() == pos(0, 0));
  }
  {
    // sticky column survives a short line
    TextBuffer b("long line\nab\nlonger line");
    CursorSelection c;
    assert(c.set_position(b, pos(0, 7), false) == EditStatus::Ok);
    c.move(b, Movement::Down, false, 20);
    assert(c.position() == pos(1, 2));
    assert(c.state().sticky_column == 7);
    c.move(b, Movement::Down, false, 20);
    assert(c.position() == pos(2, 7));
    c.move(b, Movement::Down, false, 20);
    assert(c.position() == pos(2, 7));
    c.move(b, Movement::Up, false, 20);
    c.move(b, Movement::Up, false, 20);
    c.move(b, Movement::Up, false, 20);
    assert(c.position() == pos(0, 7));
    c.move(b, Movement::PageDown, false, 20);
    assert(c.position() == pos(2, 7));
    c.move(b, Movement::PageUp, false, 1);
    assert(c.position() == pos(1, 2));
  }
  {
    // word movement stops at every class change
    TextBuffer b("foo bar.baz");
    CursorSelection c;
    c.move(b, Movement::WordRight, false, 20);
    assert(c.position() == pos(0, 3));
    c.move(b, Movement::WordRight, false, 20);
    assert(c.position() == pos(0, 4));
    c.move(b, Movement::WordRight, false, 20);
    assert(c.position() == pos(0, 7));
    c.move(b, Movement::WordRight, false, 20);
    assert(c.position() == pos(0, 8));
    c.move(b, Movement::WordRight, false, 20);
    assert(c.position() == pos(0, 11));
    c.move(b, Movement::WordLeft, false, 20);
    assert(c.position() == pos(0, 8));
    c.move(b, Movement::WordLeft, false, 20);
    assert(c.position() == pos(0, 7));
    assert(next_word_boundary(b, 11) == 11);
    assert(prev_word_boundary(b, 0) == 0);
  }
  {
    // home toggles between column 0 and the first non-blank
    TextBuffer b("    x = 1;\n\n   ");
    CursorSelection c;
    assert(first_non_blank_column(b, 0) == 4);
    assert(c.set_position(b, pos(0, 6), false) == EditStatus::Ok);
    c.move(b, Movement::LineStart, false, 20);
    assert(c.position() == pos(0, 0));
    c.move(b, Movement::LineStart, false, 20);
    assert(c.position() == pos(0, 4));
    c.move(b, Movement::LineStart, false, 20);
    assert(c.position() == pos(0, 0));
    c.move(b, Movement::LineEnd, false, 20);
    assert(c.position() == pos(0, 10));
    // all-blank line: no soft home
    assert(c.set_position(b, pos(2, 0), false) == EditStatus::Ok);
    c.move(b, Movement::LineStart, false, 20);
    assert(c.position() == pos(2, 0));
  }
  {
    // extend keeps the anchor, a plain move drops the selection
    TextBuffer b("hello\nworld");
    CursorSelection c;
    c.move(b, Movement::Right, true, 20);
    c.move(b, Movement::Down, true, 20);
    assert(c.has_selection());
    assert(c.selection()->anchor == pos(0, 0));
    assert(c.selection()->head == pos(1, 1));
    c.move(b, Movement::Right, false, 20);
    assert(!c.selection());
    assert(c.position() == pos(1, 2));

    c.start_selection();
    assert(c.selecting());
    c.move(b, Movement::Right, false, 20);
    c.move(b, Movement::Right, false, 20);
    assert(c.selection()->anchor == pos(1, 2));
    assert(c.selection()->head == pos(1, 4));
    c.end_selection();
    assert(!c.selecting());
    assert(c.selection()->head == pos(1, 4));
    c.clear_selection();
    assert(!c.selection());
  }
  {
    TextBuffer b("fn main() {\n    println!(\"Hi\");\n}");
    CursorSelection c;
    assert(c.set_position(b, pos(1, 3), false) == EditStatus::Ok);
    c.select_line(b);
    assert(c.selection()->anchor == pos(1, 0));
    assert(c.selection()->head == pos(2, 0));
    assert(c.set_position(b, pos(2, 0), false) == EditStatus::Ok);
    c.select_line(b);
    assert(c.selection()->head == pos(2, 1));
    c.select_all(b);
    assert(c.selection()->anchor == pos(0, 0));
    assert(c.selection()->head == pos(2, 1));
  }
  {
    TextBuffer b("hello world\n\nfoo.bar");
    CursorSelection c;
    assert(c.set_position(b, pos(0, 7), false) == EditStatus::Ok);
    assert(c.select_word(b) == EditStatus::Ok);
    assert(c.selection()->start() == pos(0, 6));
    assert(c.selection()->end() == pos(0, 11));
    // just past a word picks that word
    assert(c.set_position(b, pos(0, 5), false) == EditStatus::Ok);
    assert(c.select_word(b) == EditStatus::Ok);
    assert(c.selection()->start() == pos(0, 0));
    assert(c.selection()->end() == pos(0, 5));
    assert(c.set_position(b, pos(2, 4), false) == EditStatus::Ok);
    assert(c.select_word(b) == EditStatus::Ok);
    assert(c.selection()->start() == pos(2, 4));
    assert(c.selection()->end() == pos(2, 7));
    assert(c.set_position(b, pos(1, 0), false) == EditStatus::Ok);
    assert(c.select_word(b) == EditStatus::NoSelection);
    assert(!c.selection());
    assert(c.select_range(b, 3, 1) == EditStatus::InvalidRange);
  }
  {
    // remap follows the text the cursor pointed at
    TextBuffer b("abcdef");
    CursorSelection c;
    assert(c.select_range(b, 1, 4) == EditStatus::Ok);
    CursorSelection::Offsets before = c.offsets(b);
    assert(b.insert(0, U"xy") == EditStatus::Ok);
    c.remap(b, before, {EditDelta::Insert, 0, 2});
    assert(c.selection()->anchor == pos(0, 3));
    assert(c.selection()->head == pos(0, 6));
    assert(c.position() == pos(0, 6));
    before = c.offsets(b);
    assert(b.erase(2, 7) == EditStatus::Ok);
    c.remap(b, before, {EditDelta::Delete, 2, 5});
    assert(c.selection()->anchor == pos(0, 2));
    assert(c.position() == pos(0, 2));
    assert(b.text() == "xyf");
  }
  return 0;
}
