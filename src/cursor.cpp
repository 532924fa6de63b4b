#include "cursor.hpp"
#include <algorithm>
#include "utf8.hpp"

size_t map_offset(size_t offset, const EditDelta& d) {
  if (d.kind == EditDelta::Insert) {
    return offset >= d.offset ? offset + d.length : offset;
  }
  size_t end = d.offset + d.length;
  if (offset < d.offset) return offset;
  if (offset < end) return d.offset;
  return offset - d.length;
}

size_t next_word_boundary(const TextBuffer& buf, size_t offset) {
  size_t len = buf.length();
  if (offset >= len) return len;
  CharClass c = char_class(buf.char_at(offset));
  while (offset < len && char_class(buf.char_at(offset)) == c) ++offset;
  return offset;
}

size_t prev_word_boundary(const TextBuffer& buf, size_t offset) {
  offset = std::min(offset, buf.length());
  if (offset == 0) return 0;
  CharClass c = char_class(buf.char_at(offset - 1));
  while (offset > 0 && char_class(buf.char_at(offset - 1)) == c) --offset;
  return offset;
}

size_t first_non_blank_column(const TextBuffer& buf, size_t line) {
  std::u32string s = buf.line_chars(line);
  size_t i = 0;
  while (i < s.size() && is_blank(s[i])) ++i;
  return i;
}

void CursorSelection::restore(const Cursor& c) {
  cur_ = c;
  selecting_ = false;
}

void CursorSelection::reset() {
  cur_ = Cursor{};
  selecting_ = false;
}

void CursorSelection::place(Position from, Position to, bool extend) {
  if (extend || selecting_) {
    Position anchor = cur_.selection ? cur_.selection->anchor : from;
    cur_.selection = Selection{anchor, to};
  } else {
    cur_.selection.reset();
  }
  cur_.position = to;
}

EditStatus CursorSelection::set_position(const TextBuffer& buf, Position p, bool extend) {
  size_t off = 0;
  if (EditStatus st = buf.position_to_offset(p, off); st != EditStatus::Ok) return st;
  place(cur_.position, p, extend);
  cur_.sticky_column = p.column;
  return EditStatus::Ok;
}

void CursorSelection::move(const TextBuffer& buf, Movement m, bool extend, size_t page_lines) {
  Position from = cur_.position;
  Position to = from;
  bool vertical = false;
  size_t last_line = buf.line_count() - 1;
  switch (m) {
    case Movement::Left:
      if (to.column > 0) to.column--;
      else if (to.line > 0) { to.line--; to.column = buf.line_length(to.line); }
      break;
    case Movement::Right:
      if (to.column < buf.line_length(to.line)) to.column++;
      else if (to.line < last_line) { to.line++; to.column = 0; }
      break;
    case Movement::Up:
    case Movement::PageUp: {
      vertical = true;
      size_t step = (m == Movement::Up) ? 1 : std::max<size_t>(1, page_lines);
      if (to.line == 0) break;
      to.line = to.line > step ? to.line - step : 0;
      to.column = std::min(cur_.sticky_column, buf.line_length(to.line));
    } break;
    case Movement::Down:
    case Movement::PageDown: {
      vertical = true;
      size_t step = (m == Movement::Down) ? 1 : std::max<size_t>(1, page_lines);
      if (to.line == last_line) break;
      to.line = std::min(last_line, to.line + step);
      to.column = std::min(cur_.sticky_column, buf.line_length(to.line));
    } break;
    case Movement::WordLeft:
      to = buf.offset_to_position(prev_word_boundary(buf, buf.clamped_offset(from)));
      break;
    case Movement::WordRight:
      to = buf.offset_to_position(next_word_boundary(buf, buf.clamped_offset(from)));
      break;
    case Movement::LineStart: {
      size_t first = first_non_blank_column(buf, to.line);
      bool soft = to.column == 0 && first != 0 && first < buf.line_length(to.line);
      to.column = soft ? first : 0;
    } break;
    case Movement::LineEnd:
      to.column = buf.line_length(to.line);
      break;
    case Movement::DocumentStart:
      to = Position{};
      break;
    case Movement::DocumentEnd:
      to = buf.end_position();
      break;
  }
  place(from, to, extend);
  if (!vertical) cur_.sticky_column = to.column;
}

void CursorSelection::start_selection() {
  selecting_ = true;
  cur_.selection = Selection{cur_.position, cur_.position};
}

void CursorSelection::end_selection() {
  selecting_ = false;
  if (cur_.selection) cur_.selection->head = cur_.position;
}

void CursorSelection::clear_selection() {
  selecting_ = false;
  cur_.selection.reset();
}

void CursorSelection::select_all(const TextBuffer& buf) {
  Position end = buf.end_position();
  cur_.selection = Selection{Position{}, end};
  cur_.position = end;
  cur_.sticky_column = end.column;
}

void CursorSelection::select_line(const TextBuffer& buf) {
  size_t l = cur_.position.line;
  Position head = (l + 1 < buf.line_count()) ? Position{l + 1, 0} : Position{l, buf.line_length(l)};
  cur_.selection = Selection{Position{l, 0}, head};
  cur_.position = head;
  cur_.sticky_column = head.column;
}

EditStatus CursorSelection::select_word(const TextBuffer& buf) {
  size_t len = buf.length();
  size_t o = buf.clamped_offset(cur_.position);
  auto usable = [&](size_t i) { return i < len && buf.char_at(i) != U'\n'; };
  size_t i = 0;
  if (usable(o) && !(is_blank(buf.char_at(o)) && o > 0 && usable(o - 1) && !is_blank(buf.char_at(o - 1)))) i = o;
  else if (o > 0 && usable(o - 1)) i = o - 1;
  else { clear_selection(); return EditStatus::NoSelection; }
  CharClass c = char_class(buf.char_at(i));
  size_t s = i, e = i + 1;
  while (s > 0 && usable(s - 1) && char_class(buf.char_at(s - 1)) == c) --s;
  while (usable(e) && char_class(buf.char_at(e)) == c) ++e;
  return select_range(buf, s, e);
}

EditStatus CursorSelection::select_range(const TextBuffer& buf, size_t start, size_t end) {
  if (start > end || end > buf.length()) return EditStatus::InvalidRange;
  Position a = buf.offset_to_position(start);
  Position h = buf.offset_to_position(end);
  cur_.selection = Selection{a, h};
  cur_.position = h;
  cur_.sticky_column = h.column;
  return EditStatus::Ok;
}

CursorSelection::Offsets CursorSelection::offsets(const TextBuffer& buf) const {
  Offsets o;
  o.position = buf.clamped_offset(cur_.position);
  if (cur_.selection) {
    o.has_selection = true;
    o.anchor = buf.clamped_offset(cur_.selection->anchor);
    o.head = buf.clamped_offset(cur_.selection->head);
  }
  return o;
}

void CursorSelection::remap(const TextBuffer& after, const Offsets& before, const EditDelta& d) {
  cur_.position = after.offset_to_position(map_offset(before.position, d));
  if (cur_.selection && before.has_selection) {
    cur_.selection = Selection{after.offset_to_position(map_offset(before.anchor, d)),
                               after.offset_to_position(map_offset(before.head, d))};
  }
  cur_.sticky_column = cur_.position.column;
}
