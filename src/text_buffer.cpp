#include "text_buffer.hpp"
#include <algorithm>
#include "utf8.hpp"

TextBuffer::TextBuffer() { core_.init(std::u32string_view()); }

TextBuffer::TextBuffer(std::string_view utf8) { set_text(utf8); }

std::string_view TextBuffer::backend_name() const { return core_.get_name(); }

size_t TextBuffer::length() const { return core_.length(); }
size_t TextBuffer::line_count() const { return core_.line_count(); }

size_t TextBuffer::line_start(size_t line) const {
  if (line >= line_count()) return length();
  return core_.line_start(line);
}

size_t TextBuffer::line_length(size_t line) const {
  size_t n = line_count();
  if (line >= n) return 0;
  size_t start = core_.line_start(line);
  size_t end = (line + 1 < n) ? core_.line_start(line + 1) - 1 : length();
  return end - start;
}

std::u32string TextBuffer::line_chars(size_t line) const {
  if (line >= line_count()) return std::u32string();
  return core_.slice(core_.line_start(line), line_length(line));
}

std::string TextBuffer::line(size_t line) const { return utf8_encode(line_chars(line)); }

char32_t TextBuffer::char_at(size_t offset) const {
  if (offset >= length()) return 0;
  return core_.char_at(offset);
}

std::u32string TextBuffer::slice(size_t start, size_t end) const {
  size_t len = length();
  end = std::min(end, len);
  if (start >= end) return std::u32string();
  return core_.slice(start, end - start);
}

std::u32string TextBuffer::chars() const { return core_.slice(0, length()); }
std::string TextBuffer::text() const { return utf8_encode(chars()); }

Position TextBuffer::end_position() const {
  size_t last = line_count() - 1;
  return {last, line_length(last)};
}

void TextBuffer::set_text(std::string_view utf8) {
  core_.init(utf8_decode(utf8));
}

EditStatus TextBuffer::insert(size_t at, std::u32string_view text) {
  if (at > length()) return EditStatus::OutOfBounds;
  core_.insert(at, text);
  return EditStatus::Ok;
}

EditStatus TextBuffer::insert_utf8(size_t at, std::string_view text) {
  return insert(at, utf8_decode(text));
}

EditStatus TextBuffer::erase(size_t start, size_t end) {
  if (start > end || end > length()) return EditStatus::InvalidRange;
  core_.erase(start, end - start);
  return EditStatus::Ok;
}

EditStatus TextBuffer::position_to_offset(Position p, size_t& out) const {
  if (p.line >= line_count()) return EditStatus::OutOfBounds;
  if (p.column > line_length(p.line)) return EditStatus::OutOfBounds;
  out = core_.line_start(p.line) + p.column;
  return EditStatus::Ok;
}

Position TextBuffer::offset_to_position(size_t offset) const {
  offset = std::min(offset, length());
  size_t line = core_.line_of(offset);
  return {line, offset - core_.line_start(line)};
}

Position TextBuffer::clamp(Position p) const {
  size_t last = line_count() - 1;
  p.line = std::min(p.line, last);
  p.column = std::min(p.column, line_length(p.line));
  return p;
}

size_t TextBuffer::clamped_offset(Position p) const {
  p = clamp(p);
  return core_.line_start(p.line) + p.column;
}
