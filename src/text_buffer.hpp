#pragma once
/*
 * TextBuffer
 *
 * Purpose: owns the text; offset-based edit primitives and Position<->Offset conversion.
 * Rule: rejects invalid offsets/positions instead of clamping; callers decide.
 * Note: character-granular throughout (Unicode scalar values, never bytes).
 */
#include <string>
#include <string_view>
#include "types.hpp"
#include "config.hpp"
#include "i_text_buffer_core.hpp"
#if HEDIT_BACKEND == HEDIT_BACKEND_VECTOR
#include "vector_text_buffer_core.hpp"
#else
#include "gap_text_buffer_core.hpp"
#endif

class TextBuffer {
public:
  TextBuffer();
  explicit TextBuffer(std::string_view utf8);
#if HEDIT_BACKEND == HEDIT_BACKEND_VECTOR
  using CoreType = VectorTextBufferCore;
#else
  using CoreType = GapTextBufferCore;
#endif
  static_assert(TextBufferCoreCRTPConcept<CoreType>, "Selected backend must satisfy CRTP concept");

  std::string_view backend_name() const;
  bool empty() const { return length() == 0; }
  size_t length() const;
  size_t line_count() const;
  /* 0 for a line that does not exist */
  size_t line_length(size_t line) const;
  size_t line_start(size_t line) const;
  std::string line(size_t line) const;
  std::u32string line_chars(size_t line) const;
  char32_t char_at(size_t offset) const;
  std::u32string slice(size_t start, size_t end) const;
  std::string text() const;
  std::u32string chars() const;
  Position end_position() const;

  void set_text(std::string_view utf8);

  EditStatus insert(size_t at, std::u32string_view text);
  EditStatus insert_utf8(size_t at, std::string_view text);
  /* removes [start, end) */
  EditStatus erase(size_t start, size_t end);

  EditStatus position_to_offset(Position p, size_t& out) const;
  /* total over [0, length]; larger offsets are clamped to length */
  Position offset_to_position(size_t offset) const;
  /* nearest valid position: line clamped to the last line, column to its length */
  Position clamp(Position p) const;
  /* offset of clamp(p) */
  size_t clamped_offset(Position p) const;

  /* line starts currently cached by the store's index */
  size_t cached_lines() const { return core_.cached_lines(); }

private:
  CoreType core_;
};
