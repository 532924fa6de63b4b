#pragma once
#include <string>
#include <string_view>
#include "i_text_buffer_core.hpp"
#include "gap_buffer.hpp"
#include "line_index.hpp"

/*
  this is the gap buffer backend, the default one
  edits move the gap to the cursor, so runs of typing stay O(1) amortized
*/
class GapTextBufferCore : public TextBufferCoreCRTP<GapTextBufferCore> {
public:
  GapBuffer gb;
  LineIndex li;
  static constexpr std::string_view get_name_sv() { return "gap"; }

  void init(std::u32string_view text);
  size_t length() const { return gb.length(); }
  char32_t char_at(size_t i) const { return gb[i]; }
  std::u32string slice(size_t pos, size_t len) const { return gb.slice(pos, len); }
  void insert(size_t pos, std::u32string_view s);
  void erase(size_t pos, size_t len);
  size_t line_count() const { return li.line_count(); }
  size_t line_start(size_t row) const { return li.line_start(gb, row); }
  size_t line_of(size_t offset) const { return li.line_of(gb, offset); }
  size_t cached_lines() const { return li.cached_lines(); }

  /*forward to CRTP impl*/
  void do_init(std::u32string_view text) { init(text); }
  size_t do_length() const { return length(); }
  char32_t do_char_at(size_t i) const { return char_at(i); }
  std::u32string do_slice(size_t pos, size_t len) const { return slice(pos, len); }
  void do_insert(size_t pos, std::u32string_view s) { insert(pos, s); }
  void do_erase(size_t pos, size_t len) { erase(pos, len); }
  size_t do_line_count() const { return line_count(); }
  size_t do_line_start(size_t row) const { return line_start(row); }
  size_t do_line_of(size_t offset) const { return line_of(offset); }
};

static_assert(TextBufferCoreCRTPConcept<GapTextBufferCore>, "Gap backend must satisfy CRTP concept");
