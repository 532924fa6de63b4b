#pragma once
#include <string>
#include <string_view>
#include "i_text_buffer_core.hpp"
#include "line_index.hpp"

/* flat contiguous store; slower splices but the simplest reference backend */
class VectorTextBufferCore : public TextBufferCoreCRTP<VectorTextBufferCore> {
public:
  static constexpr std::string_view get_name_sv() { return "vector"; }

  void init(std::u32string_view text) { chars_.assign(text.begin(), text.end()); li_.reset(text); }
  size_t length() const { return chars_.size(); }
  char32_t char_at(size_t i) const { return chars_[i]; }
  std::u32string slice(size_t pos, size_t len) const { return chars_.substr(pos, len); }
  void insert(size_t pos, std::u32string_view s) {
    if (s.empty()) return;
    chars_.insert(pos, s);
    li_.on_insert(pos, s);
  }
  void erase(size_t pos, size_t len) {
    if (len == 0) return;
    size_t newlines = LineIndex::count_newlines(std::u32string_view(chars_).substr(pos, len));
    chars_.erase(pos, len);
    li_.on_erase(pos, newlines);
  }
  size_t line_count() const { return li_.line_count(); }
  size_t line_start(size_t row) const { return li_.line_start(chars_, row); }
  size_t line_of(size_t offset) const { return li_.line_of(chars_, offset); }
  size_t cached_lines() const { return li_.cached_lines(); }

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

  const std::u32string& raw_chars() const { return chars_; }
private:
  std::u32string chars_;
  LineIndex li_;
};

static_assert(TextBufferCoreCRTPConcept<VectorTextBufferCore>, "Vector backend must satisfy CRTP concept");
