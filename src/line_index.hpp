#pragma once
/*
 * LineIndex
 *
 * Purpose: cache of line-start offsets over a character source.
 * Design: filled lazily by scanning forward; an edit at offset o drops every
 *         cached start after o, so typing near the end rescans only the tail.
 *         The total line count is kept exact per edit and never triggers a scan.
 * Source: any type with length() and operator[](size_t) -> char32_t.
 */
#include <vector>
#include <cstddef>
#include <algorithm>
#include <string_view>

class LineIndex {
public:
  void clear() { starts_.assign(1, 0); scanned_ = 0; newlines_ = 0; }
  void reset(std::u32string_view text) { clear(); newlines_ = count_newlines(text); }
  void on_insert(size_t offset, std::u32string_view text) {
    newlines_ += count_newlines(text);
    invalidate_after(offset);
  }
  /* removed_newlines: '\n' count of the erased range, taken before erasing */
  void on_erase(size_t offset, size_t removed_newlines) {
    newlines_ -= std::min(newlines_, removed_newlines);
    invalidate_after(offset);
  }

  size_t line_count() const { return newlines_ + 1; }

  /* row must be < line_count(src) */
  template <typename Source>
  size_t line_start(const Source& src, size_t row) const {
    while (starts_.size() <= row && scanned_ < src.length()) scan_one(src);
    return starts_[std::min(row, starts_.size() - 1)];
  }

  /* line containing offset; offset may equal length */
  template <typename Source>
  size_t line_of(const Source& src, size_t offset) const {
    scan_until(src, offset);
    auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
    return static_cast<size_t>(it - starts_.begin()) - 1;
  }

  size_t cached_lines() const { return starts_.size(); }

  static size_t count_newlines(std::u32string_view text) {
    return static_cast<size_t>(std::count(text.begin(), text.end(), U'\n'));
  }

private:
  void invalidate_after(size_t offset);

  template <typename Source>
  void scan_one(const Source& src) const {
    char32_t c = src[scanned_];
    ++scanned_;
    if (c == U'\n') starts_.push_back(scanned_);
  }

  template <typename Source>
  void scan_until(const Source& src, size_t offset) const {
    size_t stop = std::min(offset, src.length());
    while (scanned_ < stop) scan_one(src);
  }

  mutable std::vector<size_t> starts_{0};
  mutable size_t scanned_ = 0; /* every '\n' before this offset is in starts_ */
  size_t newlines_ = 0;
};
