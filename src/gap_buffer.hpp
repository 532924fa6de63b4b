#pragma once
/*
 * GapBuffer
 *
 * Purpose: char32_t storage with a movable hole; edits at the hole are O(1) amortized.
 * Layout: [0, gap_start) text, [gap_start, gap_end) hole, [gap_end, size) text.
 */
#include <vector>
#include <string>
#include <string_view>

class GapBuffer {
public:
  void clear();
  void init(std::u32string_view text);

  size_t length() const { return store_.size() - gap_size(); }
  size_t gap_size() const { return gap_end_ - gap_start_; }
  size_t gap_position() const { return gap_start_; }
  char32_t operator[](size_t i) const { return i < gap_start_ ? store_[i] : store_[i + gap_size()]; }

  void insert_text(size_t pos, std::u32string_view text);
  void erase_range(size_t pos, size_t len);
  std::u32string slice(size_t pos, size_t len) const;

private:
  void move_gap_to(size_t pos);
  void ensure_gap(size_t need);

  std::vector<char32_t> store_;
  size_t gap_start_ = 0;
  size_t gap_end_ = 0;
};
