#include "gap_buffer.hpp"
#include <algorithm>

static constexpr size_t MIN_GAP = 64;

void GapBuffer::clear() {
  store_.clear();
  gap_start_ = gap_end_ = 0;
}

void GapBuffer::init(std::u32string_view text) {
  store_.assign(text.size() + MIN_GAP, U'\0');
  std::copy(text.begin(), text.end(), store_.begin());
  gap_start_ = text.size();
  gap_end_ = store_.size();
}

/* grows by half the store at least, the right-hand text moves to the new end */
void GapBuffer::ensure_gap(size_t need) {
  if (gap_size() >= need) return;
  size_t grow = std::max(need - gap_size(), std::max(MIN_GAP, store_.size() / 2));
  size_t tail = store_.size() - gap_end_;
  store_.resize(store_.size() + grow);
  auto old_end = store_.begin() + static_cast<std::ptrdiff_t>(gap_end_ + tail);
  std::copy_backward(store_.begin() + static_cast<std::ptrdiff_t>(gap_end_), old_end, store_.end());
  gap_end_ = store_.size() - tail;
}

void GapBuffer::move_gap_to(size_t pos) {
  auto at = [&](size_t i) { return store_.begin() + static_cast<std::ptrdiff_t>(i); };
  if (pos < gap_start_) {
    size_t n = gap_start_ - pos;
    std::copy_backward(at(pos), at(gap_start_), at(gap_end_));
    gap_start_ -= n;
    gap_end_ -= n;
  } else if (pos > gap_start_) {
    size_t n = pos - gap_start_;
    std::copy(at(gap_end_), at(gap_end_ + n), at(gap_start_));
    gap_start_ += n;
    gap_end_ += n;
  }
}

void GapBuffer::insert_text(size_t pos, std::u32string_view text) {
  if (text.empty()) return;
  move_gap_to(pos);
  ensure_gap(text.size());
  std::copy(text.begin(), text.end(), store_.begin() + static_cast<std::ptrdiff_t>(gap_start_));
  gap_start_ += text.size();
}

void GapBuffer::erase_range(size_t pos, size_t len) {
  if (len == 0) return;
  move_gap_to(pos);
  gap_end_ += len;
}

std::u32string GapBuffer::slice(size_t pos, size_t len) const {
  std::u32string out;
  out.reserve(len);
  for (size_t i = pos; i < pos + len; ++i) out.push_back((*this)[i]);
  return out;
}
