#include "line_index.hpp"

void LineIndex::invalidate_after(size_t offset) {
  auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
  starts_.erase(it, starts_.end());
  if (scanned_ > offset) scanned_ = offset;
}
