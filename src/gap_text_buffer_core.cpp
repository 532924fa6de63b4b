#include "gap_text_buffer_core.hpp"

void GapTextBufferCore::init(std::u32string_view text) {
  gb.clear();
  gb.init(text);
  li.reset(text);
}

void GapTextBufferCore::insert(size_t pos, std::u32string_view s) {
  if (s.empty()) return;
  gb.insert_text(pos, s);
  li.on_insert(pos, s);
}

void GapTextBufferCore::erase(size_t pos, size_t len) {
  if (len == 0) return;
  size_t newlines = 0;
  for (size_t i = pos; i < pos + len; ++i) if (gb[i] == U'\n') ++newlines;
  gb.erase_range(pos, len);
  li.on_erase(pos, newlines);
}
