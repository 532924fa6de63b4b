#include "text_buffer.hpp"
#include <cassert>
#include <string>

static size_t offset_of(const TextBuffer& b, Position p) {
  size_t o = 0;
  EditStatus st = b.position_to_offset(p, o);
  assert(st == EditStatus::Ok);
  return o;
}

int main() {
  {
    TextBuffer b;
    assert(b.backend_name() == HEDIT_BACKEND_NAME);
    assert(b.empty());
    assert(b.line_count() == 1);
    assert(b.line_length(0) == 0);
    assert(b.end_position() == (Position{0, 0}));
    assert(offset_of(b, {0, 0}) == 0);
  }
  {
    TextBuffer b("ab\ncd");
    assert(b.length() == 5);
    assert(b.line_count() == 2);
    assert(b.line(0) == "ab");
    assert(b.line(1) == "cd");
    assert(b.line_length(1) == 2);
    assert(b.line_length(7) == 0);
    assert(offset_of(b, {0, 2}) == 2); // end of line is valid
    assert(offset_of(b, {1, 1}) == 4);
    size_t o = 99;
    assert(b.position_to_offset({1, 3}, o) == EditStatus::OutOfBounds);
    assert(b.position_to_offset({2, 0}, o) == EditStatus::OutOfBounds);
    assert(o == 99);
    assert(b.offset_to_position(2) == (Position{0, 2}));
    assert(b.offset_to_position(3) == (Position{1, 0}));
    assert(b.offset_to_position(5) == (Position{1, 2}));
    assert(b.offset_to_position(50) == (Position{1, 2}));
    assert(b.clamp({9, 9}) == (Position{1, 2}));
    assert(b.clamp({0, 9}) == (Position{0, 2}));
  }
  {
    // offset -> position -> offset is exact for every offset, multi-byte included
    TextBuffer b("h\xC3\xA9llo\n\xE4\xB8\x96\xE7\x95\x8C\n\n\xF0\x9F\x99\x82x\n");
    assert(b.line_count() == 5);
    assert(b.line_length(1) == 2);
    assert(b.line_length(2) == 0);
    assert(b.line_length(3) == 2);
    assert(b.line_length(4) == 0);
    for (size_t o = 0; o <= b.length(); ++o) {
      assert(offset_of(b, b.offset_to_position(o)) == o);
    }
  }
  {
    TextBuffer b("hello");
    assert(b.insert(6, U"x") == EditStatus::OutOfBounds);
    assert(b.text() == "hello");
    assert(b.insert(5, U" world") == EditStatus::Ok);
    assert(b.text() == "hello world");
    assert(b.erase(3, 2) == EditStatus::InvalidRange);
    assert(b.erase(0, 12) == EditStatus::InvalidRange);
    assert(b.erase(5, 11) == EditStatus::Ok);
    assert(b.text() == "hello");
    assert(b.insert_utf8(0, "\xC2\xA1") == EditStatus::Ok);
    assert(b.length() == 6);
    assert(b.char_at(0) == 0xA1);
    assert(b.char_at(6) == 0);
  }
  {
    // line starts follow edits, including ones before already-indexed lines
    TextBuffer b("one\ntwo\nthree");
    assert(b.line_count() == 3);
    assert(b.line_start(2) == 8);
    assert(b.insert(3, U"\nnew") == EditStatus::Ok);
    assert(b.line_count() == 4);
    assert(b.line(1) == "new");
    assert(b.line_start(3) == 12);
    assert(b.erase(3, 4) == EditStatus::Ok); // remove "\nnew"
    assert(b.erase(3, 4) == EditStatus::Ok); // join "one" and "two"
    assert(b.line_count() == 2);
    assert(b.line(0) == "onetwo");
    assert(b.offset_to_position(7) == (Position{1, 0}));
  }
  {
    TextBuffer b("a\n");
    assert(b.line_count() == 2);
    assert(b.end_position() == (Position{1, 0}));
    assert(b.slice(0, 1) == U"a");
    assert(b.slice(1, 0).empty());
    b.set_text("x\ny\nz");
    assert(b.line_count() == 3);
    assert(b.line_chars(2) == U"z");
  }
  {
    // large enough to force gap growth and long forward scans
    TextBuffer b;
    std::u32string chunk = U"0123456789\n";
    for (size_t i = 0; i < 500; ++i) assert(b.insert(b.length() / 2, chunk) == EditStatus::Ok);
    assert(b.line_count() == 501);
    assert(b.length() == 500 * chunk.size());
    for (size_t o = 0; o <= b.length(); o += 37) assert(offset_of(b, b.offset_to_position(o)) == o);
  }
  {
    // edits near the top never rescan the rest of a long buffer
    std::string text;
    for (int i = 0; i < 10000; ++i) text += "some line of text here\n";
    TextBuffer b(text);
    assert(b.line_count() == 10001);
    assert(b.cached_lines() == 1);
    assert(b.line_start(9999) == 9999 * 23);
    assert(b.cached_lines() == 10000);
    for (int i = 0; i < 50; ++i) {
      assert(b.insert(0, U"x") == EditStatus::Ok);
      assert(b.line_count() == 10001);
      assert(b.clamp({0, 200}) == (Position{0, 22 + static_cast<size_t>(i) + 1}));
      assert(b.offset_to_position(3) == (Position{0, 3}));
      assert(b.cached_lines() <= 2);
    }
    assert(b.insert(0, U"a\nb\n") == EditStatus::Ok);
    assert(b.line_count() == 10003);
    assert(b.erase(0, 2 + 2 + 50 + 23) == EditStatus::Ok); // "a\nb\n", the x run and the rest of its line
    assert(b.line_count() == 10000);
    assert(b.cached_lines() <= 2);
    assert(b.line_start(9998) == 9998 * 23);
    assert(b.end_position() == (Position{9999, 0}));
  }
  return 0;
}
