#include "utf8.hpp"
#include <cassert>
#include <string>

int main() {
  // multi-byte text decodes to one value per scalar
  std::u32string s = utf8_decode("h\xC3\xA9llo");
  assert(s.size() == 5);
  assert(s[1] == 0xE9);
  assert(utf8_encode(s) == "h\xC3\xA9llo");

  std::u32string wide = utf8_decode("\xE4\xB8\x96\xF0\x9F\x99\x82");
  assert(wide.size() == 2);
  assert(wide[0] == 0x4E16);
  assert(wide[1] == 0x1F642);
  assert(utf8_encode(wide) == "\xE4\xB8\x96\xF0\x9F\x99\x82");

  // malformed input becomes U+FFFD
  assert(utf8_decode("\xFF") == std::u32string(1, kReplacementChar));
  assert(utf8_decode("a\xE2\x82") == (std::u32string{U'a', kReplacementChar, kReplacementChar}));
  assert(utf8_decode("\xED\xA0\x80") == std::u32string(1, kReplacementChar)); // surrogate
  assert(utf8_decode("\xC0\xAF") == std::u32string(1, kReplacementChar));     // overlong
  assert(utf8_decode("\xC3(") == (std::u32string{kReplacementChar, U'('}));

  // surrogates never get encoded
  std::string out;
  utf8_append(out, 0xD800);
  assert(out == "\xEF\xBF\xBD");

  assert(utf8_sequence_length('a') == 1);
  assert(utf8_sequence_length(0xC3) == 2);
  assert(utf8_sequence_length(0xE4) == 3);
  assert(utf8_sequence_length(0xF0) == 4);
  assert(utf8_sequence_length(0x80) == 0);

  assert(char_class(U'a') == CharClass::Word);
  assert(char_class(U'Z') == CharClass::Word);
  assert(char_class(U'7') == CharClass::Word);
  assert(char_class(U'_') == CharClass::Word);
  assert(char_class(0xE9) == CharClass::Word);
  assert(char_class(U'.') == CharClass::Punct);
  assert(char_class(U'(') == CharClass::Punct);
  assert(char_class(U' ') == CharClass::Space);
  assert(char_class(U'\n') == CharClass::Space);
  assert(is_blank(U'\t'));
  assert(!is_blank(U'x'));
  assert(is_printable(U'a'));
  assert(is_printable(0x4E16));
  assert(!is_printable(U'\x1b'));
  return 0;
}
