#pragma once
/*
 * Utf8
 *
 * Purpose: convert between external UTF-8 text and the buffer's scalar values.
 * Note: malformed bytes and surrogate code points decode to U+FFFD.
 */
#include <string>
#include <string_view>

inline constexpr char32_t kReplacementChar = 0xFFFD;

std::u32string utf8_decode(std::string_view s);
std::string utf8_encode(std::u32string_view s);
void utf8_append(std::string& out, char32_t c);
/* bytes expected for a sequence starting with lead byte b; 0 if b is not a lead byte */
int utf8_sequence_length(unsigned char b);

/* word-movement classes: a boundary is any change between two of these */
enum class CharClass { Word, Punct, Space };

CharClass char_class(char32_t c);
bool is_blank(char32_t c);
bool is_printable(char32_t c);
