#pragma once
/*
 * Search
 *
 * Purpose: exact substring search (KMP) over buffer characters.
 */
#include <optional>
#include <string_view>
#include <vector>

std::vector<size_t> kmp_build(std::u32string_view pat);
/* first match starting at or after start */
std::optional<size_t> kmp_find_first_from(std::u32string_view s, std::u32string_view pat, size_t start);
/* last match starting strictly before `before` */
std::optional<size_t> kmp_find_last_before(std::u32string_view s, std::u32string_view pat, size_t before);
/* non-overlapping matches, left to right */
void kmp_find_all(std::u32string_view s, std::u32string_view pat, std::vector<size_t>& out);
