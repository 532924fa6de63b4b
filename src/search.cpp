#include "search.hpp"

std::vector<size_t> kmp_build(std::u32string_view pat) {
  std::vector<size_t> pi(pat.size(), 0);
  for (size_t i = 1, j = 0; i < pat.size(); ++i) {
    while (j > 0 && pat[i] != pat[j]) j = pi[j - 1];
    if (pat[i] == pat[j]) ++j;
    pi[i] = j;
  }
  return pi;
}

std::optional<size_t> kmp_find_first_from(std::u32string_view s, std::u32string_view pat, size_t start) {
  if (pat.empty()) return std::nullopt;
  auto pi = kmp_build(pat);
  size_t j = 0;
  for (size_t i = start; i < s.size(); ++i) {
    while (j > 0 && s[i] != pat[j]) j = pi[j - 1];
    if (s[i] == pat[j]) ++j;
    if (j == pat.size()) return i + 1 - pat.size();
  }
  return std::nullopt;
}

std::optional<size_t> kmp_find_last_before(std::u32string_view s, std::u32string_view pat, size_t before) {
  if (pat.empty()) return std::nullopt;
  auto pi = kmp_build(pat);
  std::optional<size_t> last;
  size_t j = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    while (j > 0 && s[i] != pat[j]) j = pi[j - 1];
    if (s[i] == pat[j]) ++j;
    if (j == pat.size()) {
      size_t at = i + 1 - pat.size();
      if (at >= before) break;
      last = at;
      j = pi[j - 1];
    }
  }
  return last;
}

void kmp_find_all(std::u32string_view s, std::u32string_view pat, std::vector<size_t>& out) {
  out.clear(); if (pat.empty()) return;
  auto pi = kmp_build(pat);
  size_t j = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    while (j > 0 && s[i] != pat[j]) j = pi[j - 1];
    if (s[i] == pat[j]) ++j;
    if (j == pat.size()) { out.push_back(i + 1 - pat.size()); j = 0; }
  }
}
