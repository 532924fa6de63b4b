#pragma once
#include <concepts>
#include <string>
#include <string_view>

/*
 * character store behind TextBuffer; offsets count Unicode scalar values.
 * insert/erase take already-validated offsets.
 */
template <typename Derived>
class TextBufferCoreCRTP {
public:
  std::string_view get_name() const { return as_const_derived().get_name_sv(); }
  void init(std::u32string_view text) { as_derived().do_init(text); }
  size_t length() const { return as_const_derived().do_length(); }
  char32_t char_at(size_t i) const { return as_const_derived().do_char_at(i); }
  std::u32string slice(size_t pos, size_t len) const { return as_const_derived().do_slice(pos, len); }
  /*edit*/
  void insert(size_t pos, std::u32string_view s) { as_derived().do_insert(pos, s); }
  void erase(size_t pos, size_t len) { as_derived().do_erase(pos, len); }
  /*lines*/
  size_t line_count() const { return as_const_derived().do_line_count(); }
  size_t line_start(size_t row) const { return as_const_derived().do_line_start(row); }
  size_t line_of(size_t offset) const { return as_const_derived().do_line_of(offset); }

private:
  Derived& as_derived() { return static_cast<Derived&>(*this); }
  const Derived& as_const_derived() const { return static_cast<const Derived&>(*this); }
};

template <typename T>
concept TextBufferCoreCRTPConcept =
  std::derived_from<T, TextBufferCoreCRTP<T>> &&
  requires(T& t, const T& ct, std::u32string_view sv, size_t n) {
    { T::get_name_sv() } -> std::convertible_to<std::string_view>;
    t.do_init(sv);
    { ct.do_length() } -> std::same_as<size_t>;
    { ct.do_char_at(n) } -> std::same_as<char32_t>;
    { ct.do_slice(n, n) } -> std::same_as<std::u32string>;
    t.do_insert(n, sv);
    t.do_erase(n, n);
    { ct.do_line_count() } -> std::same_as<size_t>;
    { ct.do_line_start(n) } -> std::same_as<size_t>;
    { ct.do_line_of(n) } -> std::same_as<size_t>;
  };
