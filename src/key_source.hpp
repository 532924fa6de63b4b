#pragma once
/*
 * IKeySource
 *
 * Purpose: abstract producer of key events (terminal, GUI, scripted).
 * Goal: decouple the editor loop from concrete input backends, enable testing.
 */
#include <deque>
#include <optional>
#include <string_view>
#include <initializer_list>
#include "keys.hpp"

class IKeySource {
public:
  virtual ~IKeySource() = default;
  /* nullopt when the source is exhausted or closed */
  virtual std::optional<KeyEvent> next_key() = 0;
};

/* headless source fed from a script; used by tests and batch runs */
class ScriptedKeySource : public IKeySource {
public:
  ScriptedKeySource() = default;
  ScriptedKeySource(std::initializer_list<KeyEvent> events) : events_(events) {}

  void push(const KeyEvent& ev) { events_.push_back(ev); }
  /* each character of utf8 text becomes one unmodified key press */
  void push_text(std::string_view utf8);
  /* chord in text form ("primary+z") with the primary mapped to a physical modifier */
  bool push_chord(std::string_view chord, Modifier physical_primary);
  size_t pending() const { return events_.size(); }

  std::optional<KeyEvent> next_key() override;

private:
  std::deque<KeyEvent> events_;
};
