#pragma once
/*
 * IClipboard
 *
 * Purpose: clipboard provider consumed by the editor (get/set text, UTF-8).
 * Note: OS integration lives in the host; MemoryClipboard serves tests and the demo.
 */
#include <string>

class IClipboard {
public:
  virtual ~IClipboard() = default;
  virtual std::string get_text() = 0;
  virtual void set_text(const std::string& text) = 0;
};

class MemoryClipboard : public IClipboard {
public:
  std::string get_text() override { return text_; }
  void set_text(const std::string& text) override { text_ = text; }
private:
  std::string text_;
};
