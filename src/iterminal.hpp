#pragma once
/*
 * ITerminal
 *
 * Purpose: drawing surface the renderer paints one frame onto.
 * Implementations: NcursesTerminal (interactive), HeadlessTerminal (tests).
 * Coordinates are screen cells; text arrives as UTF-8 already clipped to the width.
 */
#include <string>

struct ScreenSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual ScreenSize size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  /* sel_start/sel_len are byte offsets into text; a range running past the end
     also marks the line break after text as selected */
  virtual void draw_selected(int row, int col, const std::string& text, int sel_start, int sel_len) = 0;
  /* full-width reverse-video row */
  virtual void draw_status(int row, const std::string& text) = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
};
