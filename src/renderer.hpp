#pragma once
/*
 * Renderer
 *
 * Purpose: draw the editor's text, selection and status line; keep the cursor in view.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: reads Editor state only; the viewport is the one piece it updates.
 */
#include <string>
#include "editor.hpp"
#include "iterminal.hpp"

struct Viewport {
  size_t top = 0;  /* first visible line */
  size_t left = 0; /* first visible screen cell */
};

/* screen cell of a column, with tabs expanded */
size_t display_column(std::u32string_view line, size_t column, size_t tab_width);

class Renderer {
public:
  explicit Renderer(size_t tab_width = 4) : tab_width_(tab_width ? tab_width : 1) {}
  /* note replaces the message part of the status line (prompts, host messages) */
  void render(ITerminal& term, const Editor& ed, Viewport& vp, const std::string& file_label,
              const std::string& note = {});
  std::string status_line(const Editor& ed, const std::string& file_label, const std::string& note) const;
private:
  void draw_line(ITerminal& term, int row, const Editor& ed, size_t line, const Viewport& vp, int cols);
  size_t tab_width_;
};
