#include "renderer.hpp"
#include <algorithm>
#include "utf8.hpp"

size_t display_column(std::u32string_view line, size_t column, size_t tab_width) {
  size_t cell = 0;
  for (size_t i = 0; i < column && i < line.size(); ++i) {
    cell += line[i] == U'\t' ? tab_width - cell % tab_width : 1;
  }
  return cell;
}

std::string Renderer::status_line(const Editor& ed, const std::string& file_label, const std::string& note) const {
  Position p = ed.cursor().position();
  std::string s = file_label.empty() ? std::string("[No Name]") : file_label;
  if (ed.modified()) s += " [+]";
  s += "  Ln " + std::to_string(p.line + 1) + ", Col " + std::to_string(p.column + 1);
  if (ed.cursor().has_selection()) s += " (" + std::to_string(ed.selected_text().size()) + " bytes selected)";
  s += "  ";
  s += platform_name(ed.options().platform);
  if (!note.empty()) s += "  | " + note;
  return s;
}

void Renderer::draw_line(ITerminal& term, int row, const Editor& ed, size_t line, const Viewport& vp, int cols) {
  const TextBuffer& buf = ed.buffer();
  std::u32string chars = buf.line_chars(line);
  /* expand tabs, remember the cell where each column starts */
  std::u32string cells;
  std::vector<size_t> start_cell(chars.size() + 1, 0);
  for (size_t i = 0; i < chars.size(); ++i) {
    start_cell[i] = cells.size();
    if (chars[i] == U'\t') cells.append(tab_width_ - cells.size() % tab_width_, U' ');
    else cells.push_back(chars[i]);
  }
  start_cell[chars.size()] = cells.size();

  size_t left = std::min(vp.left, cells.size());
  size_t right = std::min(cells.size(), vp.left + static_cast<size_t>(cols));
  std::u32string visible = cells.substr(left, right - left);
  std::string text = utf8_encode(visible);

  const auto& sel = ed.cursor().selection();
  if (!ed.cursor().has_selection() || line < sel->start().line || line > sel->end().line) {
    term.draw_text(row, 0, text);
    term.clear_to_eol(row, static_cast<int>(visible.size()));
    return;
  }
  Position s = sel->start(), e = sel->end();
  size_t c0 = line == s.line ? std::min(s.column, chars.size()) : 0;
  size_t c1 = line == e.line ? std::min(e.column, chars.size()) : chars.size();
  bool line_break = line < e.line;
  size_t d0 = std::clamp(start_cell[c0], left, right) - left;
  size_t d1 = std::clamp(start_cell[c1], left, right) - left;
  int hs = static_cast<int>(utf8_encode(visible.substr(0, d0)).size());
  int hl = static_cast<int>(utf8_encode(visible.substr(d0, d1 - d0)).size());
  if (line_break && right == cells.size()) hl += 1;
  term.draw_selected(row, 0, text, hs, hl);
  term.clear_to_eol(row, static_cast<int>(visible.size()) + (line_break ? 1 : 0));
}

void Renderer::render(ITerminal& term, const Editor& ed, Viewport& vp, const std::string& file_label,
                      const std::string& note) {
  ScreenSize sz = term.size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  if (rows <= 0 || cols <= 0) { term.refresh(); return; }
  size_t text_rows = static_cast<size_t>(std::max(1, rows - 1));
  const TextBuffer& buf = ed.buffer();
  Position p = ed.cursor().position();
  size_t cursor_cell = display_column(buf.line_chars(p.line), p.column, tab_width_);

  if (p.line < vp.top) vp.top = p.line;
  if (p.line >= vp.top + text_rows) vp.top = p.line - text_rows + 1;
  if (cursor_cell < vp.left) vp.left = cursor_cell;
  if (cursor_cell >= vp.left + static_cast<size_t>(cols)) vp.left = cursor_cell - static_cast<size_t>(cols) + 1;

  for (size_t i = 0; i < text_rows && rows > 1; ++i) {
    size_t line = vp.top + i;
    if (line >= buf.line_count()) {
      term.draw_text(static_cast<int>(i), 0, "~");
      continue;
    }
    draw_line(term, static_cast<int>(i), ed, line, vp, cols);
  }

  std::u32string status = utf8_decode(status_line(ed, file_label, note));
  if (status.size() > static_cast<size_t>(cols)) status.resize(static_cast<size_t>(cols));
  term.draw_status(rows - 1, utf8_encode(status));

  term.move_cursor(static_cast<int>(p.line - vp.top), static_cast<int>(cursor_cell - vp.left));
  term.refresh();
}
