#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal that records what was drawn; used by renderer tests.
 * Note: one byte per cell, so tests should stick to ASCII content.
 */
#include <algorithm>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  struct Highlight { int row; int col; int len; };  /* selected cells */

  HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) { clear(); }

  ScreenSize size() const override { return {rows_, cols_}; }
  void clear() override {
    grid_.assign(static_cast<size_t>(rows_), std::string(static_cast<size_t>(cols_), ' '));
    highlights_.clear();
  }
  void draw_text(int row, int col, const std::string& text) override { put(row, col, text); }
  void draw_selected(int row, int col, const std::string& text, int sel_start, int sel_len) override {
    put(row, col, text);
    if (sel_len > 0) highlights_.push_back({row, col + sel_start, sel_len});
  }
  void draw_status(int row, const std::string& text) override {
    put(row, 0, text);
    status_row_ = row;
  }
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void clear_to_eol(int row, int col) override {
    if (row < 0 || row >= rows_ || col >= cols_) return;
    for (int c = std::max(0, col); c < cols_; ++c) grid_[row][c] = ' ';
  }
  void refresh() override { ++refreshes_; }

  /* row content without trailing blanks */
  std::string row_text(int row) const {
    std::string s = grid_.at(static_cast<size_t>(row));
    size_t end = s.find_last_not_of(' ');
    return end == std::string::npos ? std::string() : s.substr(0, end + 1);
  }
  const std::vector<Highlight>& highlights() const { return highlights_; }
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int refreshes() const { return refreshes_; }
  /* -1 until a status bar was drawn */
  int status_row() const { return status_row_; }

private:
  void put(int row, int col, const std::string& text) {
    if (row < 0 || row >= rows_) return;
    for (size_t i = 0; i < text.size(); ++i) {
      int c = col + static_cast<int>(i);
      if (c >= 0 && c < cols_) grid_[row][c] = text[i];
    }
  }

  int rows_;
  int cols_;
  std::vector<std::string> grid_;
  std::vector<Highlight> highlights_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int refreshes_ = 0;
  int status_row_ = -1;
};
