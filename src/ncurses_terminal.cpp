#include "ncurses_terminal.hpp"
#include <algorithm>
#include <locale.h>

NcursesSession::NcursesSession() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  nonl();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
}

NcursesSession::~NcursesSession() {
  endwin();
}

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) init_pair(1, -1, -1);
    else init_pair(1, COLOR_WHITE, COLOR_BLACK);
    color_ = true;
  }
}

ScreenSize NcursesTerminal::size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (color_) attron(COLOR_PAIR(1));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (color_) attroff(COLOR_PAIR(1));
}

void NcursesTerminal::draw_selected(int row, int col, const std::string& text, int sel_start, int sel_len) {
  int len = (int)text.size();
  int start = std::clamp(sel_start, 0, len);
  int end = std::clamp(start + std::max(0, sel_len), start, len);
  move(row, col);
  if (start > 0) addnstr(text.c_str(), start);
  if (end > start) {
    attron(A_REVERSE);
    addnstr(text.c_str() + start, end - start);
    attroff(A_REVERSE);
  }
  if (end < len) addnstr(text.c_str() + end, len - end);
  /* selected line break shows as one reversed cell */
  if (sel_len > end - start) {
    attron(A_REVERSE);
    addch(' ');
    attroff(A_REVERSE);
  }
}

void NcursesTerminal::draw_status(int row, const std::string& text) {
  attron(A_REVERSE);
  mvaddnstr(row, 0, text.c_str(), (int)text.size());
  /* pad the rest of the row so the bar spans the screen */
  for (int c = getcurx(stdscr); c < COLS; ++c) addch(' ');
  attroff(A_REVERSE);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

void NcursesTerminal::refresh() { ::refresh(); }
