#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing.
 * NcursesSession: RAII wrapper around ncurses init/teardown (raw/noecho/keypad).
 * Usage: construct the session in main before any terminal or key source.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesSession {
public:
  NcursesSession();
  ~NcursesSession();
  NcursesSession(const NcursesSession&) = delete;
  NcursesSession& operator=(const NcursesSession&) = delete;
};

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ScreenSize size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_selected(int row, int col, const std::string& text, int sel_start, int sel_len) override;
  void draw_status(int row, const std::string& text) override;
  void move_cursor(int row, int col) override;
  void clear_to_eol(int row, int col) override;
  void refresh() override;
private:
  bool color_ = false;
};
