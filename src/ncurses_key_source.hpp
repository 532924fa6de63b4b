#pragma once
/*
 * NcursesKeySource
 *
 * Purpose: IKeySource reading wide key presses from ncurses (stdscr).
 * Note: requires an active NcursesSession; modified arrows arrive as extended
 *       key codes ("kLFT5" = ctrl+left) and are decoded from their keyname.
 */
#include "key_source.hpp"

class NcursesKeySource : public IKeySource {
public:
  /* a terminal resize yields an empty KeyEvent (no key, no modifiers) */
  std::optional<KeyEvent> next_key() override;
};
