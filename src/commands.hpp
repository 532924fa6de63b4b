#pragma once
/*
 * Command
 *
 * Purpose: the editor's input vocabulary; one value per user-level action.
 * Text form: snake_case names used by rc-file bindings ("undo", "select_word_left").
 */
#include <string>
#include <string_view>
#include "types.hpp"

struct Command {
  enum class Type {
    /* text mutation */
    InsertChar, InsertText,
    DeleteForward, DeleteBackward,
    DeleteWordForward, DeleteWordBackward,
    DeleteToLineEnd, DeleteToLineStart,
    DeleteLine, DeleteSelection,
    /* navigation */
    Move, MoveTo,
    /* selection */
    StartSelection, EndSelection, SelectAll, SelectLine, SelectWord, ClearSelection,
    /* history */
    Undo, Redo, Boundary,
    /* clipboard */
    Cut, Copy, Paste,
    /* search */
    Find, FindNext, FindPrevious, Replace, ReplaceAll
  };

  Type type = Type::Boundary;
  char32_t ch = 0;
  std::string text;        /* inserted text, or search pattern */
  std::string replacement;
  Movement movement = Movement::Left;
  bool extend = false;     /* navigation keeps the anchor and moves the head */
  Position position;

  static Command of(Type t) { Command c; c.type = t; return c; }
  static Command insert_char(char32_t c) { Command cmd = of(Type::InsertChar); cmd.ch = c; return cmd; }
  static Command insert_text(std::string s) { Command cmd = of(Type::InsertText); cmd.text = std::move(s); return cmd; }
  static Command move(Movement m, bool extend = false) { Command cmd = of(Type::Move); cmd.movement = m; cmd.extend = extend; return cmd; }
  static Command move_to(Position p, bool extend = false) { Command cmd = of(Type::MoveTo); cmd.position = p; cmd.extend = extend; return cmd; }
  static Command find(std::string pattern) { Command cmd = of(Type::Find); cmd.text = std::move(pattern); return cmd; }
  static Command replace(std::string pattern, std::string with) {
    Command cmd = of(Type::Replace); cmd.text = std::move(pattern); cmd.replacement = std::move(with); return cmd;
  }
  static Command replace_all(std::string pattern, std::string with) {
    Command cmd = of(Type::ReplaceAll); cmd.text = std::move(pattern); cmd.replacement = std::move(with); return cmd;
  }

  bool is_edit() const;
  bool operator==(const Command&) const = default;
};

/* payload-free commands and movements only; InsertText/Find/Replace have no name form */
bool parse_command(std::string_view name, Command& out);
std::string command_name(const Command& c);
