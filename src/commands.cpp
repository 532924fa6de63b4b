#include "commands.hpp"
#include <string>
#include "utf8.hpp"

using T = Command::Type;

static constexpr struct { T type; const char* name; } kCommandNames[] = {
  {T::DeleteForward, "delete_forward"},
  {T::DeleteBackward, "delete_backward"},
  {T::DeleteWordForward, "delete_word_forward"},
  {T::DeleteWordBackward, "delete_word_backward"},
  {T::DeleteToLineEnd, "delete_to_line_end"},
  {T::DeleteToLineStart, "delete_to_line_start"},
  {T::DeleteLine, "delete_line"},
  {T::DeleteSelection, "delete_selection"},
  {T::StartSelection, "start_selection"},
  {T::EndSelection, "end_selection"},
  {T::SelectAll, "select_all"},
  {T::SelectLine, "select_line"},
  {T::SelectWord, "select_word"},
  {T::ClearSelection, "clear_selection"},
  {T::Undo, "undo"},
  {T::Redo, "redo"},
  {T::Boundary, "boundary"},
  {T::Cut, "cut"},
  {T::Copy, "copy"},
  {T::Paste, "paste"},
  {T::FindNext, "find_next"},
  {T::FindPrevious, "find_previous"},
};

bool Command::is_edit() const {
  switch (type) {
    case T::InsertChar: case T::InsertText:
    case T::DeleteForward: case T::DeleteBackward:
    case T::DeleteWordForward: case T::DeleteWordBackward:
    case T::DeleteToLineEnd: case T::DeleteToLineStart:
    case T::DeleteLine: case T::DeleteSelection:
    case T::Cut: case T::Paste:
    case T::Replace: case T::ReplaceAll:
      return true;
    default:
      return false;
  }
}

bool parse_command(std::string_view name, Command& out) {
  for (const auto& e : kCommandNames) {
    if (name == e.name) { out = Command::of(e.type); return true; }
  }
  /* move_<movement> / select_<movement> */
  bool extend = false;
  std::string_view rest;
  if (name.starts_with("move_")) rest = name.substr(5);
  else if (name.starts_with("select_")) { rest = name.substr(7); extend = true; }
  else return false;
  Movement m;
  if (!parse_movement(std::string(rest).c_str(), m)) return false;
  out = Command::move(m, extend);
  return true;
}

std::string command_name(const Command& c) {
  for (const auto& e : kCommandNames) {
    if (c.type == e.type) return e.name;
  }
  switch (c.type) {
    case T::Move: return std::string(c.extend ? "select_" : "move_") + movement_name(c.movement);
    case T::MoveTo: return "move_to " + std::to_string(c.position.line) + ":" + std::to_string(c.position.column);
    case T::InsertChar: { std::string s = "insert_char "; utf8_append(s, c.ch); return s; }
    case T::InsertText: return "insert_text " + c.text;
    case T::Find: return "find " + c.text;
    case T::Replace: return "replace " + c.text + " " + c.replacement;
    case T::ReplaceAll: return "replace_all " + c.text + " " + c.replacement;
    default: return "unknown";
  }
}
