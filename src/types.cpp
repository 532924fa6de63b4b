#include "types.hpp"
#include <cstring>

const char* status_name(EditStatus s) {
  switch (s) {
    case EditStatus::Ok: return "ok";
    case EditStatus::OutOfBounds: return "out of bounds";
    case EditStatus::InvalidRange: return "invalid range";
    case EditStatus::NoSelection: return "no selection";
    case EditStatus::Unhandled: return "unhandled";
    case EditStatus::NothingToUndo: return "nothing to undo";
    case EditStatus::NothingToRedo: return "nothing to redo";
    case EditStatus::NotFound: return "not found";
    case EditStatus::Busy: return "busy";
  }
  return "unknown";
}

static constexpr struct { Movement m; const char* name; } kMovementNames[] = {
  {Movement::Left, "left"},
  {Movement::Right, "right"},
  {Movement::Up, "up"},
  {Movement::Down, "down"},
  {Movement::WordLeft, "word_left"},
  {Movement::WordRight, "word_right"},
  {Movement::LineStart, "line_start"},
  {Movement::LineEnd, "line_end"},
  {Movement::DocumentStart, "document_start"},
  {Movement::DocumentEnd, "document_end"},
  {Movement::PageUp, "page_up"},
  {Movement::PageDown, "page_down"},
};

const char* movement_name(Movement m) {
  for (const auto& e : kMovementNames) if (e.m == m) return e.name;
  return "unknown";
}

bool parse_movement(const char* name, Movement& out) {
  for (const auto& e : kMovementNames) {
    if (std::strcmp(e.name, name) == 0) { out = e.m; return true; }
  }
  return false;
}
