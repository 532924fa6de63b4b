#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Position/Selection/Cursor/status).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>
#include <optional>

struct Position {
  size_t line = 0;
  size_t column = 0;
  auto operator<=>(const Position&) const = default;
};

/* anchor stays put, head follows further extension */
struct Selection {
  Position anchor;
  Position head;
  bool empty() const { return anchor == head; }
  Position start() const { return anchor < head ? anchor : head; }
  Position end() const { return anchor < head ? head : anchor; }
  bool operator==(const Selection&) const = default;
};

struct Cursor {
  Position position;
  std::optional<Selection> selection;
  size_t sticky_column = 0;
  bool operator==(const Cursor&) const = default;
};

enum class Movement {
  Left, Right, Up, Down,
  WordLeft, WordRight,
  LineStart, LineEnd,
  DocumentStart, DocumentEnd,
  PageUp, PageDown
};

enum class EditStatus {
  Ok,
  OutOfBounds,
  InvalidRange,
  NoSelection,
  Unhandled,
  NothingToUndo,
  NothingToRedo,
  NotFound,
  Busy
};

const char* status_name(EditStatus s);
const char* movement_name(Movement m);
bool parse_movement(const char* name, Movement& out);
