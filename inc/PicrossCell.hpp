#ifndef PICROSS_CELL_H
#define PICROSS_CELL_H

#include <cstdint>
#include <stdexcept>
#include "utils.hpp"

enum class CellState : uint8_t {
  Empty = 0,
  CrossedOut = 1,
  Filled = 2
};

// A grid position: empty, crossed out, or filled with a value.
// V must be default constructible, copyable and equality comparable.
template <typename V>
class Cell
{
public:
  Cell() : state(CellState::Empty), value() { }

  static Cell empty() {
    return Cell();
  }

  static Cell crossedOut() {
    return Cell(CellState::CrossedOut, V());
  }

  static Cell filled(const V &v) {
    return Cell(CellState::Filled, v);
  }

  // --- state ---
  CellState getState() const {
    return state;
  }

  bool isEmpty() const {
    return state == CellState::Empty;
  }

  bool isCrossedOut() const {
    return state == CellState::CrossedOut;
  }

  bool isFilled() const {
    return state == CellState::Filled;
  }

  // empty and crossed out cells never take part in run matching
  bool isIgnored() const {
    return state != CellState::Filled;
  }

  // --- value ---
  const V &getValue() const {
    if (state != CellState::Filled) {
      throw std::logic_error("Cell::getValue() on a cell that is not filled");
    }
    return value;
  }

  bool operator==(const Cell &other) const {
    if (state != other.state) {
      return false;
    }
    return state != CellState::Filled || value == other.value;
  }

  bool operator!=(const Cell &other) const {
    return !(*this == other);
  }

private:
  Cell(CellState s, const V &v) : state(s), value(v) { }

  CellState state;
  V value;  // meaningful only when Filled
};

// Character shown by text front ends: '.' empty, '/' crossed out,
// '#' colour 1, '2'..'9' other colours.
char cellChar(const Cell<Color> &cell);

#endif // PICROSS_CELL_H
