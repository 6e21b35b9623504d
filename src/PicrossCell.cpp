#include "PicrossCell.hpp"

// =========================================================
// Cell
// =========================================================

template class Cell<Color>;

char cellChar(const Cell<Color> &cell) {
  switch (cell.getState()) {
    case CellState::Empty:
      return '.';
    case CellState::CrossedOut:
      return '/';
    case CellState::Filled:
      break;
  }

  const Color c = cell.getValue();
  if (c == COLOR_FULL) {
    return '#';
  }
  if (isValidColor(c)) {
    return (char)('0' + c);
  }
  return '?';
}
