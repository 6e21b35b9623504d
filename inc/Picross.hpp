#ifndef PICROSS_H
#define PICROSS_H

#include <cstddef>
#include <utility>
#include <vector>
#include "PicrossBoard.hpp"
#include "PicrossCell.hpp"
#include "PicrossPuzzle.hpp"

struct Options {
  // cross out the blanks of every satisfied line, and revert those
  // cross-outs once the line breaks again
  bool autoCrossCompleted = true;
};

// A picross game: the puzzle, the live board and the per-line solved status.
//
// Every mutation writes one cell and then re-checks only the row and the
// column through that cell. Both solved bits are refreshed before either
// annotation pass runs, so the passes never read stale status.
//
// Not thread safe; callers serialize access.
template <typename V>
class Picross
{
public:
  explicit Picross(Puzzle<V> p, Options opts = Options())
      : puzzle(std::move(p)),
        board(puzzle.width(), puzzle.height()),
        rowSolved(puzzle.height(), false),
        columnSolved(puzzle.width(), false),
        options(opts) {
    for (std::size_t r = 0; r < height(); r++) {
      rowSolved[r] = puzzle.rowIsSolved(board, r);
    }
    for (std::size_t c = 0; c < width(); c++) {
      columnSolved[c] = puzzle.columnIsSolved(board, c);
    }
    // lines with an empty constraint are solved from the start
    annotateAll();
  }

  // --- mutations (each returns isSolved()) ---
  bool place(const V &value, std::size_t row, std::size_t col) {
    board.getMut(row, col) = Cell<V>::filled(value);
    reCheck(row, col);
    return isSolved();
  }

  bool crossOut(std::size_t row, std::size_t col) {
    board.getMut(row, col) = Cell<V>::crossedOut();
    reCheck(row, col);
    return isSolved();
  }

  bool clear(std::size_t row, std::size_t col) {
    board.getMut(row, col) = Cell<V>::empty();
    reCheck(row, col);
    return isSolved();
  }

  void reCheck(std::size_t row, std::size_t col) {
    checkCoordinates(row, col, width(), height());

    rowSolved[row] = puzzle.rowIsSolved(board, row);
    columnSolved[col] = puzzle.columnIsSolved(board, col);

    annotateRow(row);
    annotateColumn(col);
  }

  // --- queries ---
  bool isSolved() const {
    for (bool solved : rowSolved) {
      if (!solved) {
        return false;
      }
    }
    for (bool solved : columnSolved) {
      if (!solved) {
        return false;
      }
    }
    return true;
  }

  const Cell<V> &get(std::size_t row, std::size_t col) const {
    return board.get(row, col);
  }

  const std::vector<bool> &rowStatus() const {
    return rowSolved;
  }

  const std::vector<bool> &columnStatus() const {
    return columnSolved;
  }

  const ConstraintGroup<V> &rowConstraints() const {
    return puzzle.getRowConstraints();
  }

  const ConstraintGroup<V> &columnConstraints() const {
    return puzzle.getColumnConstraints();
  }

  const Puzzle<V> &getPuzzle() const {
    return puzzle;
  }

  const Board<V> &getBoard() const {
    return board;
  }

  typename Board<V>::CellRange cells() const {
    return board.cells();
  }

  std::size_t width() const noexcept {
    return board.getWidth();
  }

  std::size_t height() const noexcept {
    return board.getHeight();
  }

  // --- options ---
  const Options &getOptions() const {
    return options;
  }

  // switching auto-cross on annotates every line at once, as the
  // constructor does; switching it off leaves the board as it is
  void setOptions(const Options &opts) {
    const bool enabling = opts.autoCrossCompleted && !options.autoCrossCompleted;
    options = opts;
    if (enabling) {
      annotateAll();
    }
  }

private:
  void annotateAll() {
    for (std::size_t r = 0; r < height(); r++) {
      annotateRow(r);
    }
    for (std::size_t c = 0; c < width(); c++) {
      annotateColumn(c);
    }
  }

  void annotateRow(std::size_t row) {
    if (!options.autoCrossCompleted) {
      return;
    }
    for (std::size_t c = 0; c < width(); c++) {
      Cell<V> &cell = board.getMut(row, c);
      if (rowSolved[row]) {
        if (cell.isEmpty()) {
          cell = Cell<V>::crossedOut();
        }
      } else if (cell.isCrossedOut() && !columnSolved[c]) {
        cell = Cell<V>::empty();
      }
    }
  }

  void annotateColumn(std::size_t col) {
    if (!options.autoCrossCompleted) {
      return;
    }
    for (std::size_t r = 0; r < height(); r++) {
      Cell<V> &cell = board.getMut(r, col);
      if (columnSolved[col]) {
        if (cell.isEmpty()) {
          cell = Cell<V>::crossedOut();
        }
      } else if (cell.isCrossedOut() && !rowSolved[r]) {
        cell = Cell<V>::empty();
      }
    }
  }

  Puzzle<V> puzzle;
  Board<V> board;
  std::vector<bool> rowSolved;
  std::vector<bool> columnSolved;
  Options options;
};

#endif // PICROSS_H
