#ifndef PICROSS_PUZZLE_H
#define PICROSS_PUZZLE_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "PicrossBoard.hpp"
#include "PicrossCell.hpp"
#include "utils.hpp"

// "size contiguous cells equal to value"
template <typename V>
struct ConstraintEntry {
  V value;
  std::size_t size;

  static ConstraintEntry of(std::size_t size, const V &value) {
    if (size == 0) {
      throw std::invalid_argument("ConstraintEntry: run size must be >= 1");
    }
    return ConstraintEntry{ value, size };
  }

  bool operator==(const ConstraintEntry &other) const {
    return size == other.size && value == other.value;
  }
};

// ordered runs of one line; empty = the line holds no filled cell
template <typename V>
using Constraint = std::vector<ConstraintEntry<V>>;

// one Constraint per row, or one per column
template <typename V>
using ConstraintGroup = std::vector<Constraint<V>>;

template <typename V>
ConstraintGroup<V> makeConstraintGroup(const std::vector<std::vector<std::pair<std::size_t, V>>> &lines) {
  ConstraintGroup<V> group;
  group.reserve(lines.size());
  for (const auto &line : lines) {
    Constraint<V> constraint;
    constraint.reserve(line.size());
    for (const auto &entry : line) {
      constraint.push_back(ConstraintEntry<V>::of(entry.first, entry.second));
    }
    group.push_back(std::move(constraint));
  }
  return group;
}

// =========================================================
// Run matcher
// =========================================================

// Checks a line of cells against its constraint.
//
// Ignored cells (empty / crossed out) are skipped. Consecutive filled cells
// with equal values form one run; a change of value closes the run even
// without a gap. The observed runs must equal the constraint entries one to
// one, in order, by value and length.
//
// Line is any forward range of Cell<V> (LineView, std::vector, ...); its
// iterators may yield cells by value.
template <typename V, typename Line>
bool lineSatisfies(const Constraint<V> &constraint, const Line &line) {
  std::size_t next = 0;
  V runValue = V();
  std::size_t runLength = 0;

  // compares the pending run (if any) against the next expected entry
  auto closeRun = [&]() -> bool
  {
    if (runLength == 0) {
      return true;
    }
    if (next >= constraint.size()) {
      return false;  // more runs than entries
    }
    const ConstraintEntry<V> &expected = constraint[next++];
    const bool match = expected.size == runLength && expected.value == runValue;
    runLength = 0;
    return match;
  };

  for (const Cell<V> &cell : line) {
    if (cell.isIgnored()) {
      if (!closeRun()) {
        return false;
      }
      continue;
    }

    const V &v = cell.getValue();
    if (runLength > 0 && v == runValue) {
      ++runLength;
      continue;
    }

    if (!closeRun()) {
      return false;
    }
    runValue = v;
    runLength = 1;
  }

  if (!closeRun()) {
    return false;
  }
  return next == constraint.size();
}

// =========================================================
// Puzzle
// =========================================================

// Immutable pair of row and column constraints.
// Height = number of row constraints, width = number of column constraints.
template <typename V>
class Puzzle
{
public:
  Puzzle(ConstraintGroup<V> rows, ConstraintGroup<V> columns)
      : rowConstraints(std::move(rows)), columnConstraints(std::move(columns)) {
    validateGroup(rowConstraints, "row");
    validateGroup(columnConstraints, "column");
  }

  // also checks the groups against declared dimensions
  Puzzle(ConstraintGroup<V> rows, ConstraintGroup<V> columns, std::size_t width, std::size_t height)
      : Puzzle(std::move(rows), std::move(columns)) {
    if (rowConstraints.size() != height) {
      throw std::invalid_argument("Puzzle: " + std::to_string(rowConstraints.size()) +
                                  " row constraints for height " + std::to_string(height));
    }
    if (columnConstraints.size() != width) {
      throw std::invalid_argument("Puzzle: " + std::to_string(columnConstraints.size()) +
                                  " column constraints for width " + std::to_string(width));
    }
  }

  const ConstraintGroup<V> &getRowConstraints() const {
    return rowConstraints;
  }

  const ConstraintGroup<V> &getColumnConstraints() const {
    return columnConstraints;
  }

  std::size_t width() const noexcept {
    return columnConstraints.size();
  }

  std::size_t height() const noexcept {
    return rowConstraints.size();
  }

  bool rowIsSolved(const Board<V> &board, std::size_t index) const {
    return lineSatisfies(rowConstraints.at(index), board.row(index));
  }

  bool columnIsSolved(const Board<V> &board, std::size_t index) const {
    return lineSatisfies(columnConstraints.at(index), board.column(index));
  }

  // full check, independent of any cached status
  bool isSolvedBy(const Board<V> &board) const {
    if (board.getWidth() != width() || board.getHeight() != height()) {
      throw std::invalid_argument("Puzzle::isSolvedBy() board size does not match puzzle");
    }
    for (std::size_t r = 0; r < height(); r++) {
      if (!rowIsSolved(board, r)) {
        return false;
      }
    }
    for (std::size_t c = 0; c < width(); c++) {
      if (!columnIsSolved(board, c)) {
        return false;
      }
    }
    return true;
  }

private:
  static void validateGroup(const ConstraintGroup<V> &group, const char *kind) {
    for (std::size_t i = 0; i < group.size(); i++) {
      for (const ConstraintEntry<V> &entry : group[i]) {
        if (entry.size == 0) {
          throw std::invalid_argument(std::string("Puzzle: zero-length run in ") + kind + " " + std::to_string(i));
        }
      }
    }
  }

  ConstraintGroup<V> rowConstraints;
  ConstraintGroup<V> columnConstraints;
};

// Parses a colour puzzle definition: lines separated by '/', entries by
// blanks, each entry "size" (colour 1) or "size:color". A line with no
// entries is the empty constraint.
//   "2/1 1/2"      -> [[2]], [[1],[1]], [[2]]
//   "1 2:3/"       -> [[1], [2 of colour 3]], []
// Throws std::invalid_argument on malformed text.
ConstraintGroup<Color> parseConstraintGroup(const std::string &text);

#endif // PICROSS_PUZZLE_H
