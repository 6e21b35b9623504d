#ifndef UTILS_H
#define UTILS_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

// =========================================================
// Value type used by the flat game API
// =========================================================

// 0 = no value, 1..9 = palette colour (1 is the plain "full" mark)
typedef uint8_t Color;

static constexpr Color COLOR_FULL = 1;
static constexpr Color COLOR_MAX = 9;

inline bool isValidColor(int c) {
  return c >= COLOR_FULL && c <= COLOR_MAX;
}

// =========================================================
// Index helpers (row-major)
// =========================================================

inline std::size_t cellIndex(std::size_t row, std::size_t col, std::size_t width) {
  return row * width + col;
}

inline std::size_t idxRow(std::size_t idx, std::size_t width) {
  return idx / width;
}

inline std::size_t idxCol(std::size_t idx, std::size_t width) {
  return idx % width;
}

// throws std::out_of_range, never clamps
inline void checkCoordinates(std::size_t row, std::size_t col, std::size_t width, std::size_t height) {
  if (row >= height || col >= width) {
    throw std::out_of_range("cell (" + std::to_string(row) + ", " + std::to_string(col) +
                            ") outside " + std::to_string(width) + "x" + std::to_string(height) + " board");
  }
}

#endif // UTILS_H
