#ifndef PICROSS_BOARD_H
#define PICROSS_BOARD_H

#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <vector>
#include "PicrossCell.hpp"
#include "utils.hpp"

// Read-only view over one row (stride 1) or one column (stride = width).
// Cheap to copy; does not own the cells.
template <typename V>
class LineView
{
public:
  class const_iterator
  {
  public:
    typedef std::forward_iterator_tag iterator_category;
    typedef Cell<V> value_type;
    typedef std::ptrdiff_t difference_type;
    typedef const Cell<V> *pointer;
    typedef const Cell<V> &reference;

    const_iterator() : base(nullptr), stride(1), pos(0) { }
    const_iterator(const Cell<V> *b, std::size_t s, std::size_t p) : base(b), stride(s), pos(p) { }

    reference operator*() const {
      return base[pos * stride];
    }

    pointer operator->() const {
      return &base[pos * stride];
    }

    const_iterator &operator++() {
      ++pos;
      return *this;
    }

    const_iterator operator++(int) {
      const_iterator tmp = *this;
      ++pos;
      return tmp;
    }

    bool operator==(const const_iterator &other) const {
      return base == other.base && pos == other.pos;
    }

    bool operator!=(const const_iterator &other) const {
      return !(*this == other);
    }

  private:
    const Cell<V> *base;
    std::size_t stride;
    std::size_t pos;
  };

  LineView(const Cell<V> *first, std::size_t count, std::size_t stride)
      : first(first), count(count), stride(stride) { }

  std::size_t size() const noexcept {
    return count;
  }

  bool empty() const noexcept {
    return count == 0;
  }

  const Cell<V> &operator[](std::size_t i) const {
    return first[i * stride];
  }

  const Cell<V> &at(std::size_t i) const {
    if (i >= count) {
      throw std::out_of_range("LineView::at() index " + std::to_string(i) + " >= " + std::to_string(count));
    }
    return first[i * stride];
  }

  const_iterator begin() const {
    return const_iterator(first, stride, 0);
  }

  const_iterator end() const {
    return const_iterator(first, stride, count);
  }

private:
  const Cell<V> *first;
  std::size_t count;
  std::size_t stride;
};

// One (row, col, cell) triple, as handed out by Board::cells().
template <typename V>
struct PositionedCell {
  std::size_t row;
  std::size_t col;
  const Cell<V> &cell;
};

// Fixed-size grid of cells stored row-major (index = row * width + col).
template <typename V>
class Board
{
public:
  // Walks every cell in row-major order yielding PositionedCell triples.
  class CellRange
  {
  public:
    class const_iterator
    {
    public:
      typedef std::forward_iterator_tag iterator_category;
      typedef PositionedCell<V> value_type;
      typedef std::ptrdiff_t difference_type;
      typedef void pointer;
      typedef PositionedCell<V> reference;

      const_iterator(const Board *b, std::size_t i) : board(b), idx(i) { }

      PositionedCell<V> operator*() const {
        const std::size_t w = board->getWidth();
        return PositionedCell<V>{ idxRow(idx, w), idxCol(idx, w), board->cellAt(idx) };
      }

      const_iterator &operator++() {
        ++idx;
        return *this;
      }

      bool operator==(const const_iterator &other) const {
        return board == other.board && idx == other.idx;
      }

      bool operator!=(const const_iterator &other) const {
        return !(*this == other);
      }

    private:
      const Board *board;
      std::size_t idx;
    };

    explicit CellRange(const Board *b) : board(b) { }

    const_iterator begin() const {
      return const_iterator(board, 0);
    }

    const_iterator end() const {
      return const_iterator(board, board->cellCount());
    }

  private:
    const Board *board;
  };

  // all cells start Empty
  Board(std::size_t width, std::size_t height)
      : items(width * height), width(width), height(height) { }

  std::size_t getWidth() const noexcept {
    return width;
  }

  std::size_t getHeight() const noexcept {
    return height;
  }

  std::size_t cellCount() const noexcept {
    return items.size();
  }

  // --- single cell access ---
  const Cell<V> &get(std::size_t row, std::size_t col) const {
    checkCoordinates(row, col, width, height);
    return items[cellIndex(row, col, width)];
  }

  Cell<V> &getMut(std::size_t row, std::size_t col) {
    checkCoordinates(row, col, width, height);
    return items[cellIndex(row, col, width)];
  }

  const Cell<V> &cellAt(std::size_t idx) const {
    return items.at(idx);
  }

  // --- lines ---
  LineView<V> row(std::size_t index) const {
    if (index >= height) {
      throw std::out_of_range("Board::row() index " + std::to_string(index) + " >= height " + std::to_string(height));
    }
    return LineView<V>(items.data() + cellIndex(index, 0, width), width, 1);
  }

  LineView<V> column(std::size_t index) const {
    if (index >= width) {
      throw std::out_of_range("Board::column() index " + std::to_string(index) + " >= width " + std::to_string(width));
    }
    // with height == 0 there is no cell to point at
    const Cell<V> *first = height > 0 ? items.data() + index : nullptr;
    return LineView<V>(first, height, width);
  }

  std::vector<LineView<V>> rows() const {
    std::vector<LineView<V>> out;
    out.reserve(height);
    for (std::size_t r = 0; r < height; r++) {
      out.push_back(row(r));
    }
    return out;
  }

  std::vector<LineView<V>> columns() const {
    std::vector<LineView<V>> out;
    out.reserve(width);
    for (std::size_t c = 0; c < width; c++) {
      out.push_back(column(c));
    }
    return out;
  }

  CellRange cells() const {
    return CellRange(this);
  }

private:
  std::vector<Cell<V>> items;
  std::size_t width;
  std::size_t height;
};

#endif // PICROSS_BOARD_H
