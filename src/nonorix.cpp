// Nonorix WASM Game Core (C++)
// C++/WASM owns the board and the line checks; rendering and input stay in JS.
//
// Exported functions:
//   int nonorix_game_init(const char *rows, const char *cols);
//   int nonorix_game_place(uint32_t row, uint32_t col, uint8_t color, uint32_t *outSolved);
//   int nonorix_game_cross_out(uint32_t row, uint32_t col, uint32_t *outSolved);
//   int nonorix_game_clear(uint32_t row, uint32_t col, uint32_t *outSolved);
//   int nonorix_game_set_auto_cross(int enabled);
//   int nonorix_game_size(uint32_t *outWidth, uint32_t *outHeight);
//   int nonorix_game_export(char *outCells, uint32_t outLen);
//   int nonorix_game_status(uint8_t *outRows, uint32_t rowsLen, uint8_t *outCols, uint32_t colsLen);
//   int nonorix_game_is_solved(uint32_t *outSolved);
//
// JS -> WASM contract:
//   rows, cols : char*    lines separated by '/', entries by blanks,
//                         entry = "size" (colour 1) or "size:color" (colour 1..9)
//   row, col   : uint32_t 0-based, row < height, col < width (no wrapping)
//   color      : uint8_t  1..9
//
// Output buffers:
//   outCells[w*h+1] : char     row-major, '.' empty, '/' crossed out,
//                              '#' colour 1, '2'..'9' other colours, NUL terminated
//   outRows[h]      : uint8_t  1 = row satisfies its constraint, else 0 (rowsLen >= h)
//   outCols[w]      : uint8_t  1 = column satisfies its constraint, else 0 (colsLen >= w)
//   outSolved       : uint32_t 1 = every row and column satisfied, else 0
//
// Every function returns 0 in case of error, else 1.
//
// Notes:
//   - The game is stored in WASM as persistent state (g_picross).
//   - JS must call nonorix_game_init before any other function.
//   - Cursor wrapping and toggle keys are JS-side: JS reads the board with
//     nonorix_game_export and picks place / cross_out / clear itself.

#include <cstdint>
#include <cstddef>
#include <exception>
#include <memory>
#include <utility>
#include <string>

#include "nonorix.hpp"
#include "Picross.hpp"
#include "PicrossPuzzle.hpp"
#include "utils.hpp"

#ifdef __EMSCRIPTEN__
  // WASM
  #include <emscripten/emscripten.h>
#else
  // native
  #include <cstdio>
  #define EMSCRIPTEN_KEEPALIVE
  #define EM_LOG_CONSOLE 1
  #define emscripten_log(x, fmt, ...) printf(fmt, ##__VA_ARGS__);
#endif

static std::unique_ptr<Picross<Color>> g_picross;

// shared by all interface functions
static int checkReady(const char *fn) {
  if (!g_picross) {
    emscripten_log(EM_LOG_CONSOLE, "%s: no game, call nonorix_game_init first\n", fn);
    return 0;
  }
  return 1;
}

static int reportSolved(uint32_t *outSolved, bool solved) {
  if (outSolved != nullptr) {
    *outSolved = solved ? 1u : 0u;
  }
  return 1;
}

// =========================================================
// Public API exported to JS
// =========================================================

extern "C"
{
  // Starts a new game from the two definitions. The previous game (if any)
  // is kept when the definition is rejected.
  // Returns 0 in case of error, else 1.
  EMSCRIPTEN_KEEPALIVE
  int nonorix_game_init(const char *rows, const char *cols) {
    if (rows == nullptr || cols == nullptr) {
      return 0;
    }

    try {
      Puzzle<Color> puzzle(parseConstraintGroup(rows), parseConstraintGroup(cols));
      g_picross = std::make_unique<Picross<Color>>(std::move(puzzle));
    } catch (const std::exception &e) {
      emscripten_log(EM_LOG_CONSOLE, "nonorix_game_init: %s\n", e.what());
      return 0;
    }

    return 1;
  }

  // Places a colour. *outSolved (optional) receives the overall status.
  // Returns 0 in case of error, else 1.
  EMSCRIPTEN_KEEPALIVE
  int nonorix_game_place(uint32_t row, uint32_t col, uint8_t color, uint32_t *outSolved) {
    if (!checkReady("nonorix_game_place")) {
      return 0;
    }
    if (!isValidColor(color)) {
      emscripten_log(EM_LOG_CONSOLE, "nonorix_game_place: invalid colour %d\n", (int)color);
      return 0;
    }

    try {
      return reportSolved(outSolved, g_picross->place(color, row, col));
    } catch (const std::out_of_range &e) {
      emscripten_log(EM_LOG_CONSOLE, "nonorix_game_place: %s\n", e.what());
      return 0;
    }
  }

  // Crosses out a cell. *outSolved (optional) receives the overall status.
  // Returns 0 in case of error, else 1.
  EMSCRIPTEN_KEEPALIVE
  int nonorix_game_cross_out(uint32_t row, uint32_t col, uint32_t *outSolved) {
    if (!checkReady("nonorix_game_cross_out")) {
      return 0;
    }

    try {
      return reportSolved(outSolved, g_picross->crossOut(row, col));
    } catch (const std::out_of_range &e) {
      emscripten_log(EM_LOG_CONSOLE, "nonorix_game_cross_out: %s\n", e.what());
      return 0;
    }
  }

  // Clears a cell. *outSolved (optional) receives the overall status.
  // Returns 0 in case of error, else 1.
  EMSCRIPTEN_KEEPALIVE
  int nonorix_game_clear(uint32_t row, uint32_t col, uint32_t *outSolved) {
    if (!checkReady("nonorix_game_clear")) {
      return 0;
    }

    try {
      return reportSolved(outSolved, g_picross->clear(row, col));
    } catch (const std::out_of_range &e) {
      emscripten_log(EM_LOG_CONSOLE, "nonorix_game_clear: %s\n", e.what());
      return 0;
    }
  }

  // Enables (non-zero) or disables auto cross-out. Enabling annotates the
  // whole board right away.
  // Returns 0 in case of error, else 1.
  EMSCRIPTEN_KEEPALIVE
  int nonorix_game_set_auto_cross(int enabled) {
    if (!checkReady("nonorix_game_set_auto_cross")) {
      return 0;
    }

    Options opts = g_picross->getOptions();
    opts.autoCrossCompleted = enabled != 0;
    g_picross->setOptions(opts);
    return 1;
  }

  // Returns 0 in case of error, else 1.
  EMSCRIPTEN_KEEPALIVE
  int nonorix_game_size(uint32_t *outWidth, uint32_t *outHeight) {
    if (outWidth == nullptr || outHeight == nullptr) {
      return 0;
    }
    if (!checkReady("nonorix_game_size")) {
      return 0;
    }

    *outWidth = (uint32_t)g_picross->width();
    *outHeight = (uint32_t)g_picross->height();
    return 1;
  }

  // Serializes the board (see outCells above).
  // Returns 0 in case of error, else 1.
  EMSCRIPTEN_KEEPALIVE
  int nonorix_game_export(char *outCells, uint32_t outLen) {
    if (outCells == nullptr) {
      return 0;
    }
    if (!checkReady("nonorix_game_export")) {
      return 0;
    }

    const std::size_t count = g_picross->width() * g_picross->height();
    if ((std::size_t)outLen < count + 1) {
      emscripten_log(EM_LOG_CONSOLE, "nonorix_game_export: buffer holds %u chars, need %u\n",
                     (unsigned)outLen, (unsigned)(count + 1));
      return 0;
    }

    for (const PositionedCell<Color> &pc : g_picross->cells()) {
      outCells[cellIndex(pc.row, pc.col, g_picross->width())] = cellChar(pc.cell);
    }
    outCells[count] = '\0';

    return 1;
  }

  // Writes one byte per row and per column (see outRows / outCols above).
  // Returns 0 in case of error, else 1.
  EMSCRIPTEN_KEEPALIVE
  int nonorix_game_status(uint8_t *outRows, uint32_t rowsLen, uint8_t *outCols, uint32_t colsLen) {
    if (outRows == nullptr || outCols == nullptr) {
      return 0;
    }
    if (!checkReady("nonorix_game_status")) {
      return 0;
    }

    const std::vector<bool> &rows = g_picross->rowStatus();
    const std::vector<bool> &cols = g_picross->columnStatus();
    if ((std::size_t)rowsLen < rows.size() || (std::size_t)colsLen < cols.size()) {
      emscripten_log(EM_LOG_CONSOLE, "nonorix_game_status: buffers hold %u rows / %u cols, need %u / %u\n",
                     (unsigned)rowsLen, (unsigned)colsLen, (unsigned)rows.size(), (unsigned)cols.size());
      return 0;
    }
    for (std::size_t r = 0; r < rows.size(); r++) {
      outRows[r] = rows[r] ? 1 : 0;
    }
    for (std::size_t c = 0; c < cols.size(); c++) {
      outCols[c] = cols[c] ? 1 : 0;
    }
    return 1;
  }

  // Returns 0 in case of error, else 1.
  EMSCRIPTEN_KEEPALIVE
  int nonorix_game_is_solved(uint32_t *outSolved) {
    if (outSolved == nullptr) {
      return 0;
    }
    if (!checkReady("nonorix_game_is_solved")) {
      return 0;
    }

    return reportSolved(outSolved, g_picross->isSolved());
  }
} // extern "C"
