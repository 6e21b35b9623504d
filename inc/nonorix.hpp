#ifndef NONORIX_H
#define NONORIX_H

#include <cstdint>

extern "C"
{
  int nonorix_game_init(const char *rows, const char *cols);

  int nonorix_game_place(uint32_t row, uint32_t col, uint8_t color, uint32_t *outSolved);

  int nonorix_game_cross_out(uint32_t row, uint32_t col, uint32_t *outSolved);

  int nonorix_game_clear(uint32_t row, uint32_t col, uint32_t *outSolved);

  int nonorix_game_set_auto_cross(int enabled);

  int nonorix_game_size(uint32_t *outWidth, uint32_t *outHeight);

  int nonorix_game_export(char *outCells, uint32_t outLen);

  int nonorix_game_status(uint8_t *outRows, uint32_t rowsLen, uint8_t *outCols, uint32_t colsLen);

  int nonorix_game_is_solved(uint32_t *outSolved);
} // extern "C"

#endif // NONORIX_H
