#include "PicrossBoard.hpp"

// =========================================================
// Board (colour instantiation used by the game API)
// =========================================================

template class LineView<Color>;
template class Board<Color>;
