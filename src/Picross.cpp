#include "Picross.hpp"

// =========================================================
// Picross (colour instantiation used by the game API)
// =========================================================

template class Picross<Color>;
