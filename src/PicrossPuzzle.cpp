#include "PicrossPuzzle.hpp"

#include <cstdlib>
#include <sstream>

// =========================================================
// Puzzle
// =========================================================

template class Puzzle<Color>;

// =========================================================
// Definition parser
// =========================================================

static inline bool isBlank(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static inline bool isDigitChar(char c) {
  return c >= '0' && c <= '9';
}

static std::size_t parseNumber(const std::string &token, std::size_t &pos) {
  const std::size_t start = pos;
  std::size_t n = 0;
  while (pos < token.size() && isDigitChar(token[pos])) {
    n = n * 10 + (std::size_t)(token[pos] - '0');
    if (n > 100000) {
      throw std::invalid_argument("run size too large in '" + token + "'");
    }
    pos++;
  }
  if (pos == start) {
    throw std::invalid_argument("expected a number in '" + token + "'");
  }
  return n;
}

// "3" or "3:2"
static ConstraintEntry<Color> parseEntry(const std::string &token) {
  std::size_t pos = 0;
  const std::size_t size = parseNumber(token, pos);

  Color color = COLOR_FULL;
  if (pos < token.size()) {
    if (token[pos] != ':') {
      throw std::invalid_argument("unexpected character in '" + token + "'");
    }
    pos++;
    const std::size_t c = parseNumber(token, pos);
    if (!isValidColor((int)c)) {
      std::ostringstream oss;
      oss << "colour " << c << " out of range 1.." << (int)COLOR_MAX << " in '" << token << "'";
      throw std::invalid_argument(oss.str());
    }
    color = (Color)c;
  }
  if (pos != token.size()) {
    throw std::invalid_argument("trailing characters in '" + token + "'");
  }

  return ConstraintEntry<Color>::of(size, color);
}

static Constraint<Color> parseLine(const std::string &line) {
  Constraint<Color> constraint;
  std::size_t i = 0;
  while (i < line.size()) {
    if (isBlank(line[i])) {
      i++;
      continue;
    }
    std::size_t j = i;
    while (j < line.size() && !isBlank(line[j])) {
      j++;
    }
    constraint.push_back(parseEntry(line.substr(i, j - i)));
    i = j;
  }
  return constraint;
}

ConstraintGroup<Color> parseConstraintGroup(const std::string &text) {
  ConstraintGroup<Color> group;
  std::size_t start = 0;
  while (true) {
    const std::size_t slash = text.find('/', start);
    const std::string line = text.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
    try {
      group.push_back(parseLine(line));
    } catch (const std::invalid_argument &e) {
      std::ostringstream oss;
      oss << "line " << group.size() << ": " << e.what();
      throw std::invalid_argument(oss.str());
    }
    if (slash == std::string::npos) {
      break;
    }
    start = slash + 1;
  }
  return group;
}
