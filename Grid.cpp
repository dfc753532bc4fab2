#include "Puzzle.hpp"

#include <algorithm>
#include <sstream>

namespace hexword {
namespace {
// Odd rows sit half a cell to the right of even rows:
//
//   a b c d
//    e f g h
//   i j k l
//
// so the diagonal neighbours depend on the parity of the row.
constexpr int kOffsets[2][kDirectionCount][2] = {
    // Even rows.
    {{-1, -1}, {0, -1}, {-1, 0}, {1, 0}, {-1, 1}, {0, 1}},
    // Odd rows.
    {{0, -1}, {1, -1}, {-1, 0}, {1, 0}, {0, 1}, {1, 1}},
};

bool IsBlank(std::string_view line) {
  for (char c : line) {
    if (c != ' ' && c != '\t' && c != '\r') {
      return false;
    }
  }
  return true;
}

void SetError(Error* error, const std::string& message) {
  if (error) {
    error->kind = ErrorKind::kMalformedGrid;
    error->message = message;
  }
}

// Splits one authoring row into cells. Whitespace carries no meaning.
bool ParseRow(std::string_view line, size_t row, std::string* cells,
              Error* error) {
  size_t pos = 0;
  size_t column = 0;
  while (pos < line.size()) {
    char32_t code_point = 0;
    size_t used = Alphabet::DecodeUtf8(line, pos, &code_point);
    if (used == 0) {
      std::ostringstream message;
      message << "row " << (row + 1) << ": invalid UTF-8 at byte "
              << (pos + 1);
      SetError(error, message.str());
      return false;
    }
    pos += used;
    ++column;
    if (code_point == ' ' || code_point == '\t' || code_point == '\r') {
      continue;
    }
    if (code_point == static_cast<char32_t>(kGapCell)) {
      cells->push_back(kGapCell);
      continue;
    }
    char letter = Alphabet::FromCodePoint(code_point);
    if (letter == '\0') {
      std::ostringstream message;
      message << "row " << (row + 1) << ", column " << column
              << ": unsupported character";
      SetError(error, message.str());
      return false;
    }
    cells->push_back(letter);
  }
  return true;
}
}  // namespace

Coord Step(Coord from, int direction) {
  const int* offset = kOffsets[from.y & 1][direction];
  return {from.x + offset[0], from.y + offset[1]};
}

int DirectionBetween(Coord from, Coord to) {
  for (int direction = 0; direction < kDirectionCount; ++direction) {
    if (Step(from, direction) == to) {
      return direction;
    }
  }
  return -1;
}

bool Grid::Parse(std::string_view text, Grid* out, Error* error) {
  std::vector<std::string_view> lines;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }

  size_t first = 0;
  while (first < lines.size() && IsBlank(lines[first])) {
    ++first;
  }
  size_t last = lines.size();
  while (last > first && IsBlank(lines[last - 1])) {
    --last;
  }
  if (first == last) {
    SetError(error, "empty grid");
    return false;
  }

  std::vector<std::string> rows;
  size_t width = 0;
  for (size_t i = first; i < last; ++i) {
    size_t row = rows.size();
    if (IsBlank(lines[i])) {
      std::ostringstream message;
      message << "blank line inside the grid before row " << (row + 1);
      SetError(error, message.str());
      return false;
    }
    std::string cells;
    if (!ParseRow(lines[i], row, &cells, error)) {
      return false;
    }
    if (std::count(cells.begin(), cells.end(), kGapCell) ==
        static_cast<std::ptrdiff_t>(cells.size())) {
      std::ostringstream message;
      message << "row " << (row + 1) << " has no letters";
      SetError(error, message.str());
      return false;
    }
    width = std::max(width, cells.size());
    rows.push_back(std::move(cells));
  }

  std::string cells;
  cells.reserve(width * rows.size());
  for (auto& row : rows) {
    row.resize(width, kGapCell);
    cells += row;
  }
  return FromCells(static_cast<int>(width), static_cast<int>(rows.size()),
                   std::move(cells), out, error);
}

bool Grid::FromCells(int width, int height, std::string cells, Grid* out,
                     Error* error) {
  if (width < 1 || height < 1 || width > kMaxGridSide ||
      height > kMaxGridSide) {
    std::ostringstream message;
    message << "grid is " << width << "x" << height << ", limit is "
            << kMaxGridSide << "x" << kMaxGridSide;
    SetError(error, message.str());
    return false;
  }
  if (cells.size() != static_cast<size_t>(width) * height) {
    SetError(error, "cell count does not match the grid shape");
    return false;
  }
  size_t present = 0;
  for (char c : cells) {
    if (c == kGapCell) {
      continue;
    }
    if (!Alphabet::IsLetter(c)) {
      SetError(error, "unsupported character in grid");
      return false;
    }
    ++present;
  }
  if (present == 0) {
    SetError(error, "empty grid");
    return false;
  }
  out->width_ = width;
  out->height_ = height;
  out->present_count_ = present;
  out->cells_ = std::move(cells);
  return true;
}

bool Grid::InBounds(Coord pos) const {
  return pos.x >= 0 && pos.y >= 0 && pos.x < width_ && pos.y < height_;
}

bool Grid::IsPresent(Coord pos) const {
  return InBounds(pos) && cells_[IndexOf(pos)] != kGapCell;
}

char Grid::At(Coord pos) const {
  if (!InBounds(pos)) {
    return kGapCell;
  }
  return cells_[IndexOf(pos)];
}

std::vector<Coord> Grid::Neighbors(Coord pos) const {
  std::vector<Coord> out;
  if (!IsPresent(pos)) {
    return out;
  }
  for (int direction = 0; direction < kDirectionCount; ++direction) {
    Coord next = Step(pos, direction);
    if (IsPresent(next)) {
      out.push_back(next);
    }
  }
  return out;
}

bool Grid::IsAdjacent(Coord a, Coord b) const {
  return IsPresent(a) && IsPresent(b) && DirectionBetween(a, b) >= 0;
}

bool Grid::IsValidPath(const Path& path) const {
  if (path.empty()) {
    return false;
  }
  std::vector<bool> visited(cells_.size(), false);
  for (size_t i = 0; i < path.size(); ++i) {
    if (!IsPresent(path[i])) {
      return false;
    }
    int index = IndexOf(path[i]);
    if (visited[index]) {
      return false;
    }
    visited[index] = true;
    if (i > 0 && DirectionBetween(path[i - 1], path[i]) < 0) {
      return false;
    }
  }
  return true;
}

std::string Grid::Spell(const Path& path) const {
  std::string word;
  word.reserve(path.size());
  for (const Coord& pos : path) {
    word.push_back(At(pos));
  }
  return word;
}

bool Grid::operator==(const Grid& other) const {
  return width_ == other.width_ && height_ == other.height_ &&
         cells_ == other.cells_;
}

}  // namespace hexword
