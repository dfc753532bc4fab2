#include "Puzzle.hpp"

#include <set>
#include <sstream>

namespace hexword {
namespace {
constexpr char kDigits[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
constexpr uint32_t kVarintBits = 5;
constexpr uint32_t kVarintMask = 0x1F;
constexpr uint32_t kVarintMore = 0x20;
constexpr uint32_t kMaxVarintShift = 25;

int DigitValue(char c) {
  if (c >= 'A' && c <= 'Z') {
    return c - 'A';
  }
  if (c >= 'a' && c <= 'z') {
    return c - 'a' + 26;
  }
  if (c >= '0' && c <= '9') {
    return c - '0' + 52;
  }
  if (c == '-') {
    return 62;
  }
  if (c == '_') {
    return 63;
  }
  return -1;
}

void WriteDigit(int value, std::string* out) { out->push_back(kDigits[value]); }

void WriteVarint(uint32_t value, std::string* out) {
  do {
    uint32_t digit = value & kVarintMask;
    value >>= kVarintBits;
    if (value != 0) {
      digit |= kVarintMore;
    }
    WriteDigit(static_cast<int>(digit), out);
  } while (value != 0);
}

class Reader {
 public:
  explicit Reader(std::string_view text) : text_(text) {}

  bool AtEnd() const { return pos_ >= text_.size(); }
  size_t pos() const { return pos_; }

  bool ReadDigit(int* out) {
    if (AtEnd()) {
      return false;
    }
    int value = DigitValue(text_[pos_]);
    if (value < 0) {
      return false;
    }
    ++pos_;
    *out = value;
    return true;
  }

  bool ReadVarint(uint32_t* out) {
    uint32_t value = 0;
    uint32_t shift = 0;
    while (true) {
      int digit = 0;
      if (!ReadDigit(&digit)) {
        return false;
      }
      value |= (static_cast<uint32_t>(digit) & kVarintMask) << shift;
      if ((static_cast<uint32_t>(digit) & kVarintMore) == 0) {
        break;
      }
      shift += kVarintBits;
      if (shift > kMaxVarintShift) {
        return false;
      }
    }
    *out = value;
    return true;
  }

  bool ReadRaw(size_t count, std::string_view* out) {
    if (text_.size() - pos_ < count) {
      return false;
    }
    *out = text_.substr(pos_, count);
    pos_ += count;
    return true;
  }

 private:
  std::string_view text_;
  size_t pos_ = 0;
};

bool Fail(Error* error, size_t pos, const std::string& message) {
  if (error) {
    std::ostringstream out;
    out << message << " (offset " << pos << ")";
    error->kind = ErrorKind::kMalformedCode;
    error->message = out.str();
  }
  return false;
}

bool ReadPath(Reader* reader, const Grid& grid, Path* path, Error* error) {
  uint32_t start = 0;
  uint32_t length = 0;
  if (!reader->ReadVarint(&start) || !reader->ReadVarint(&length)) {
    return Fail(error, reader->pos(), "truncated path");
  }
  if (start >= grid.cells().size()) {
    return Fail(error, reader->pos(), "path starts outside the grid");
  }
  if (length < kMinWordLength || length > grid.present_count()) {
    return Fail(error, reader->pos(), "invalid path length");
  }

  std::vector<bool> visited(grid.cells().size(), false);
  Coord pos = grid.CoordOf(static_cast<int>(start));
  path->clear();
  path->reserve(length);

  auto visit = [&](Coord next) {
    if (!grid.IsPresent(next)) {
      return Fail(error, reader->pos(), "path crosses a gap or the edge");
    }
    int index = grid.IndexOf(next);
    if (visited[index]) {
      return Fail(error, reader->pos(), "path revisits a cell");
    }
    visited[index] = true;
    path->push_back(next);
    return true;
  };

  if (!visit(pos)) {
    return false;
  }
  uint32_t remaining = length - 1;
  while (remaining > 0) {
    int packed = 0;
    if (!reader->ReadDigit(&packed)) {
      return Fail(error, reader->pos(), "truncated path steps");
    }
    int first = packed / kDirectionCount;
    int second = packed % kDirectionCount;
    if (first >= kDirectionCount || (remaining == 1 && second != 0)) {
      return Fail(error, reader->pos(), "invalid direction");
    }
    pos = Step(pos, first);
    if (!visit(pos)) {
      return false;
    }
    --remaining;
    if (remaining > 0) {
      pos = Step(pos, second);
      if (!visit(pos)) {
        return false;
      }
      --remaining;
    }
  }
  return true;
}
}  // namespace

std::string PuzzleCodec::Encode(const Puzzle& puzzle) {
  const Grid& grid = puzzle.grid;
  std::string out;
  out.push_back(kVersion);
  WriteVarint(static_cast<uint32_t>(grid.width()), &out);
  WriteVarint(static_cast<uint32_t>(grid.height()), &out);
  out += grid.cells();

  for (const auto& word : puzzle.words) {
    WriteDigit(static_cast<int>(word.classification), &out);
    WriteVarint(static_cast<uint32_t>(word.paths.size()), &out);
    for (const Path& path : word.paths) {
      WriteVarint(static_cast<uint32_t>(grid.IndexOf(path.front())), &out);
      WriteVarint(static_cast<uint32_t>(path.size()), &out);
      for (size_t i = 1; i < path.size(); i += 2) {
        int first = DirectionBetween(path[i - 1], path[i]);
        int second = 0;
        if (i + 1 < path.size()) {
          second = DirectionBetween(path[i], path[i + 1]);
        }
        WriteDigit(first * kDirectionCount + second, &out);
      }
    }
  }
  return out;
}

bool PuzzleCodec::Decode(std::string_view code, Puzzle* out, Error* error) {
  Reader reader(code);
  std::string_view version;
  if (!reader.ReadRaw(1, &version) || version[0] != kVersion) {
    return Fail(error, 0, "unsupported puzzle code version");
  }

  uint32_t width = 0;
  uint32_t height = 0;
  if (!reader.ReadVarint(&width) || !reader.ReadVarint(&height) ||
      width < 1 || height < 1 || width > kMaxGridSide ||
      height > kMaxGridSide) {
    return Fail(error, reader.pos(), "invalid grid dimensions");
  }

  std::string_view cells;
  if (!reader.ReadRaw(width * height, &cells)) {
    return Fail(error, reader.pos(), "truncated grid");
  }
  Puzzle puzzle;
  Error grid_error;
  if (!Grid::FromCells(static_cast<int>(width), static_cast<int>(height),
                       std::string(cells), &puzzle.grid, &grid_error)) {
    return Fail(error, reader.pos(), grid_error.message);
  }

  std::set<std::string> seen_words;
  while (!reader.AtEnd()) {
    int tag = 0;
    if (!reader.ReadDigit(&tag) ||
        tag > static_cast<int>(Classification::kExcluded)) {
      return Fail(error, reader.pos(), "invalid classification tag");
    }
    uint32_t path_count = 0;
    if (!reader.ReadVarint(&path_count) || path_count == 0) {
      return Fail(error, reader.pos(), "word has no paths");
    }

    PuzzleWord word;
    word.classification = static_cast<Classification>(tag);
    for (uint32_t i = 0; i < path_count; ++i) {
      Path path;
      if (!ReadPath(&reader, puzzle.grid, &path, error)) {
        return false;
      }
      std::string text = puzzle.grid.Spell(path);
      if (i == 0) {
        word.text = std::move(text);
      } else if (text != word.text) {
        return Fail(error, reader.pos(), "paths of one word spell "
                                         "different words");
      }
      for (const Path& other : word.paths) {
        if (other == path) {
          return Fail(error, reader.pos(), "duplicated path");
        }
      }
      word.paths.push_back(std::move(path));
    }
    if (!seen_words.insert(word.text).second) {
      return Fail(error, reader.pos(), "word appears twice");
    }
    puzzle.words.push_back(std::move(word));
  }

  *out = std::move(puzzle);
  return true;
}

}  // namespace hexword
