#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace hexword {

constexpr size_t kMinWordLength = 4;
constexpr int kAlphabetSize = 48;
constexpr int kMaxGridSide = 32;
constexpr int kDirectionCount = 6;
constexpr char kGapCell = '.';

enum class ErrorKind {
  kNone,
  kMalformedGrid,
  kMalformedCode,
  kUnknownClassificationWord,
  kInvalidAction,
  kIo,
};

struct Error {
  ErrorKind kind = ErrorKind::kNone;
  std::string message;
};

const char* ErrorKindName(ErrorKind kind);

// Letters are held in their ASCII transcription: the first 26 Shavian letters
// are 'A'..'Z', the remaining 22 are 'a'..'v'. Byte order matches alphabet
// order.
class Alphabet {
 public:
  static constexpr char32_t kFirstCodePoint = 0x10450;
  static constexpr char32_t kLastCodePoint = 0x1047F;

  static bool IsLetter(char c);
  static int Index(char c);
  static char LetterAt(int index);
  static char FromCodePoint(char32_t code_point);
  static char32_t ToCodePoint(char letter);

  // Decodes one UTF-8 sequence at |pos|. Returns the number of bytes used, or
  // 0 on an invalid sequence.
  static size_t DecodeUtf8(std::string_view text, size_t pos, char32_t* out);
  static void AppendUtf8(char32_t code_point, std::string* out);

  // Converts a word in Shavian UTF-8 and/or transcription to transcription.
  static bool NormalizeWord(std::string_view word, std::string* out);
  // Converts transcription letters to Shavian. Other bytes pass through.
  static std::string ToShavian(std::string_view letters);
};

struct Coord {
  int x = 0;
  int y = 0;
};

inline bool operator==(const Coord& a, const Coord& b) {
  return a.x == b.x && a.y == b.y;
}
inline bool operator!=(const Coord& a, const Coord& b) { return !(a == b); }

using Path = std::vector<Coord>;

// Compass order used everywhere a traversal order matters.
enum Direction : uint8_t {
  kUpLeft = 0,
  kUpRight = 1,
  kLeft = 2,
  kRight = 3,
  kDownLeft = 4,
  kDownRight = 5,
};

Coord Step(Coord from, int direction);
inline int ReverseDirection(int direction) { return 5 - direction; }
// Returns the direction leading from |from| to |to|, or -1.
int DirectionBetween(Coord from, Coord to);

class Grid {
 public:
  Grid() = default;

  static bool Parse(std::string_view text, Grid* out, Error* error);
  static bool FromCells(int width, int height, std::string cells, Grid* out,
                        Error* error);

  int width() const { return width_; }
  int height() const { return height_; }
  const std::string& cells() const { return cells_; }
  size_t present_count() const { return present_count_; }

  bool InBounds(Coord pos) const;
  bool IsPresent(Coord pos) const;
  // Transcription letter, or kGapCell.
  char At(Coord pos) const;
  int IndexOf(Coord pos) const { return pos.y * width_ + pos.x; }
  Coord CoordOf(int index) const { return {index % width_, index / width_}; }

  std::vector<Coord> Neighbors(Coord pos) const;
  bool IsAdjacent(Coord a, Coord b) const;
  // Distinct present cells, each consecutive pair adjacent.
  bool IsValidPath(const Path& path) const;
  std::string Spell(const Path& path) const;

  bool operator==(const Grid& other) const;
  bool operator!=(const Grid& other) const { return !(*this == other); }

 private:
  int width_ = 0;
  int height_ = 0;
  size_t present_count_ = 0;
  std::string cells_;
};

class Dictionary {
 public:
  // Half-open range of words sharing the prefix walked so far.
  struct Range {
    size_t begin = 0;
    size_t end = 0;
    bool empty() const { return begin >= end; }
  };

  bool LoadFile(const std::string& path, Error* error);
  void LoadText(std::string_view text);
  void SetWordList(const std::vector<std::string>& words);

  bool Contains(std::string_view word) const;
  bool HasPrefix(std::string_view prefix) const;

  Range All() const { return {0, words_.size()}; }
  Range Narrow(Range range, size_t depth, char letter) const;
  // True when the range holds a word exactly |length| letters long.
  bool IsWord(Range range, size_t length) const;

  size_t size() const { return words_.size(); }
  size_t rejected() const { return rejected_; }
  const std::vector<std::string>& words() const { return words_; }

 private:
  Range PrefixRange(std::string_view prefix) const;

  std::vector<std::string> words_;
  size_t rejected_ = 0;
};

struct FoundWord {
  std::string text;
  std::vector<Path> paths;
};

class WordFinder {
 public:
  explicit WordFinder(const Dictionary& dictionary,
                      size_t min_length = kMinWordLength);

  std::vector<FoundWord> FindAll(const Grid& grid) const;

  size_t min_length() const { return min_length_; }

 private:
  using WordPaths = std::map<std::string, std::vector<Path>>;
  struct SearchState;

  void SearchFrom(const Grid& grid, Coord start, WordPaths* out) const;
  void Extend(SearchState* state, Coord pos, Dictionary::Range range) const;

  const Dictionary& dictionary_;
  size_t min_length_;
};

enum class Classification : uint8_t {
  kNormal = 0,
  kBonus = 1,
  kExcluded = 2,
};

const char* ClassificationName(Classification classification);

struct PuzzleWord {
  std::string text;
  Classification classification = Classification::kNormal;
  std::vector<Path> paths;

  bool operator==(const PuzzleWord& other) const;
  bool operator!=(const PuzzleWord& other) const { return !(*this == other); }
};

struct Puzzle {
  Grid grid;
  std::vector<PuzzleWord> words;

  // Index into |words|, or -1.
  int FindWord(std::string_view text) const;
  size_t CountWords(Classification classification) const;

  bool operator==(const Puzzle& other) const;
  bool operator!=(const Puzzle& other) const { return !(*this == other); }
};

struct ClassificationLists {
  std::unordered_set<std::string> bonus;
  std::unordered_set<std::string> excluded;
};

// Adds the words of a bonus or excluded list to |out|, one per line with
// blank lines and '#' comments skipped. Words outside the alphabet are left
// out and counted; returns how many.
size_t ParseWordSet(std::string_view text,
                    std::unordered_set<std::string>* out);
// Reads a list file through ParseWordSet, adding the skipped count to
// |rejected|. Fails only when the file cannot be read.
bool LoadWordSet(const std::string& path, std::unordered_set<std::string>* out,
                 size_t* rejected, Error* error);
Puzzle BuildPuzzle(const Grid& grid, std::vector<FoundWord> found,
                   const ClassificationLists& lists,
                   std::vector<Error>* warnings);

class PuzzleCodec {
 public:
  static constexpr char kVersion = '1';

  static std::string Encode(const Puzzle& puzzle);
  static bool Decode(std::string_view code, Puzzle* out, Error* error);
};

class Catalog {
 public:
  struct Entry {
    size_t line = 0;
    std::shared_ptr<const Puzzle> puzzle;
  };
  struct LineError {
    size_t line = 0;
    std::string message;
  };

  bool LoadFile(const std::string& path, Error* error);
  void LoadText(std::string_view text);

  size_t size() const { return entries_.size(); }
  const Entry& entry(size_t index) const { return entries_[index]; }
  std::shared_ptr<const Puzzle> Get(size_t index) const;
  const std::vector<LineError>& errors() const { return errors_; }

 private:
  std::vector<Entry> entries_;
  std::vector<LineError> errors_;
};

struct CellCounts {
  uint32_t starts = 0;
  uint32_t visits = 0;
};

// Per-cell counts of words not yet found. |found| may be empty, meaning
// nothing is found. Excluded words never count.
std::vector<CellCounts> ComputeCellCounts(const Puzzle& puzzle,
                                          const std::vector<bool>& found);

std::string RenderReport(const Puzzle& puzzle, int max_score);

}  // namespace hexword
