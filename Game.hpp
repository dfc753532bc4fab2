#pragma once

#include "Puzzle.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace hexword {

constexpr int kMaxHintLevel = 2;

// Replaceable tuning table for scoring, progress levels and letter reveal.
struct ScoringConfig {
  // Points for words of length kMinWordLength, kMinWordLength + 1, ...
  std::vector<int> points_by_length = {1, 2, 4, 7, 11, 16};
  // Added per letter for words longer than the table covers.
  int points_per_extra_letter = 6;
  // Fractions of the maximum score that mark each progress level.
  std::vector<double> level_thresholds = {0.1, 0.25, 0.5, 0.75};
  size_t reveal_leading = 1;
  size_t reveal_trailing = 1;
};

bool ValidateScoringConfig(const ScoringConfig& config, std::string* error);
// Parses "1,2,4,7" into |config->points_by_length|.
bool ParsePointsTable(std::string_view text, ScoringConfig* config,
                      std::string* error);

int WordPoints(const ScoringConfig& config, size_t length);
int MaxScore(const Puzzle& puzzle, const ScoringConfig& config);
int ProgressLevel(int score, int max_score, const ScoringConfig& config);

enum class RevealMode {
  kAlphabetical,
  kPartialLetters,
};

constexpr char kHiddenLetter = '_';

// One line of the displayed normal-word list. |text| holds transcription
// letters with hidden ones replaced by kHiddenLetter.
struct ListEntry {
  int word_index = -1;
  bool found = false;
  size_t length = 0;
  std::string text;
};

// Masks all but the first |leading| and last |trailing| letters. At least one
// letter always stays hidden.
std::string PartialReveal(std::string_view word, size_t leading,
                          size_t trailing);

// Found normal words in |found_order| merged with the unfound normal words in
// lexical order. Unfound entries are fully masked.
std::vector<ListEntry> AlphabeticalInsertionView(
    const Puzzle& puzzle, const std::vector<int>& found_order,
    const std::vector<bool>& found);

// Found normal words in |found_order| followed by the unfound ones in lexical
// order with their ends revealed.
std::vector<ListEntry> PartialRevealView(const Puzzle& puzzle,
                                         const std::vector<int>& found_order,
                                         const std::vector<bool>& found,
                                         const ScoringConfig& config);

enum class Phase {
  kSelectingPuzzle,
  kPlaying,
  kFinished,
};

enum class TraceOutcome {
  kNoTrace,
  kTooShort,
  kNotAWord,
  kFound,
  kBonusFound,
  kAlreadyFound,
  kExcluded,
};

const char* PhaseName(Phase phase);
const char* TraceOutcomeName(TraceOutcome outcome);

enum class NoticeKind {
  kPoints,
  kBonusWord,
  kExcludedWord,
  kNotAWord,
  kTooShort,
};

struct Notice {
  NoticeKind kind = NoticeKind::kNotAWord;
  // Transcription letters of the traced sequence.
  std::string word;
  int points = 0;
};

std::string NoticeText(const Notice& notice);

class SaveState {
 public:
  SaveState() = default;
  SaveState(uint32_t misses, int hint_level,
            const std::vector<size_t>& found_words);

  uint32_t misses() const { return misses_; }
  int hint_level() const { return hint_level_; }
  std::vector<size_t> found_words() const;

  std::string ToString() const;
  static bool Parse(std::string_view text, SaveState* out, std::string* error);

 private:
  uint32_t misses_ = 0;
  int hint_level_ = 0;
  std::vector<uint32_t> found_bits_;
};

struct GameSnapshot {
  Phase phase = Phase::kSelectingPuzzle;
  std::shared_ptr<const Puzzle> puzzle;
  Path trace;
  std::string trace_text;
  int score = 0;
  int max_score = 0;
  int level = 0;
  size_t normal_found = 0;
  size_t normal_total = 0;
  size_t bonus_found = 0;
  size_t bonus_total = 0;
  uint32_t misses = 0;
  int hint_level = 0;
  RevealMode reveal_mode = RevealMode::kAlphabetical;
  std::vector<ListEntry> words;
  std::vector<std::string> bonus_words;
  std::vector<std::string> excluded_words;
  // Unfound normal words per length, indexed by length.
  std::vector<size_t> remaining_by_length;
  // Empty below hint level 1.
  std::vector<CellCounts> counts;
};

// One puzzle session. Actions arrive serially from the display layer; invalid
// ones return false and leave the state untouched.
class GameState {
 public:
  explicit GameState(ScoringConfig config = ScoringConfig());

  bool SelectPuzzle(std::shared_ptr<const Puzzle> puzzle);

  bool BeginTrace(Coord cell);
  bool ExtendTrace(Coord cell);
  TraceOutcome EndTrace();

  bool SetHintLevel(int level);
  void SetRevealMode(RevealMode mode) { reveal_mode_ = mode; }

  // Returns the pending notice once.
  bool TakeNotice(Notice* out);

  Phase phase() const { return phase_; }
  int Score() const;
  int hint_level() const { return hint_level_; }
  int max_hint_level() const { return max_hint_level_; }
  uint32_t misses() const { return misses_; }
  const Path& trace() const { return trace_; }
  bool IsFound(size_t word_index) const;
  size_t normal_found() const { return normal_found_; }
  size_t bonus_found() const { return bonus_found_; }
  const std::shared_ptr<const Puzzle>& puzzle() const { return puzzle_; }
  const ScoringConfig& config() const { return config_; }

  GameSnapshot Snapshot() const;

  SaveState Save() const;
  bool Restore(const SaveState& state, std::string* error);

 private:
  void MarkFound(size_t word_index);
  void UpdatePhase();
  void SetNotice(NoticeKind kind, const std::string& word, int points);

  ScoringConfig config_;
  Phase phase_ = Phase::kSelectingPuzzle;
  std::shared_ptr<const Puzzle> puzzle_;
  std::vector<bool> found_;
  std::vector<int> found_order_;
  size_t normal_found_ = 0;
  size_t normal_total_ = 0;
  size_t bonus_found_ = 0;
  Path trace_;
  bool tracing_ = false;
  int hint_level_ = 0;
  int max_hint_level_ = 0;
  RevealMode reveal_mode_ = RevealMode::kAlphabetical;
  uint32_t misses_ = 0;
  bool has_notice_ = false;
  Notice notice_;
};

// Hexagon layout of a grid scaled to a display width, for mapping pointer
// positions to cells.
class Geometry {
 public:
  Geometry(const Grid& grid, double width);

  // Width of the widest row counted in half hexagons, up to its last present
  // cell. Odd rows add one half for their offset.
  static int HalfGridWidth(const Grid& grid);

  double radius() const { return radius_; }
  double step_x() const { return step_x_; }
  double step_y() const { return step_y_; }
  Eigen::Vector2d origin() const { return origin_; }
  double height() const { return height_; }

  Eigen::Vector2d CellCenter(Coord cell) const;
  // Finds the present cell whose hexagon contains |point|.
  bool CellAt(const Eigen::Vector2d& point, Coord* out) const;

 private:
  Grid grid_;
  double radius_ = 0.0;
  double step_x_ = 0.0;
  double step_y_ = 0.0;
  double height_ = 0.0;
  Eigen::Vector2d origin_ = Eigen::Vector2d::Zero();
};

}  // namespace hexword
