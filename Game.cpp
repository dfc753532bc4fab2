#include "Game.hpp"

#include <algorithm>
#include <sstream>

namespace hexword {

const char* PhaseName(Phase phase) {
  switch (phase) {
    case Phase::kSelectingPuzzle:
      return "selecting";
    case Phase::kPlaying:
      return "playing";
    case Phase::kFinished:
      return "finished";
  }
  return "unknown";
}

const char* TraceOutcomeName(TraceOutcome outcome) {
  switch (outcome) {
    case TraceOutcome::kNoTrace:
      return "no-trace";
    case TraceOutcome::kTooShort:
      return "too-short";
    case TraceOutcome::kNotAWord:
      return "not-a-word";
    case TraceOutcome::kFound:
      return "found";
    case TraceOutcome::kBonusFound:
      return "bonus";
    case TraceOutcome::kAlreadyFound:
      return "already-found";
    case TraceOutcome::kExcluded:
      return "excluded";
  }
  return "unknown";
}

std::string NoticeText(const Notice& notice) {
  switch (notice.kind) {
    case NoticeKind::kPoints: {
      std::ostringstream out;
      out << "+" << notice.points << (notice.points == 1 ? " point!"
                                                           : " points!");
      return out.str();
    }
    case NoticeKind::kBonusWord:
      return "Bonus word!";
    case NoticeKind::kExcludedWord:
      return "That word is not counted";
    case NoticeKind::kNotAWord:
      return "Not in list";
    case NoticeKind::kTooShort:
      return "Too short";
  }
  return {};
}

GameState::GameState(ScoringConfig config) : config_(std::move(config)) {}

bool GameState::SelectPuzzle(std::shared_ptr<const Puzzle> puzzle) {
  if (phase_ != Phase::kSelectingPuzzle || !puzzle) {
    return false;
  }
  puzzle_ = std::move(puzzle);
  found_.assign(puzzle_->words.size(), false);
  found_order_.clear();
  normal_found_ = 0;
  bonus_found_ = 0;
  normal_total_ = puzzle_->CountWords(Classification::kNormal);
  phase_ = Phase::kPlaying;
  UpdatePhase();
  return true;
}

bool GameState::BeginTrace(Coord cell) {
  if (phase_ != Phase::kPlaying || !puzzle_->grid.IsPresent(cell)) {
    return false;
  }
  trace_.clear();
  trace_.push_back(cell);
  tracing_ = true;
  return true;
}

bool GameState::ExtendTrace(Coord cell) {
  if (phase_ != Phase::kPlaying || !tracing_ ||
      !puzzle_->grid.IsAdjacent(trace_.back(), cell)) {
    return false;
  }
  if (std::find(trace_.begin(), trace_.end(), cell) != trace_.end()) {
    return false;
  }
  trace_.push_back(cell);
  return true;
}

TraceOutcome GameState::EndTrace() {
  if (!tracing_) {
    return TraceOutcome::kNoTrace;
  }
  const std::string text = puzzle_->grid.Spell(trace_);
  trace_.clear();
  tracing_ = false;

  if (text.size() < kMinWordLength) {
    SetNotice(NoticeKind::kTooShort, text, 0);
    return TraceOutcome::kTooShort;
  }

  const int index = puzzle_->FindWord(text);
  if (index < 0) {
    ++misses_;
    SetNotice(NoticeKind::kNotAWord, text, 0);
    return TraceOutcome::kNotAWord;
  }

  if (found_[index]) {
    return TraceOutcome::kAlreadyFound;
  }

  const PuzzleWord& word = puzzle_->words[index];
  MarkFound(static_cast<size_t>(index));
  if (word.classification == Classification::kExcluded) {
    SetNotice(NoticeKind::kExcludedWord, text, 0);
    return TraceOutcome::kExcluded;
  }
  if (word.classification == Classification::kBonus) {
    SetNotice(NoticeKind::kBonusWord, text, 0);
    return TraceOutcome::kBonusFound;
  }
  SetNotice(NoticeKind::kPoints, text, WordPoints(config_, text.size()));
  UpdatePhase();
  return TraceOutcome::kFound;
}

bool GameState::SetHintLevel(int level) {
  if (!puzzle_ || level < 0 || level > kMaxHintLevel) {
    return false;
  }
  hint_level_ = level;
  max_hint_level_ = std::max(max_hint_level_, level);
  return true;
}

bool GameState::TakeNotice(Notice* out) {
  if (!has_notice_) {
    return false;
  }
  has_notice_ = false;
  if (out) {
    *out = notice_;
  }
  return true;
}

int GameState::Score() const {
  if (!puzzle_) {
    return 0;
  }
  int score = 0;
  for (size_t i = 0; i < found_.size(); ++i) {
    const PuzzleWord& word = puzzle_->words[i];
    if (found_[i] && word.classification == Classification::kNormal) {
      score += WordPoints(config_, word.text.size());
    }
  }
  return score;
}

bool GameState::IsFound(size_t word_index) const {
  return word_index < found_.size() && found_[word_index];
}

GameSnapshot GameState::Snapshot() const {
  GameSnapshot snapshot;
  snapshot.phase = phase_;
  snapshot.puzzle = puzzle_;
  snapshot.misses = misses_;
  snapshot.hint_level = hint_level_;
  snapshot.reveal_mode = reveal_mode_;
  if (!puzzle_) {
    return snapshot;
  }
  const Puzzle& puzzle = *puzzle_;

  snapshot.trace = trace_;
  snapshot.trace_text = puzzle.grid.Spell(trace_);
  snapshot.score = Score();
  snapshot.max_score = MaxScore(puzzle, config_);
  snapshot.level = ProgressLevel(snapshot.score, snapshot.max_score, config_);
  snapshot.normal_found = normal_found_;
  snapshot.normal_total = normal_total_;
  snapshot.bonus_found = bonus_found_;
  snapshot.bonus_total = puzzle.CountWords(Classification::kBonus);

  if (hint_level_ < kMaxHintLevel) {
    for (int index : found_order_) {
      const PuzzleWord& word = puzzle.words[index];
      if (word.classification != Classification::kNormal) {
        continue;
      }
      ListEntry entry;
      entry.word_index = index;
      entry.found = true;
      entry.length = word.text.size();
      entry.text = word.text;
      snapshot.words.push_back(std::move(entry));
    }
  } else if (reveal_mode_ == RevealMode::kAlphabetical) {
    snapshot.words = AlphabeticalInsertionView(puzzle, found_order_, found_);
  } else {
    snapshot.words =
        PartialRevealView(puzzle, found_order_, found_, config_);
  }

  for (int index : found_order_) {
    const PuzzleWord& word = puzzle.words[index];
    if (word.classification == Classification::kBonus) {
      snapshot.bonus_words.push_back(word.text);
    } else if (word.classification == Classification::kExcluded) {
      snapshot.excluded_words.push_back(word.text);
    }
  }

  for (size_t i = 0; i < puzzle.words.size(); ++i) {
    const PuzzleWord& word = puzzle.words[i];
    if (word.classification != Classification::kNormal || found_[i]) {
      continue;
    }
    if (snapshot.remaining_by_length.size() <= word.text.size()) {
      snapshot.remaining_by_length.resize(word.text.size() + 1, 0);
    }
    snapshot.remaining_by_length[word.text.size()]++;
  }

  if (hint_level_ >= 1) {
    snapshot.counts = ComputeCellCounts(puzzle, found_);
  }
  return snapshot;
}

SaveState GameState::Save() const {
  std::vector<size_t> found;
  for (int index : found_order_) {
    found.push_back(static_cast<size_t>(index));
  }
  return SaveState(misses_, max_hint_level_, found);
}

bool GameState::Restore(const SaveState& state, std::string* error) {
  if (phase_ != Phase::kPlaying) {
    if (error) {
      *error = "no puzzle in play";
    }
    return false;
  }
  if (state.hint_level() < 0 || state.hint_level() > kMaxHintLevel) {
    if (error) {
      *error = "invalid hint level";
    }
    return false;
  }
  std::vector<size_t> found = state.found_words();
  for (size_t index : found) {
    if (index >= puzzle_->words.size()) {
      if (error) {
        *error = "saved word index out of range";
      }
      return false;
    }
  }

  found_.assign(puzzle_->words.size(), false);
  found_order_.clear();
  normal_found_ = 0;
  bonus_found_ = 0;
  for (size_t index : found) {
    MarkFound(index);
  }
  misses_ = state.misses();
  hint_level_ = state.hint_level();
  max_hint_level_ = state.hint_level();
  trace_.clear();
  tracing_ = false;
  has_notice_ = false;
  UpdatePhase();
  return true;
}

void GameState::MarkFound(size_t word_index) {
  found_[word_index] = true;
  found_order_.push_back(static_cast<int>(word_index));
  switch (puzzle_->words[word_index].classification) {
    case Classification::kNormal:
      ++normal_found_;
      break;
    case Classification::kBonus:
      ++bonus_found_;
      break;
    case Classification::kExcluded:
      break;
  }
}

void GameState::UpdatePhase() {
  if (phase_ == Phase::kPlaying && normal_found_ == normal_total_) {
    phase_ = Phase::kFinished;
    trace_.clear();
    tracing_ = false;
  }
}

void GameState::SetNotice(NoticeKind kind, const std::string& word,
                          int points) {
  notice_.kind = kind;
  notice_.word = word;
  notice_.points = points;
  has_notice_ = true;
}

}  // namespace hexword
