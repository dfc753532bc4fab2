#include "Game.hpp"

#include <algorithm>

namespace hexword {
namespace {
constexpr double kThresholdEpsilon = 1e-9;

bool IsUnfoundNormal(const Puzzle& puzzle, const std::vector<bool>& found,
                     size_t index) {
  return puzzle.words[index].classification == Classification::kNormal &&
         !(index < found.size() && found[index]);
}

std::vector<int> FoundNormalWords(const Puzzle& puzzle,
                                  const std::vector<int>& found_order) {
  std::vector<int> out;
  for (int index : found_order) {
    if (index >= 0 && static_cast<size_t>(index) < puzzle.words.size() &&
        puzzle.words[index].classification == Classification::kNormal) {
      out.push_back(index);
    }
  }
  return out;
}

std::vector<int> UnfoundNormalWords(const Puzzle& puzzle,
                                    const std::vector<bool>& found) {
  std::vector<int> out;
  for (size_t i = 0; i < puzzle.words.size(); ++i) {
    if (IsUnfoundNormal(puzzle, found, i)) {
      out.push_back(static_cast<int>(i));
    }
  }
  std::sort(out.begin(), out.end(), [&](int a, int b) {
    return puzzle.words[a].text < puzzle.words[b].text;
  });
  return out;
}

ListEntry MakeEntry(const Puzzle& puzzle, int index, bool found,
                    std::string text) {
  ListEntry entry;
  entry.word_index = index;
  entry.found = found;
  entry.length = puzzle.words[index].text.size();
  entry.text = std::move(text);
  return entry;
}
}  // namespace

bool ValidateScoringConfig(const ScoringConfig& config, std::string* error) {
  auto fail = [error](const char* message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (config.points_by_length.empty()) {
    return fail("points table is empty");
  }
  int previous = 0;
  for (int points : config.points_by_length) {
    if (points <= previous) {
      return fail("points table must be positive and strictly increasing");
    }
    previous = points;
  }
  if (config.points_per_extra_letter <= 0) {
    return fail("points per extra letter must be positive");
  }
  double previous_threshold = 0.0;
  for (double threshold : config.level_thresholds) {
    if (threshold <= previous_threshold || threshold > 1.0) {
      return fail("level thresholds must ascend within (0, 1]");
    }
    previous_threshold = threshold;
  }
  if (config.reveal_leading + config.reveal_trailing >= kMinWordLength) {
    return fail("partial reveal would show a whole word");
  }
  return true;
}

bool ParsePointsTable(std::string_view text, ScoringConfig* config,
                      std::string* error) {
  std::vector<int> points;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t end = text.find(',', pos);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view field = text.substr(pos, end - pos);
    if (field.empty() || field.size() > 6) {
      if (error) {
        *error = "invalid points table";
      }
      return false;
    }
    int value = 0;
    for (char c : field) {
      if (c < '0' || c > '9') {
        if (error) {
          *error = "invalid points table";
        }
        return false;
      }
      value = value * 10 + (c - '0');
    }
    points.push_back(value);
    pos = end + 1;
  }

  ScoringConfig candidate = *config;
  candidate.points_by_length = std::move(points);
  if (!ValidateScoringConfig(candidate, error)) {
    return false;
  }
  *config = std::move(candidate);
  return true;
}

int WordPoints(const ScoringConfig& config, size_t length) {
  if (length < kMinWordLength || config.points_by_length.empty()) {
    return 0;
  }
  const size_t index = length - kMinWordLength;
  const size_t table_size = config.points_by_length.size();
  if (index < table_size) {
    return config.points_by_length[index];
  }
  return config.points_by_length.back() +
         static_cast<int>(index - (table_size - 1)) *
             config.points_per_extra_letter;
}

int MaxScore(const Puzzle& puzzle, const ScoringConfig& config) {
  int total = 0;
  for (const auto& word : puzzle.words) {
    if (word.classification == Classification::kNormal) {
      total += WordPoints(config, word.text.size());
    }
  }
  return total;
}

int ProgressLevel(int score, int max_score, const ScoringConfig& config) {
  if (max_score <= 0) {
    return static_cast<int>(config.level_thresholds.size());
  }
  const double fraction =
      static_cast<double>(score) / static_cast<double>(max_score);
  int level = 0;
  for (double threshold : config.level_thresholds) {
    if (fraction + kThresholdEpsilon >= threshold) {
      ++level;
    }
  }
  return level;
}

std::string PartialReveal(std::string_view word, size_t leading,
                          size_t trailing) {
  std::string out(word.size(), kHiddenLetter);
  if (word.size() <= 1) {
    return out;
  }
  const size_t lead = std::min(leading, word.size() - 1);
  const size_t trail = std::min(trailing, word.size() - 1 - lead);
  for (size_t i = 0; i < lead; ++i) {
    out[i] = word[i];
  }
  for (size_t i = word.size() - trail; i < word.size(); ++i) {
    out[i] = word[i];
  }
  return out;
}

std::vector<ListEntry> AlphabeticalInsertionView(
    const Puzzle& puzzle, const std::vector<int>& found_order,
    const std::vector<bool>& found) {
  std::vector<int> found_words = FoundNormalWords(puzzle, found_order);
  std::vector<int> unfound_words = UnfoundNormalWords(puzzle, found);

  std::vector<ListEntry> out;
  out.reserve(found_words.size() + unfound_words.size());
  size_t i = 0;
  size_t j = 0;
  while (i < found_words.size() || j < unfound_words.size()) {
    const bool take_unfound =
        j < unfound_words.size() &&
        (i == found_words.size() ||
         puzzle.words[unfound_words[j]].text <
             puzzle.words[found_words[i]].text);
    if (take_unfound) {
      const int index = unfound_words[j++];
      out.push_back(MakeEntry(
          puzzle, index, false,
          std::string(puzzle.words[index].text.size(), kHiddenLetter)));
    } else {
      const int index = found_words[i++];
      out.push_back(MakeEntry(puzzle, index, true, puzzle.words[index].text));
    }
  }
  return out;
}

std::vector<ListEntry> PartialRevealView(const Puzzle& puzzle,
                                         const std::vector<int>& found_order,
                                         const std::vector<bool>& found,
                                         const ScoringConfig& config) {
  std::vector<ListEntry> out;
  for (int index : FoundNormalWords(puzzle, found_order)) {
    out.push_back(MakeEntry(puzzle, index, true, puzzle.words[index].text));
  }
  for (int index : UnfoundNormalWords(puzzle, found)) {
    out.push_back(MakeEntry(
        puzzle, index, false,
        PartialReveal(puzzle.words[index].text, config.reveal_leading,
                      config.reveal_trailing)));
  }
  return out;
}

}  // namespace hexword
