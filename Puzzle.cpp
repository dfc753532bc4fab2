#include "Puzzle.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace hexword {
namespace {
void ReportUnknown(const std::unordered_set<std::string>& list,
                   const char* list_name,
                   const std::unordered_set<std::string>& found,
                   std::vector<Error>* warnings) {
  if (!warnings) {
    return;
  }
  std::vector<std::string> sorted(list.begin(), list.end());
  std::sort(sorted.begin(), sorted.end());
  for (const auto& word : sorted) {
    if (found.count(word) == 0) {
      Error warning;
      warning.kind = ErrorKind::kUnknownClassificationWord;
      warning.message = Alphabet::ToShavian(word) + " (" + list_name +
                        ") is not in the grid";
      warnings->push_back(std::move(warning));
    }
  }
}
}  // namespace

const char* ClassificationName(Classification classification) {
  switch (classification) {
    case Classification::kNormal:
      return "normal";
    case Classification::kBonus:
      return "bonus";
    case Classification::kExcluded:
      return "excluded";
  }
  return "unknown";
}

bool PuzzleWord::operator==(const PuzzleWord& other) const {
  return text == other.text && classification == other.classification &&
         paths == other.paths;
}

int Puzzle::FindWord(std::string_view text) const {
  for (size_t i = 0; i < words.size(); ++i) {
    if (words[i].text == text) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

size_t Puzzle::CountWords(Classification classification) const {
  size_t count = 0;
  for (const auto& word : words) {
    if (word.classification == classification) {
      ++count;
    }
  }
  return count;
}

bool Puzzle::operator==(const Puzzle& other) const {
  return grid == other.grid && words == other.words;
}

size_t ParseWordSet(std::string_view text,
                    std::unordered_set<std::string>* out) {
  size_t rejected = 0;
  std::string normalized;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t end = text.find('\n', pos);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(pos, end - pos);
    pos = end + 1;
    size_t first = line.find_first_not_of(" \t\r");
    if (first == std::string_view::npos || line[first] == '#') {
      continue;
    }
    size_t last = line.find_last_not_of(" \t\r");
    if (!Alphabet::NormalizeWord(line.substr(first, last - first + 1),
                                 &normalized)) {
      ++rejected;
      continue;
    }
    out->insert(normalized);
  }
  return rejected;
}

bool LoadWordSet(const std::string& path, std::unordered_set<std::string>* out,
                 size_t* rejected, Error* error) {
  std::ifstream infile(path);
  if (!infile) {
    if (error) {
      error->kind = ErrorKind::kIo;
      error->message = path + ": cannot open word list";
    }
    return false;
  }
  std::ostringstream contents;
  contents << infile.rdbuf();
  const size_t skipped = ParseWordSet(contents.str(), out);
  if (rejected) {
    *rejected += skipped;
  }
  return true;
}

Puzzle BuildPuzzle(const Grid& grid, std::vector<FoundWord> found,
                   const ClassificationLists& lists,
                   std::vector<Error>* warnings) {
  Puzzle puzzle;
  puzzle.grid = grid;
  puzzle.words.reserve(found.size());
  std::unordered_set<std::string> found_text;

  for (auto& word : found) {
    PuzzleWord entry;
    const bool excluded = lists.excluded.count(word.text) > 0;
    const bool bonus = lists.bonus.count(word.text) > 0;
    if (excluded) {
      entry.classification = Classification::kExcluded;
      if (bonus && warnings) {
        Error warning;
        warning.kind = ErrorKind::kUnknownClassificationWord;
        warning.message = Alphabet::ToShavian(word.text) +
                          " is in both the bonus and excluded lists; "
                          "treating it as excluded";
        warnings->push_back(std::move(warning));
      }
    } else if (bonus) {
      entry.classification = Classification::kBonus;
    }
    found_text.insert(word.text);
    entry.text = std::move(word.text);
    entry.paths = std::move(word.paths);
    puzzle.words.push_back(std::move(entry));
  }

  ReportUnknown(lists.bonus, "bonus", found_text, warnings);
  ReportUnknown(lists.excluded, "excluded", found_text, warnings);
  return puzzle;
}

std::vector<CellCounts> ComputeCellCounts(const Puzzle& puzzle,
                                          const std::vector<bool>& found) {
  const Grid& grid = puzzle.grid;
  std::vector<CellCounts> counts(grid.cells().size());
  std::vector<bool> started(grid.cells().size());
  std::vector<bool> touched(grid.cells().size());

  for (size_t i = 0; i < puzzle.words.size(); ++i) {
    const PuzzleWord& word = puzzle.words[i];
    if (word.classification == Classification::kExcluded ||
        (i < found.size() && found[i])) {
      continue;
    }
    std::fill(started.begin(), started.end(), false);
    std::fill(touched.begin(), touched.end(), false);
    for (const Path& path : word.paths) {
      if (path.empty()) {
        continue;
      }
      started[grid.IndexOf(path.front())] = true;
      for (const Coord& pos : path) {
        touched[grid.IndexOf(pos)] = true;
      }
    }
    for (size_t cell = 0; cell < counts.size(); ++cell) {
      if (started[cell]) {
        counts[cell].starts++;
      }
      if (touched[cell]) {
        counts[cell].visits++;
      }
    }
  }
  return counts;
}

}  // namespace hexword
