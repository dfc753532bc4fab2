#include "Puzzle.hpp"

#include <iomanip>
#include <sstream>

namespace hexword {

std::string RenderReport(const Puzzle& puzzle, int max_score) {
  const Grid& grid = puzzle.grid;
  std::vector<CellCounts> counts = ComputeCellCounts(puzzle, {});
  std::ostringstream out;

  for (int y = 0; y < grid.height(); ++y) {
    const char* indent = (y & 1) ? "   " : "";
    out << indent;
    for (int x = 0; x < grid.width(); ++x) {
      char cell = grid.At({x, y});
      std::string letter =
          cell == kGapCell ? std::string(1, kGapCell)
                           : Alphabet::ToShavian(std::string(1, cell));
      out << "  " << letter << "   ";
    }
    out << "\n" << indent;
    for (int x = 0; x < grid.width(); ++x) {
      if (!grid.IsPresent({x, y})) {
        out << "      ";
        continue;
      }
      const CellCounts& count = counts[grid.IndexOf({x, y})];
      out << std::setw(2) << count.starts << " " << std::left << std::setw(3)
          << count.visits << std::right;
    }
    out << "\n";
  }

  out << "\nNormal words: " << puzzle.CountWords(Classification::kNormal)
      << "\nBonus words: " << puzzle.CountWords(Classification::kBonus)
      << "\nExcluded words: " << puzzle.CountWords(Classification::kExcluded)
      << "\nMaximum score: " << max_score << "\n\n";

  for (const auto& word : puzzle.words) {
    out << Alphabet::ToShavian(word.text);
    if (word.classification != Classification::kNormal) {
      out << " (" << ClassificationName(word.classification) << ")";
    }
    if (word.paths.size() > 1) {
      out << " [" << word.paths.size() << " paths]";
    }
    out << "\n";
  }
  return out.str();
}

}  // namespace hexword
