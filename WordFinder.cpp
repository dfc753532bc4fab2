#include "Puzzle.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

#include <algorithm>

namespace hexword {

struct WordFinder::SearchState {
  const Grid& grid;
  std::vector<bool> visited;
  Path path;
  std::string word;
  WordPaths* out;
};

WordFinder::WordFinder(const Dictionary& dictionary, size_t min_length)
    : dictionary_(dictionary),
      min_length_(std::max(min_length, kMinWordLength)) {}

std::vector<FoundWord> WordFinder::FindAll(const Grid& grid) const {
  const int cell_count = grid.width() * grid.height();
  std::vector<WordPaths> per_cell(static_cast<size_t>(cell_count));

  // Every start cell only reads the grid and dictionary and writes to its own
  // buffer, so the merge below sees the same data in the same order however
  // the loop is scheduled.
#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic)
  for (int index = 0; index < cell_count; ++index) {
    SearchFrom(grid, grid.CoordOf(index), &per_cell[index]);
  }
#else
  for (int index = 0; index < cell_count; ++index) {
    SearchFrom(grid, grid.CoordOf(index), &per_cell[index]);
  }
#endif

  WordPaths merged;
  for (auto& cell_words : per_cell) {
    for (auto& entry : cell_words) {
      auto& paths = merged[entry.first];
      for (auto& path : entry.second) {
        paths.push_back(std::move(path));
      }
    }
  }

  std::vector<FoundWord> words;
  words.reserve(merged.size());
  for (auto& entry : merged) {
    FoundWord found;
    found.text = entry.first;
    found.paths = std::move(entry.second);
    words.push_back(std::move(found));
  }
  return words;
}

void WordFinder::SearchFrom(const Grid& grid, Coord start,
                            WordPaths* out) const {
  if (!grid.IsPresent(start)) {
    return;
  }
  SearchState state{grid,
                    std::vector<bool>(grid.cells().size(), false),
                    {},
                    {},
                    out};
  Extend(&state, start, dictionary_.All());
}

void WordFinder::Extend(SearchState* state, Coord pos,
                        Dictionary::Range range) const {
  const char letter = state->grid.At(pos);
  const size_t depth = state->word.size();
  Dictionary::Range next = dictionary_.Narrow(range, depth, letter);
  if (next.empty()) {
    return;
  }

  const int index = state->grid.IndexOf(pos);
  state->visited[index] = true;
  state->path.push_back(pos);
  state->word.push_back(letter);

  if (state->word.size() >= min_length_ &&
      dictionary_.IsWord(next, state->word.size())) {
    (*state->out)[state->word].push_back(state->path);
  }

  for (int direction = 0; direction < kDirectionCount; ++direction) {
    Coord neighbor = Step(pos, direction);
    if (!state->grid.IsPresent(neighbor) ||
        state->visited[state->grid.IndexOf(neighbor)]) {
      continue;
    }
    Extend(state, neighbor, next);
  }

  state->word.pop_back();
  state->path.pop_back();
  state->visited[index] = false;
}

}  // namespace hexword
