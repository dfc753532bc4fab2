#include "Game.hpp"
#include "Puzzle.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {
int g_failures = 0;

void ExpectTrue(bool condition, const char* message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    ++g_failures;
  }
}

void ExpectFalse(bool condition, const char* message) {
  ExpectTrue(!condition, message);
}

hexword::Grid ParseGrid(const std::string& text) {
  hexword::Grid grid;
  hexword::Error error;
  if (!hexword::Grid::Parse(text, &grid, &error)) {
    std::cerr << "grid setup failed: " << error.message << "\n";
    ++g_failures;
  }
  return grid;
}

void CollectSpellings(const hexword::Grid& grid, hexword::Path* path,
                      size_t length, std::vector<std::string>* out) {
  if (path->size() == length) {
    out->push_back(grid.Spell(*path));
    return;
  }
  for (const auto& next : grid.Neighbors(path->back())) {
    if (std::find(path->begin(), path->end(), next) != path->end()) {
      continue;
    }
    path->push_back(next);
    CollectSpellings(grid, path, length, out);
    path->pop_back();
  }
}

// Sorted spellings of every simple path of |length| cells.
std::vector<std::string> Spellings(const hexword::Grid& grid, size_t length) {
  std::vector<std::string> out;
  for (int y = 0; y < grid.height(); ++y) {
    for (int x = 0; x < grid.width(); ++x) {
      if (grid.IsPresent({x, y})) {
        hexword::Path path = {{x, y}};
        CollectSpellings(grid, &path, length, &out);
      }
    }
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

std::shared_ptr<const hexword::Puzzle> MakePuzzle(
    const hexword::Grid& grid, const std::vector<std::string>& words,
    const hexword::ClassificationLists& lists) {
  hexword::Dictionary dictionary;
  dictionary.SetWordList(words);
  hexword::WordFinder finder(dictionary);
  return std::make_shared<hexword::Puzzle>(
      hexword::BuildPuzzle(grid, finder.FindAll(grid), lists, nullptr));
}

// The test grids hold each letter once, so a spelling names one path.
hexword::Path PathOfLetters(const hexword::Grid& grid,
                            const std::string& word) {
  hexword::Path path;
  for (char letter : word) {
    size_t index = grid.cells().find(letter);
    if (index == std::string::npos) {
      std::cerr << "letter missing in setup: " << letter << "\n";
      ++g_failures;
      return {};
    }
    path.push_back(grid.CoordOf(static_cast<int>(index)));
  }
  return path;
}

bool Trace(hexword::GameState* game, const hexword::Path& path) {
  if (path.empty() || !game->BeginTrace(path.front())) {
    return false;
  }
  for (size_t i = 1; i < path.size(); ++i) {
    if (!game->ExtendTrace(path[i])) {
      return false;
    }
  }
  return true;
}

hexword::TraceOutcome TraceWord(hexword::GameState* game,
                                const std::string& word) {
  Trace(game, PathOfLetters(game->puzzle()->grid, word));
  return game->EndTrace();
}

size_t RevealedLetters(const std::string& text) {
  return static_cast<size_t>(std::count_if(
      text.begin(), text.end(),
      [](char c) { return c != hexword::kHiddenLetter; }));
}

// Letters the word list shows for each word in the puzzle's word table.
std::vector<size_t> RevealedPerWord(const hexword::GameSnapshot& snapshot) {
  std::vector<size_t> out(snapshot.puzzle->words.size(), 0);
  for (const auto& entry : snapshot.words) {
    out[entry.word_index] = RevealedLetters(entry.text);
  }
  return out;
}
}  // namespace

int main() {
  const hexword::Grid grid = ParseGrid("ABCD\nEFGH\nIJKL");
  const std::vector<std::string> spellings = Spellings(grid, 4);
  ExpectTrue(spellings.size() > 12, "test grid should have many paths");
  // Ten normal words and one excluded word; the twelfth path is not a word.
  const std::vector<std::string> words(spellings.begin(),
                                       spellings.begin() + 11);
  const std::string excluded = words[10];
  const std::string not_a_word = spellings[11];
  hexword::ClassificationLists lists;
  lists.excluded.insert(excluded);
  const std::shared_ptr<const hexword::Puzzle> puzzle =
      MakePuzzle(grid, words, lists);
  ExpectTrue(puzzle->CountWords(hexword::Classification::kNormal) == 10 &&
                 puzzle->CountWords(hexword::Classification::kExcluded) == 1,
             "setup should give ten normal words and one excluded");

  {
    hexword::ScoringConfig config;
    std::string error;
    ExpectTrue(hexword::ValidateScoringConfig(config, &error),
               "default scoring should be valid");
    bool increasing = true;
    for (size_t length = hexword::kMinWordLength; length < 20; ++length) {
      if (hexword::WordPoints(config, length + 1) <=
          hexword::WordPoints(config, length)) {
        increasing = false;
      }
    }
    ExpectTrue(increasing, "longer words should be worth more");
    ExpectTrue(hexword::WordPoints(config, 3) == 0,
               "short words should score nothing");
    const size_t past_table =
        hexword::kMinWordLength + config.points_by_length.size();
    ExpectTrue(hexword::WordPoints(config, past_table + 1) -
                       hexword::WordPoints(config, past_table) ==
                   config.points_per_extra_letter,
               "words past the table should gain a fixed amount per letter");
    ExpectTrue(4 * hexword::WordPoints(config, 4) <
                   hexword::WordPoints(config, 8),
               "a long word should outscore several short ones");

    hexword::ScoringConfig bad = config;
    bad.points_by_length = {1, 3, 3};
    ExpectFalse(hexword::ValidateScoringConfig(bad, &error),
                "flat points table should be rejected");
    bad = config;
    bad.reveal_leading = 2;
    bad.reveal_trailing = 2;
    ExpectFalse(hexword::ValidateScoringConfig(bad, &error),
                "reveal that shows a whole word should be rejected");
    bad = config;
    bad.level_thresholds = {0.5, 0.25};
    ExpectFalse(hexword::ValidateScoringConfig(bad, &error),
                "descending thresholds should be rejected");

    hexword::ScoringConfig parsed;
    ExpectTrue(hexword::ParsePointsTable("1,3,9", &parsed, &error),
               "points table should parse");
    ExpectTrue(parsed.points_by_length == std::vector<int>({1, 3, 9}),
               "parsed table should replace the default");
    ExpectFalse(hexword::ParsePointsTable("1,,3", &parsed, &error),
                "empty field should fail");
    ExpectFalse(hexword::ParsePointsTable("3,2", &parsed, &error),
                "decreasing table should fail");
    ExpectFalse(hexword::ParsePointsTable("1,x", &parsed, &error),
                "non-numeric field should fail");
    ExpectTrue(parsed.points_by_length == std::vector<int>({1, 3, 9}),
               "failed parse should leave the table unchanged");

    const int max_score = hexword::MaxScore(*puzzle, config);
    ExpectTrue(max_score == 10 * hexword::WordPoints(config, 4),
               "max score should sum normal words only");
    ExpectTrue(hexword::ProgressLevel(0, max_score, config) == 0,
               "no score should be level zero");
    ExpectTrue(hexword::ProgressLevel(max_score, max_score, config) ==
                   static_cast<int>(config.level_thresholds.size()),
               "full score should reach the top level");
    bool monotonic = true;
    for (int score = 1; score <= max_score; ++score) {
      if (hexword::ProgressLevel(score, max_score, config) <
          hexword::ProgressLevel(score - 1, max_score, config)) {
        monotonic = false;
      }
    }
    ExpectTrue(monotonic, "levels should never drop as score rises");
  }

  {
    ExpectTrue(hexword::PartialReveal("ABCD", 1, 1) == "A__D",
               "reveal should show the ends of a word");
    ExpectTrue(hexword::PartialReveal("ABCDEFG", 1, 1) == "A_____G",
               "reveal should hide the middle of long words");
    ExpectTrue(hexword::PartialReveal("ABCD", 3, 3) == "ABC_",
               "reveal should always hide a letter");
    ExpectTrue(RevealedLetters(hexword::PartialReveal("ABCD", 1, 2)) < 4,
               "shortest words should never be fully revealed");
  }

  {
    hexword::GameState game;
    ExpectTrue(game.phase() == hexword::Phase::kSelectingPuzzle,
               "new session should be selecting");
    ExpectFalse(game.BeginTrace({0, 0}),
                "tracing before a puzzle should be rejected");
    ExpectTrue(game.EndTrace() == hexword::TraceOutcome::kNoTrace,
               "ending without a trace should do nothing");
    ExpectTrue(game.SelectPuzzle(puzzle), "puzzle should be selected");
    ExpectTrue(game.phase() == hexword::Phase::kPlaying,
               "selected puzzle should be playing");
    ExpectFalse(game.SelectPuzzle(puzzle),
                "selecting twice should be rejected");

    ExpectFalse(game.BeginTrace({9, 9}),
                "trace should not begin outside the grid");
    ExpectTrue(game.BeginTrace({0, 0}), "trace should begin on a letter");
    ExpectFalse(game.ExtendTrace({2, 0}),
                "trace should not jump to a far cell");
    ExpectTrue(game.ExtendTrace({1, 0}), "trace should extend to a neighbour");
    ExpectFalse(game.ExtendTrace({0, 0}),
                "trace should not revisit a cell");
    ExpectTrue(game.trace().size() == 2,
               "rejected steps should leave the trace unchanged");
    ExpectTrue(game.EndTrace() == hexword::TraceOutcome::kTooShort,
               "two letters should be too short");
    hexword::Notice notice;
    ExpectTrue(game.TakeNotice(&notice) &&
                   notice.kind == hexword::NoticeKind::kTooShort,
               "short trace should leave a notice");
    ExpectFalse(game.TakeNotice(&notice), "notices should be taken once");
    ExpectTrue(game.trace().empty(), "trace should be discarded");
    ExpectTrue(game.misses() == 0, "short traces should not count as misses");

    ExpectTrue(TraceWord(&game, not_a_word) ==
                   hexword::TraceOutcome::kNotAWord,
               "unlisted path should not be a word");
    ExpectTrue(game.misses() == 1, "unlisted words should count as misses");
    ExpectTrue(game.TakeNotice(&notice) &&
                   notice.kind == hexword::NoticeKind::kNotAWord,
               "unlisted word should leave a notice");

    ExpectTrue(TraceWord(&game, excluded) == hexword::TraceOutcome::kExcluded,
               "excluded word should be reported");
    ExpectTrue(game.TakeNotice(&notice) &&
                   notice.kind == hexword::NoticeKind::kExcludedWord,
               "excluded word should leave a notice");
    ExpectTrue(game.Score() == 0 && game.normal_found() == 0,
               "excluded word should not score");
    ExpectTrue(
        TraceWord(&game, excluded) == hexword::TraceOutcome::kAlreadyFound,
        "re-tracing an excluded word should be a no-op");
    ExpectFalse(game.TakeNotice(&notice),
                "excluded notice should be shown once");
    ExpectTrue(game.Snapshot().excluded_words.size() == 1,
               "excluded word should be listed once");

    int previous_score = 0;
    bool monotonic = true;
    for (int i = 0; i < 10; ++i) {
      ExpectTrue(game.phase() == hexword::Phase::kPlaying,
                 "game should play until the last normal word");
      hexword::TraceOutcome outcome = TraceWord(&game, words[i]);
      ExpectTrue(outcome == hexword::TraceOutcome::kFound,
                 "normal word should be found");
      ExpectTrue(game.TakeNotice(&notice) &&
                     notice.kind == hexword::NoticeKind::kPoints &&
                     notice.points == hexword::WordPoints(game.config(), 4),
                 "found word should announce its points");
      if (game.Score() < previous_score) {
        monotonic = false;
      }
      previous_score = game.Score();
      if (i == 0 && game.phase() == hexword::Phase::kPlaying) {
        ExpectTrue(TraceWord(&game, words[0]) ==
                       hexword::TraceOutcome::kAlreadyFound,
                   "re-tracing should be a no-op");
        ExpectFalse(game.TakeNotice(&notice),
                    "re-tracing should not leave a notice");
        ExpectTrue(game.Score() == previous_score,
                   "re-tracing should not change the score");
      }
    }
    ExpectTrue(monotonic, "score should never decrease");
    ExpectTrue(game.phase() == hexword::Phase::kFinished,
               "finding every normal word should finish the game");
    ExpectTrue(game.Score() == hexword::MaxScore(*puzzle, game.config()),
               "finished game should have the max score");
    ExpectFalse(game.BeginTrace({0, 0}),
                "finished game should reject traces");
  }

  {
    hexword::GameState game;
    game.SelectPuzzle(puzzle);
    for (int i = 0; i < 10; ++i) {
      TraceWord(&game, words[i]);
    }
    ExpectTrue(game.phase() == hexword::Phase::kFinished,
               "excluded word should not gate completion");
  }

  {
    hexword::ClassificationLists bonus_lists;
    bonus_lists.bonus.insert(words[0]);
    std::shared_ptr<const hexword::Puzzle> bonus_puzzle =
        MakePuzzle(grid, {words[0], words[1]}, bonus_lists);
    hexword::GameState game;
    game.SelectPuzzle(bonus_puzzle);
    ExpectTrue(TraceWord(&game, words[0]) ==
                   hexword::TraceOutcome::kBonusFound,
               "bonus word should be reported");
    ExpectTrue(game.bonus_found() == 1 && game.Score() == 0,
               "bonus word should only count as a bonus");
    ExpectTrue(game.phase() == hexword::Phase::kPlaying,
               "bonus word should not finish the game");
    hexword::Notice notice;
    ExpectTrue(game.TakeNotice(&notice) &&
                   notice.kind == hexword::NoticeKind::kBonusWord,
               "bonus word should leave a notice");
    ExpectTrue(TraceWord(&game, words[1]) == hexword::TraceOutcome::kFound,
               "normal word should be found");
    ExpectTrue(game.phase() == hexword::Phase::kFinished,
               "bonus words should not be required");
  }

  {
    hexword::GameState game;
    game.SelectPuzzle(puzzle);
    TraceWord(&game, words[4]);
    TraceWord(&game, words[1]);

    hexword::GameSnapshot level0 = game.Snapshot();
    ExpectTrue(level0.words.size() == 2,
               "level 0 should list found words only");
    ExpectTrue(level0.counts.empty(), "level 0 should hide cell counts");

    ExpectTrue(game.SetHintLevel(1), "hint level 1 should be allowed");
    hexword::GameSnapshot level1 = game.Snapshot();
    ExpectTrue(level1.counts.size() == grid.cells().size(),
               "level 1 should show cell counts");
    size_t starts = 0;
    for (const auto& count : level1.counts) {
      starts += count.starts;
    }
    ExpectTrue(starts == 8, "counts should cover unfound normal words");

    ExpectTrue(game.SetHintLevel(2), "hint level 2 should be allowed");
    game.SetRevealMode(hexword::RevealMode::kAlphabetical);
    hexword::GameSnapshot alpha = game.Snapshot();
    ExpectTrue(alpha.words.size() == 10,
               "alphabetical view should list every normal word");
    std::vector<int> found_order;
    std::vector<std::string> unfound;
    for (const auto& entry : alpha.words) {
      if (entry.found) {
        found_order.push_back(entry.word_index);
      } else {
        unfound.push_back(puzzle->words[entry.word_index].text);
        ExpectTrue(RevealedLetters(entry.text) == 0,
                   "alphabetical view should mask unfound words");
      }
    }
    ExpectTrue(found_order.size() == 2 &&
                   puzzle->words[found_order[0]].text == words[4] &&
                   puzzle->words[found_order[1]].text == words[1],
               "found words should keep discovery order");
    ExpectTrue(std::is_sorted(unfound.begin(), unfound.end()),
               "unfound words should be in lexical order");

    game.SetRevealMode(hexword::RevealMode::kPartialLetters);
    hexword::GameSnapshot partial = game.Snapshot();
    ExpectTrue(partial.words.size() == 10,
               "partial view should list every normal word");

    std::vector<size_t> revealed0 = RevealedPerWord(level0);
    std::vector<size_t> revealed1 = RevealedPerWord(level1);
    std::vector<size_t> revealed_alpha = RevealedPerWord(alpha);
    std::vector<size_t> revealed_partial = RevealedPerWord(partial);
    bool never_less = true;
    for (size_t i = 0; i < revealed0.size(); ++i) {
      if (revealed1[i] < revealed0[i] || revealed_alpha[i] < revealed1[i] ||
          revealed_partial[i] < revealed1[i]) {
        never_less = false;
      }
      if (!game.IsFound(i) &&
          puzzle->words[i].classification ==
              hexword::Classification::kNormal &&
          revealed_partial[i] >= puzzle->words[i].text.size()) {
        never_less = false;
      }
    }
    ExpectTrue(never_less,
               "raising the hint level should never reveal less");

    ExpectTrue(game.SetHintLevel(0), "lowering the hint level is allowed");
    ExpectTrue(game.max_hint_level() == 2,
               "the highest level reached should be remembered");
    ExpectTrue(game.Snapshot().words.size() == 2,
               "found words should stay listed after lowering");
    ExpectFalse(game.SetHintLevel(3), "hint level past 2 should be rejected");
  }

  {
    // Honeycomb example: 𐑱𐑖𐑩 / 𐑼𐑦𐑤𐑯 / 𐑦𐑑𐑟𐑮𐑴 and the word 𐑱𐑖𐑦𐑑.
    hexword::Grid example = ParseGrid(
        "𐑱𐑖𐑩\n"
        "𐑼𐑦𐑤𐑯\n"
        "𐑦𐑑𐑟𐑮𐑴\n");
    hexword::Dictionary dictionary;
    dictionary.LoadText("𐑱𐑖𐑦𐑑\n𐑦𐑑𐑟\n");
    hexword::WordFinder finder(dictionary);
    hexword::Puzzle built = hexword::BuildPuzzle(
        example, finder.FindAll(example), hexword::ClassificationLists(),
        nullptr);
    ExpectTrue(built.words.size() == 1,
               "example word should be the only word found");

    auto decoded = std::make_shared<hexword::Puzzle>();
    hexword::Error error;
    ExpectTrue(hexword::PuzzleCodec::Decode(
                   hexword::PuzzleCodec::Encode(built), decoded.get(), &error),
               "example puzzle should round trip");

    hexword::GameState game;
    ExpectTrue(game.SelectPuzzle(decoded), "example should be selected");
    ExpectTrue(Trace(&game, {{0, 0}, {1, 0}, {1, 1}, {1, 2}}),
               "example path should be traceable");
    ExpectTrue(game.Snapshot().trace_text == "hGWB",
               "trace should spell the word in progress");
    ExpectTrue(game.EndTrace() == hexword::TraceOutcome::kFound,
               "example word should be found");
    ExpectTrue(game.Score() == hexword::WordPoints(game.config(), 4),
               "example word should add its points");
    ExpectTrue(game.phase() == hexword::Phase::kFinished,
               "finding the only word should finish the game");
  }

  {
    hexword::GameState empty_game;
    auto empty = std::make_shared<hexword::Puzzle>();
    empty->grid = grid;
    ExpectTrue(empty_game.SelectPuzzle(empty),
               "a puzzle without words should be selectable");
    ExpectTrue(empty_game.phase() == hexword::Phase::kFinished,
               "a puzzle without normal words should finish at once");
  }

  {
    hexword::SaveState state(0x1f, 2, {0, 3, 33});
    ExpectTrue(state.ToString() == "1f.2.000000092",
               "save state should pack misses, level and found bits");
    hexword::SaveState parsed;
    std::string error;
    ExpectTrue(hexword::SaveState::Parse("1f.2.000000092", &parsed, &error),
               "save state should parse");
    ExpectTrue(parsed.misses() == 0x1f && parsed.hint_level() == 2 &&
                   parsed.found_words() == std::vector<size_t>({0, 3, 33}),
               "parsed state should match");
    ExpectTrue(hexword::SaveState().ToString() == "0.0.0",
               "empty save state should be compact");

    ExpectFalse(hexword::SaveState::Parse("x.0.0", &parsed, &error),
                "bad misses should fail");
    ExpectTrue(error == "invalid misses", "bad misses should be named");
    ExpectFalse(hexword::SaveState::Parse("0.3.0", &parsed, &error),
                "bad hint level should fail");
    ExpectTrue(error == "invalid hint level", "bad level should be named");
    ExpectFalse(hexword::SaveState::Parse("0.0", &parsed, &error),
                "missing found words should fail");
    ExpectFalse(hexword::SaveState::Parse("0.0.zz", &parsed, &error),
                "bad found words should fail");
    ExpectFalse(hexword::SaveState::Parse("0.0.0.0", &parsed, &error),
                "trailing text should fail");
  }

  {
    hexword::GameState game;
    game.SelectPuzzle(puzzle);
    TraceWord(&game, words[2]);
    TraceWord(&game, words[7]);
    TraceWord(&game, not_a_word);
    game.SetHintLevel(1);
    std::string saved = game.Save().ToString();

    hexword::GameState resumed;
    resumed.SelectPuzzle(puzzle);
    hexword::SaveState state;
    std::string error;
    ExpectTrue(hexword::SaveState::Parse(saved, &state, &error) &&
                   resumed.Restore(state, &error),
               "saved state should restore");
    ExpectTrue(resumed.Score() == game.Score() &&
                   resumed.normal_found() == 2 && resumed.misses() == 1 &&
                   resumed.hint_level() == 1,
               "restored session should match the saved one");

    hexword::SaveState bad(0, 0, {40});
    ExpectFalse(resumed.Restore(bad, &error),
                "out of range word should be rejected");
    ExpectTrue(resumed.normal_found() == 2,
               "failed restore should leave the session unchanged");

    hexword::GameState idle;
    ExpectFalse(idle.Restore(state, &error),
                "restore without a puzzle should be rejected");
  }

  {
    hexword::Grid small = ParseGrid("ABC\nDEF");
    ExpectTrue(hexword::Geometry::HalfGridWidth(small) == 7,
               "odd rows should add half a hexagon");
    hexword::Geometry geometry(small, 100.0);
    ExpectTrue(std::abs(geometry.step_x() - 200.0 / 7.0) < 1e-9,
               "step should fit the widest row");
    ExpectTrue(std::abs(geometry.radius() * std::sqrt(3.0) -
                        geometry.step_x()) < 1e-9,
               "radius should match the horizontal step");
    Eigen::Vector2d even = geometry.CellCenter({0, 0});
    Eigen::Vector2d odd = geometry.CellCenter({0, 1});
    ExpectTrue(std::abs(odd.x() - even.x() - geometry.step_x() / 2.0) < 1e-9,
               "odd rows should be shifted half a step");
    ExpectTrue(std::abs(odd.y() - even.y() - geometry.step_y()) < 1e-9,
               "rows should be one vertical step apart");

    bool round_trip = true;
    for (int y = 0; y < small.height(); ++y) {
      for (int x = 0; x < small.width(); ++x) {
        hexword::Coord cell;
        if (!geometry.CellAt(geometry.CellCenter({x, y}), &cell) ||
            cell != hexword::Coord{x, y}) {
          round_trip = false;
        }
      }
    }
    ExpectTrue(round_trip, "cell centres should hit their own cell");
    hexword::Coord cell;
    ExpectFalse(geometry.CellAt(Eigen::Vector2d(-100.0, -100.0), &cell),
                "points far outside should hit nothing");

    hexword::Geometry detached(ParseGrid("A.C\nDEF"), 100.0);
    ExpectFalse(detached.CellAt(detached.CellCenter({1, 0}), &cell),
                "gaps should not be hit");
    ExpectTrue(detached.CellAt(detached.CellCenter({2, 0}), &cell) &&
                   cell == hexword::Coord{2, 0},
               "layout should keep its own copy of the grid");
  }

  if (g_failures > 0) {
    std::cerr << g_failures << " test(s) failed.\n";
    return 1;
  }
  std::cout << "All tests passed.\n";
  return 0;
}
