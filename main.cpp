#include "Game.hpp"
#include "Puzzle.hpp"

#include <chrono>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace {
enum class Mode {
  kNone,
  kBuild,
  kPlay,
  kCheck,
};

struct Config {
  Mode mode = Mode::kNone;
  std::string catalog_path;
  std::string dictionary_path;
  std::string grid_path;
  std::string bonus_path;
  std::string excluded_path;
  size_t minimum_length = hexword::kMinWordLength;
  bool text_report = false;
  size_t puzzle_index = 0;
  std::string points;
  int threads = 0;
};

void PrintUsage(const char* argv0) {
  std::cout
      << "Hexword: hexagonal word-search puzzle compiler and player\n"
      << "Usage:\n"
      << "  " << argv0
      << " --build --dictionary WORDS.txt [--grid GRID.txt] [--text]\n"
      << "  " << argv0 << " --play CATALOG.txt [--puzzle N]\n"
      << "  " << argv0 << " --check CATALOG.txt\n"
      << "Options:\n"
      << "  --build                    Compile a grid into a puzzle code\n"
      << "  --play PATH                Play a puzzle from a catalog\n"
      << "  --check PATH               Decode every puzzle in a catalog\n"
      << "  --dictionary PATH          Word list, one word per line\n"
      << "  --grid PATH                Grid text (default: standard input)\n"
      << "  --bonus-words PATH         Words classified as bonus\n"
      << "  --excluded-words PATH      Words classified as excluded\n"
      << "  --minimum-length N         Shortest word to record (default 4)\n"
      << "  --text                     Print a report instead of the code\n"
      << "  --puzzle N                 Catalog index to play (default 0)\n"
      << "  --points LIST              Points per length from 4, e.g. 1,2,4,7\n"
      << "  --threads N                Worker threads for the word search\n"
      << "  --help                     Show this help\n";
}

void PrintPlayHelp() {
  std::cout << "Commands:\n"
            << "  trace x,y x,y ...   Trace a path through the grid\n"
            << "  hint N              Set the hint level (0-"
            << hexword::kMaxHintLevel << ")\n"
            << "  mode alpha|partial  Choose the level 2 word list\n"
            << "  show                Print the board\n"
            << "  save                Print a save state\n"
            << "  restore STATE       Resume from a save state\n"
            << "  help                Show this help\n"
            << "  quit                Leave the puzzle\n";
}

std::string TrimWhitespace(const std::string& input) {
  size_t start = 0;
  while (start < input.size() &&
         std::isspace(static_cast<unsigned char>(input[start]))) {
    ++start;
  }
  size_t end = input.size();
  while (end > start &&
         std::isspace(static_cast<unsigned char>(input[end - 1]))) {
    --end;
  }
  return input.substr(start, end - start);
}

bool ParseCount(const std::string& text, size_t* out) {
  if (text.empty() || text.size() > 9) {
    return false;
  }
  size_t value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + static_cast<size_t>(c - '0');
  }
  *out = value;
  return true;
}

bool ReadAll(std::istream& in, std::string* out) {
  std::ostringstream contents;
  contents << in.rdbuf();
  if (in.bad()) {
    return false;
  }
  *out = contents.str();
  return true;
}

// Parses "x,y".
bool ParseCoord(const std::string& token, hexword::Coord* out) {
  size_t comma = token.find(',');
  if (comma == std::string::npos) {
    return false;
  }
  size_t x = 0;
  size_t y = 0;
  if (!ParseCount(token.substr(0, comma), &x) ||
      !ParseCount(token.substr(comma + 1), &y)) {
    return false;
  }
  out->x = static_cast<int>(x);
  out->y = static_cast<int>(y);
  return true;
}

void ReportError(const char* tag, const hexword::Error& error) {
  std::cerr << "[" << tag << "] " << hexword::ErrorKindName(error.kind)
            << ": " << error.message << "\n";
}

int RunBuild(const Config& config, const hexword::ScoringConfig& scoring) {
  if (config.dictionary_path.empty()) {
    std::cerr << "--build requires --dictionary.\n";
    return 1;
  }

  std::string grid_text;
  if (config.grid_path.empty()) {
    if (!ReadAll(std::cin, &grid_text)) {
      std::cerr << "[build] Failed to read grid from standard input\n";
      return 1;
    }
  } else {
    std::ifstream infile(config.grid_path);
    if (!infile || !ReadAll(infile, &grid_text)) {
      std::cerr << "[build] Failed to read grid: " << config.grid_path
                << "\n";
      return 1;
    }
  }

  hexword::Error error;
  hexword::Grid grid;
  if (!hexword::Grid::Parse(grid_text, &grid, &error)) {
    ReportError("build", error);
    return 1;
  }

  hexword::Dictionary dictionary;
  if (!dictionary.LoadFile(config.dictionary_path, &error)) {
    ReportError("build", error);
    return 1;
  }
  std::cerr << "[build] Dictionary: " << dictionary.size() << " words";
  if (dictionary.rejected() > 0) {
    std::cerr << " (" << dictionary.rejected() << " rejected)";
  }
  std::cerr << "\n";

  hexword::ClassificationLists lists;
  size_t list_rejected = 0;
  if (!config.bonus_path.empty() &&
      !hexword::LoadWordSet(config.bonus_path, &lists.bonus, &list_rejected,
                            &error)) {
    ReportError("build", error);
    return 1;
  }
  if (!config.excluded_path.empty() &&
      !hexword::LoadWordSet(config.excluded_path, &lists.excluded,
                            &list_rejected, &error)) {
    ReportError("build", error);
    return 1;
  }
  if (list_rejected > 0) {
    std::cerr << "[build] Word lists: " << list_rejected
              << " rejected words skipped\n";
  }

  hexword::WordFinder finder(dictionary, config.minimum_length);
  auto start = std::chrono::high_resolution_clock::now();
  std::vector<hexword::FoundWord> found = finder.FindAll(grid);
  auto end = std::chrono::high_resolution_clock::now();
  auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start)
          .count();
  std::cerr << "[build] Grid " << grid.width() << "x" << grid.height() << ", "
            << grid.present_count() << " cells, " << found.size()
            << " words\n";
  std::cerr << "Search latency: " << micros << "us\n";

  std::vector<hexword::Error> warnings;
  hexword::Puzzle puzzle =
      hexword::BuildPuzzle(grid, std::move(found), lists, &warnings);
  for (const auto& warning : warnings) {
    ReportError("build", warning);
  }
  if (puzzle.words.empty()) {
    std::cerr << "[build] Warning: the grid contains no words\n";
  } else if (puzzle.CountWords(hexword::Classification::kNormal) == 0) {
    std::cerr << "[build] Warning: the grid contains no normal words\n";
  }

  if (config.text_report) {
    std::cout << hexword::RenderReport(puzzle,
                                       hexword::MaxScore(puzzle, scoring));
  } else {
    std::cout << hexword::PuzzleCodec::Encode(puzzle) << "\n";
  }
  return 0;
}

bool LoadCatalog(const std::string& path, hexword::Catalog* catalog) {
  hexword::Error error;
  if (!catalog->LoadFile(path, &error)) {
    ReportError("catalog", error);
    return false;
  }
  for (const auto& line_error : catalog->errors()) {
    std::cerr << "[catalog] " << path << ":" << line_error.line << ": "
              << line_error.message << "\n";
  }
  return true;
}

int RunCheck(const Config& config, const hexword::ScoringConfig& scoring) {
  hexword::Catalog catalog;
  if (!LoadCatalog(config.catalog_path, &catalog)) {
    return 1;
  }
  for (size_t i = 0; i < catalog.size(); ++i) {
    const hexword::Catalog::Entry& entry = catalog.entry(i);
    const hexword::Puzzle& puzzle = *entry.puzzle;
    std::cout << "Puzzle " << i << " (line " << entry.line << "): "
              << puzzle.grid.width() << "x" << puzzle.grid.height() << ", "
              << puzzle.CountWords(hexword::Classification::kNormal)
              << " normal, "
              << puzzle.CountWords(hexword::Classification::kBonus)
              << " bonus, "
              << puzzle.CountWords(hexword::Classification::kExcluded)
              << " excluded, max score "
              << hexword::MaxScore(puzzle, scoring) << "\n";
  }
  std::cout << catalog.size() << " puzzle(s) loaded, "
            << catalog.errors().size() << " rejected.\n";
  return catalog.errors().empty() ? 0 : 1;
}

void PrintBoard(const hexword::GameSnapshot& snapshot) {
  const hexword::Grid& grid = snapshot.puzzle->grid;
  std::cout << "\n";
  for (int y = 0; y < grid.height(); ++y) {
    const char* indent = (y & 1) ? "   " : "";
    std::cout << indent;
    for (int x = 0; x < grid.width(); ++x) {
      char cell = grid.At({x, y});
      if (cell == hexword::kGapCell) {
        std::cout << "  .   ";
      } else {
        std::cout << "  " << hexword::Alphabet::ToShavian(std::string(1, cell))
                  << "   ";
      }
    }
    std::cout << "\n";
    if (snapshot.counts.empty()) {
      continue;
    }
    std::cout << indent;
    for (int x = 0; x < grid.width(); ++x) {
      if (!grid.IsPresent({x, y})) {
        std::cout << "      ";
        continue;
      }
      const hexword::CellCounts& count = snapshot.counts[grid.IndexOf({x, y})];
      std::cout << std::setw(2) << count.starts << " " << std::left
                << std::setw(3) << count.visits << std::right;
    }
    std::cout << "\n";
  }
  std::cout << "\n";
}

void PrintStatus(const hexword::GameSnapshot& snapshot) {
  std::cout << "Score: " << snapshot.score << "/" << snapshot.max_score
            << "  Level: " << snapshot.level << "  Words: "
            << snapshot.normal_found << "/" << snapshot.normal_total;
  if (snapshot.bonus_total > 0) {
    std::cout << "  Bonus: " << snapshot.bonus_found << "/"
              << snapshot.bonus_total;
  }
  std::cout << "  Hint: " << snapshot.hint_level << "\n";
}

void PrintWords(const hexword::GameSnapshot& snapshot) {
  for (const auto& entry : snapshot.words) {
    std::cout << "  " << hexword::Alphabet::ToShavian(entry.text);
    if (!entry.found) {
      std::cout << " (" << entry.length << ")";
    }
    std::cout << "\n";
  }
  if (!snapshot.bonus_words.empty()) {
    std::cout << "Bonus:";
    for (const auto& word : snapshot.bonus_words) {
      std::cout << " " << hexword::Alphabet::ToShavian(word);
    }
    std::cout << "\n";
  }
  if (!snapshot.excluded_words.empty()) {
    std::cout << "Not counted:";
    for (const auto& word : snapshot.excluded_words) {
      std::cout << " " << hexword::Alphabet::ToShavian(word);
    }
    std::cout << "\n";
  }
  if (snapshot.hint_level >= 1) {
    std::cout << "Remaining by length:";
    for (size_t length = 0; length < snapshot.remaining_by_length.size();
         ++length) {
      if (snapshot.remaining_by_length[length] > 0) {
        std::cout << " " << length << ":"
                  << snapshot.remaining_by_length[length];
      }
    }
    std::cout << "\n";
  }
}

void PrintSnapshot(const hexword::GameState& game) {
  hexword::GameSnapshot snapshot = game.Snapshot();
  PrintBoard(snapshot);
  PrintWords(snapshot);
  PrintStatus(snapshot);
}

void HandleTrace(hexword::GameState* game, std::istringstream* args) {
  hexword::Path path;
  std::string token;
  while (*args >> token) {
    hexword::Coord cell;
    if (!ParseCoord(token, &cell)) {
      std::cout << "Invalid cell: " << token << " (use x,y)\n";
      return;
    }
    path.push_back(cell);
  }
  if (path.empty()) {
    std::cout << "Expected at least one cell.\n";
    return;
  }
  // A bad step must not leave a trace open.
  if (!game->puzzle()->grid.IsValidPath(path)) {
    std::cout << "Not a traceable path.\n";
    return;
  }
  if (!game->BeginTrace(path.front())) {
    std::cerr << "[play] Trace rejected\n";
    return;
  }
  for (size_t i = 1; i < path.size(); ++i) {
    if (!game->ExtendTrace(path[i])) {
      break;
    }
  }
  hexword::TraceOutcome outcome = game->EndTrace();

  hexword::Notice notice;
  if (game->TakeNotice(&notice)) {
    std::cout << hexword::Alphabet::ToShavian(notice.word) << ": "
              << hexword::NoticeText(notice) << "\n";
  } else if (outcome == hexword::TraceOutcome::kAlreadyFound) {
    std::cout << "Already found.\n";
  }
}

int RunPlay(const Config& config, const hexword::ScoringConfig& scoring) {
  hexword::Catalog catalog;
  if (!LoadCatalog(config.catalog_path, &catalog)) {
    return 1;
  }
  if (catalog.size() == 0) {
    std::cerr << "[catalog] No playable puzzles in " << config.catalog_path
              << "\n";
    return 1;
  }
  if (config.puzzle_index >= catalog.size()) {
    std::cerr << "[play] Puzzle " << config.puzzle_index
              << " out of range (catalog has " << catalog.size() << ")\n";
    return 1;
  }

  hexword::GameState game(scoring);
  if (!game.SelectPuzzle(catalog.Get(config.puzzle_index))) {
    std::cerr << "[play] Failed to select puzzle " << config.puzzle_index
              << "\n";
    return 1;
  }

  std::cout << "\n[Hexword Interactive]\n";
  std::cout << "Puzzle " << config.puzzle_index << " of " << catalog.size()
            << ". Type 'help' for commands.\n";
  PrintSnapshot(game);

  std::string line;
  while (game.phase() == hexword::Phase::kPlaying) {
    std::cout << "> ";
    if (!std::getline(std::cin, line)) {
      break;
    }
    line = TrimWhitespace(line);
    if (line.empty()) {
      continue;
    }
    std::istringstream args(line);
    std::string command;
    args >> command;

    if (command == "quit" || command == "exit") {
      break;
    }
    if (command == "help" || command == "?") {
      PrintPlayHelp();
    } else if (command == "show") {
      PrintSnapshot(game);
    } else if (command == "trace") {
      int before = game.Score();
      HandleTrace(&game, &args);
      if (game.Score() != before) {
        PrintStatus(game.Snapshot());
      }
    } else if (command == "hint") {
      std::string value;
      size_t level = 0;
      if (!(args >> value) || !ParseCount(value, &level) ||
          !game.SetHintLevel(static_cast<int>(level))) {
        std::cout << "Hint level must be 0-" << hexword::kMaxHintLevel
                  << ".\n";
        continue;
      }
      PrintSnapshot(game);
    } else if (command == "mode") {
      std::string value;
      args >> value;
      if (value == "alpha") {
        game.SetRevealMode(hexword::RevealMode::kAlphabetical);
      } else if (value == "partial") {
        game.SetRevealMode(hexword::RevealMode::kPartialLetters);
      } else {
        std::cout << "Mode must be alpha or partial.\n";
        continue;
      }
      PrintWords(game.Snapshot());
    } else if (command == "save") {
      std::cout << game.Save().ToString() << "\n";
    } else if (command == "restore") {
      std::string value;
      std::string error;
      hexword::SaveState state;
      if (!(args >> value) ||
          !hexword::SaveState::Parse(value, &state, &error) ||
          !game.Restore(state, &error)) {
        std::cerr << "[play] Cannot restore: "
                  << (error.empty() ? "missing state" : error) << "\n";
        continue;
      }
      PrintSnapshot(game);
    } else {
      std::cout << "Unknown command: " << command << "\n";
    }
  }

  if (game.phase() == hexword::Phase::kFinished) {
    std::cout << "All words found!\n";
    PrintStatus(game.Snapshot());
  }
  return 0;
}
}  // namespace

int main(int argc, char** argv) {
  Config config;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--build") {
      config.mode = Mode::kBuild;
    } else if (arg == "--play" && i + 1 < argc) {
      config.mode = Mode::kPlay;
      config.catalog_path = argv[++i];
    } else if (arg == "--check" && i + 1 < argc) {
      config.mode = Mode::kCheck;
      config.catalog_path = argv[++i];
    } else if (arg == "--dictionary" && i + 1 < argc) {
      config.dictionary_path = argv[++i];
    } else if (arg == "--grid" && i + 1 < argc) {
      config.grid_path = argv[++i];
    } else if (arg == "--bonus-words" && i + 1 < argc) {
      config.bonus_path = argv[++i];
    } else if (arg == "--excluded-words" && i + 1 < argc) {
      config.excluded_path = argv[++i];
    } else if (arg == "--minimum-length" && i + 1 < argc) {
      if (!ParseCount(argv[++i], &config.minimum_length) ||
          config.minimum_length < hexword::kMinWordLength) {
        std::cerr << "--minimum-length must be at least "
                  << hexword::kMinWordLength << ".\n";
        return 1;
      }
    } else if (arg == "--text") {
      config.text_report = true;
    } else if (arg == "--puzzle" && i + 1 < argc) {
      if (!ParseCount(argv[++i], &config.puzzle_index)) {
        std::cerr << "Invalid --puzzle: " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--points" && i + 1 < argc) {
      config.points = argv[++i];
    } else if (arg == "--threads" && i + 1 < argc) {
      size_t threads = 0;
      if (!ParseCount(argv[++i], &threads) || threads == 0) {
        std::cerr << "Invalid --threads: " << argv[i] << "\n";
        return 1;
      }
      config.threads = static_cast<int>(threads);
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      PrintUsage(argv[0]);
      return 1;
    }
  }

  hexword::ScoringConfig scoring;
  if (!config.points.empty()) {
    std::string error;
    if (!hexword::ParsePointsTable(config.points, &scoring, &error)) {
      std::cerr << "Invalid --points: " << error << "\n";
      return 1;
    }
  }

  if (config.threads > 0) {
#ifdef _OPENMP
    omp_set_num_threads(config.threads);
#else
    std::cerr << "[build] Built without OpenMP; --threads ignored\n";
#endif
  }

  switch (config.mode) {
    case Mode::kBuild:
      return RunBuild(config, scoring);
    case Mode::kPlay:
      return RunPlay(config, scoring);
    case Mode::kCheck:
      return RunCheck(config, scoring);
    case Mode::kNone:
      break;
  }
  PrintUsage(argv[0]);
  return 1;
}
