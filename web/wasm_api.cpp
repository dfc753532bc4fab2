#include "Game.hpp"
#include "Puzzle.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <emscripten/bind.h>

namespace {
std::string JsonEscape(const std::string& input) {
  std::string out;
  out.reserve(input.size());
  for (char c : input) {
    if (c == '\\' || c == '"') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

void WriteString(std::ostringstream& out, const std::string& text) {
  out << "\"" << JsonEscape(text) << "\"";
}

void WriteShavian(std::ostringstream& out, const std::string& letters) {
  WriteString(out, hexword::Alphabet::ToShavian(letters));
}

void WriteCoord(std::ostringstream& out, hexword::Coord cell) {
  out << "{\"x\":" << cell.x << ",\"y\":" << cell.y << "}";
}

const char* RevealModeName(hexword::RevealMode mode) {
  return mode == hexword::RevealMode::kAlphabetical ? "alpha" : "partial";
}

// Catalog plus the session for the puzzle in view. Selecting a puzzle starts
// a fresh GameState.
class HexwordSession {
 public:
  HexwordSession() : game_(std::make_unique<hexword::GameState>()) {}

  int LoadCatalog(const std::string& text) {
    catalog_.LoadText(text);
    return static_cast<int>(catalog_.size());
  }

  std::string CatalogErrors() const {
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < catalog_.errors().size(); ++i) {
      const auto& error = catalog_.errors()[i];
      if (i > 0) {
        out << ",";
      }
      out << "{\"line\":" << error.line << ",\"message\":";
      WriteString(out, error.message);
      out << "}";
    }
    out << "]";
    return out.str();
  }

  bool SelectPuzzle(int index, double width) {
    if (index < 0) {
      return false;
    }
    std::shared_ptr<const hexword::Puzzle> puzzle =
        catalog_.Get(static_cast<size_t>(index));
    if (!puzzle) {
      return false;
    }
    auto game = std::make_unique<hexword::GameState>();
    if (!game->SelectPuzzle(puzzle)) {
      return false;
    }
    geometry_.reset();
    game_ = std::move(game);
    puzzle_ = std::move(puzzle);
    geometry_ = std::make_unique<hexword::Geometry>(puzzle_->grid, width);
    return true;
  }

  void Resize(double width) {
    if (puzzle_) {
      geometry_ = std::make_unique<hexword::Geometry>(puzzle_->grid, width);
    }
  }

  std::string Layout() const {
    if (!geometry_) {
      return "null";
    }
    std::ostringstream out;
    out << "{\"radius\":" << geometry_->radius()
        << ",\"height\":" << geometry_->height() << ",\"cells\":[";
    const hexword::Grid& grid = puzzle_->grid;
    bool first = true;
    for (int y = 0; y < grid.height(); ++y) {
      for (int x = 0; x < grid.width(); ++x) {
        if (!grid.IsPresent({x, y})) {
          continue;
        }
        if (!first) {
          out << ",";
        }
        first = false;
        Eigen::Vector2d center = geometry_->CellCenter({x, y});
        out << "{\"x\":" << x << ",\"y\":" << y << ",\"cx\":" << center.x()
            << ",\"cy\":" << center.y() << ",\"letter\":";
        WriteShavian(out, std::string(1, grid.At({x, y})));
        out << "}";
      }
    }
    out << "]}";
    return out.str();
  }

  std::string CellAt(double x, double y) const {
    hexword::Coord cell;
    if (!geometry_ || !geometry_->CellAt(Eigen::Vector2d(x, y), &cell)) {
      return "null";
    }
    std::ostringstream out;
    WriteCoord(out, cell);
    return out.str();
  }

  bool BeginTrace(int x, int y) { return game_->BeginTrace({x, y}); }
  bool ExtendTrace(int x, int y) { return game_->ExtendTrace({x, y}); }
  std::string EndTrace() {
    return hexword::TraceOutcomeName(game_->EndTrace());
  }

  bool SetHintLevel(int level) { return game_->SetHintLevel(level); }

  bool SetRevealMode(const std::string& mode) {
    if (mode == "alpha") {
      game_->SetRevealMode(hexword::RevealMode::kAlphabetical);
    } else if (mode == "partial") {
      game_->SetRevealMode(hexword::RevealMode::kPartialLetters);
    } else {
      return false;
    }
    return true;
  }

  std::string TakeNotice() {
    hexword::Notice notice;
    if (!game_->TakeNotice(&notice)) {
      return "null";
    }
    std::ostringstream out;
    out << "{\"word\":";
    WriteShavian(out, notice.word);
    out << ",\"text\":";
    WriteString(out, hexword::NoticeText(notice));
    out << ",\"points\":" << notice.points << "}";
    return out.str();
  }

  std::string Snapshot() const {
    hexword::GameSnapshot snapshot = game_->Snapshot();
    std::ostringstream out;
    out << "{\"phase\":\"" << hexword::PhaseName(snapshot.phase) << "\"";
    out << ",\"score\":" << snapshot.score
        << ",\"max_score\":" << snapshot.max_score
        << ",\"level\":" << snapshot.level
        << ",\"normal_found\":" << snapshot.normal_found
        << ",\"normal_total\":" << snapshot.normal_total
        << ",\"bonus_found\":" << snapshot.bonus_found
        << ",\"bonus_total\":" << snapshot.bonus_total
        << ",\"misses\":" << snapshot.misses
        << ",\"hint_level\":" << snapshot.hint_level
        << ",\"reveal_mode\":\"" << RevealModeName(snapshot.reveal_mode)
        << "\"";

    out << ",\"trace\":[";
    for (size_t i = 0; i < snapshot.trace.size(); ++i) {
      if (i > 0) {
        out << ",";
      }
      WriteCoord(out, snapshot.trace[i]);
    }
    out << "],\"trace_text\":";
    WriteShavian(out, snapshot.trace_text);

    out << ",\"words\":[";
    for (size_t i = 0; i < snapshot.words.size(); ++i) {
      const hexword::ListEntry& entry = snapshot.words[i];
      if (i > 0) {
        out << ",";
      }
      out << "{\"found\":" << (entry.found ? "true" : "false")
          << ",\"length\":" << entry.length << ",\"text\":";
      WriteShavian(out, entry.text);
      out << "}";
    }
    out << "],\"bonus_words\":[";
    for (size_t i = 0; i < snapshot.bonus_words.size(); ++i) {
      if (i > 0) {
        out << ",";
      }
      WriteShavian(out, snapshot.bonus_words[i]);
    }
    out << "],\"excluded_words\":[";
    for (size_t i = 0; i < snapshot.excluded_words.size(); ++i) {
      if (i > 0) {
        out << ",";
      }
      WriteShavian(out, snapshot.excluded_words[i]);
    }
    out << "],\"remaining_by_length\":[";
    for (size_t i = 0; i < snapshot.remaining_by_length.size(); ++i) {
      if (i > 0) {
        out << ",";
      }
      out << snapshot.remaining_by_length[i];
    }
    out << "],\"counts\":[";
    for (size_t i = 0; i < snapshot.counts.size(); ++i) {
      if (i > 0) {
        out << ",";
      }
      out << "[" << snapshot.counts[i].starts << ","
          << snapshot.counts[i].visits << "]";
    }
    out << "]}";
    return out.str();
  }

  std::string Save() const { return game_->Save().ToString(); }

  bool Restore(const std::string& text) {
    hexword::SaveState state;
    std::string error;
    return hexword::SaveState::Parse(text, &state, &error) &&
           game_->Restore(state, &error);
  }

 private:
  hexword::Catalog catalog_;
  std::unique_ptr<hexword::GameState> game_;
  std::shared_ptr<const hexword::Puzzle> puzzle_;
  std::unique_ptr<hexword::Geometry> geometry_;
};
}  // namespace

EMSCRIPTEN_BINDINGS(hexword_wasm) {
  emscripten::class_<HexwordSession>("HexwordSession")
      .constructor<>()
      .function("loadCatalog", &HexwordSession::LoadCatalog)
      .function("catalogErrors", &HexwordSession::CatalogErrors)
      .function("selectPuzzle", &HexwordSession::SelectPuzzle)
      .function("resize", &HexwordSession::Resize)
      .function("layout", &HexwordSession::Layout)
      .function("cellAt", &HexwordSession::CellAt)
      .function("beginTrace", &HexwordSession::BeginTrace)
      .function("extendTrace", &HexwordSession::ExtendTrace)
      .function("endTrace", &HexwordSession::EndTrace)
      .function("setHintLevel", &HexwordSession::SetHintLevel)
      .function("setRevealMode", &HexwordSession::SetRevealMode)
      .function("takeNotice", &HexwordSession::TakeNotice)
      .function("snapshot", &HexwordSession::Snapshot)
      .function("save", &HexwordSession::Save)
      .function("restore", &HexwordSession::Restore);
}
