#include "Puzzle.hpp"

#include <fstream>
#include <sstream>

namespace hexword {

bool Catalog::LoadFile(const std::string& path, Error* error) {
  std::ifstream infile(path);
  if (!infile) {
    if (error) {
      error->kind = ErrorKind::kIo;
      error->message = path + ": cannot open catalog";
    }
    return false;
  }
  std::ostringstream contents;
  contents << infile.rdbuf();
  LoadText(contents.str());
  return true;
}

void Catalog::LoadText(std::string_view text) {
  entries_.clear();
  errors_.clear();

  size_t start = 0;
  size_t line_number = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    start = end + 1;
    ++line_number;

    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' ||
                             line.back() == '\t')) {
      line.remove_suffix(1);
    }
    while (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
      line.remove_prefix(1);
    }
    if (line.empty() || line.front() == '#') {
      continue;
    }

    auto puzzle = std::make_shared<Puzzle>();
    Error error;
    if (!PuzzleCodec::Decode(line, puzzle.get(), &error)) {
      errors_.push_back({line_number, error.message});
      continue;
    }
    entries_.push_back({line_number, std::move(puzzle)});
  }
}

std::shared_ptr<const Puzzle> Catalog::Get(size_t index) const {
  if (index >= entries_.size()) {
    return nullptr;
  }
  return entries_[index].puzzle;
}

}  // namespace hexword
