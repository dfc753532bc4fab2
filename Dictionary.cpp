#include "Puzzle.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace hexword {
namespace {
std::string_view TrimLine(std::string_view line) {
  size_t start = 0;
  while (start < line.size() &&
         (line[start] == ' ' || line[start] == '\t' || line[start] == '\r')) {
    ++start;
  }
  size_t end = line.size();
  while (end > start && (line[end - 1] == ' ' || line[end - 1] == '\t' ||
                         line[end - 1] == '\r')) {
    --end;
  }
  return line.substr(start, end - start);
}

// Orders words by the letter at |depth|; words that end before |depth| come
// first, which is where they sort among words sharing the same prefix.
int LetterKey(const std::string& word, size_t depth) {
  if (word.size() <= depth) {
    return -1;
  }
  return static_cast<unsigned char>(word[depth]);
}
}  // namespace

bool Dictionary::LoadFile(const std::string& path, Error* error) {
  std::ifstream infile(path);
  if (!infile) {
    if (error) {
      error->kind = ErrorKind::kIo;
      error->message = path + ": cannot open dictionary";
    }
    return false;
  }
  std::ostringstream contents;
  contents << infile.rdbuf();
  LoadText(contents.str());
  return true;
}

void Dictionary::LoadText(std::string_view text) {
  std::vector<std::string> words;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = TrimLine(text.substr(start, end - start));
    start = end + 1;
    if (line.empty() || line.front() == '#') {
      continue;
    }
    words.emplace_back(line);
  }
  SetWordList(words);
}

void Dictionary::SetWordList(const std::vector<std::string>& words) {
  words_.clear();
  rejected_ = 0;
  words_.reserve(words.size());
  std::string normalized;
  for (const auto& word : words) {
    if (!Alphabet::NormalizeWord(word, &normalized)) {
      ++rejected_;
      continue;
    }
    words_.push_back(normalized);
  }
  std::sort(words_.begin(), words_.end());
  words_.erase(std::unique(words_.begin(), words_.end()), words_.end());
}

Dictionary::Range Dictionary::Narrow(Range range, size_t depth,
                                     char letter) const {
  const int key = static_cast<unsigned char>(letter);
  auto first = words_.begin() + static_cast<std::ptrdiff_t>(range.begin);
  auto last = words_.begin() + static_cast<std::ptrdiff_t>(range.end);
  auto lower = std::lower_bound(
      first, last, key, [depth](const std::string& word, int value) {
        return LetterKey(word, depth) < value;
      });
  auto upper = std::upper_bound(
      lower, last, key, [depth](int value, const std::string& word) {
        return value < LetterKey(word, depth);
      });
  return {static_cast<size_t>(lower - words_.begin()),
          static_cast<size_t>(upper - words_.begin())};
}

bool Dictionary::IsWord(Range range, size_t length) const {
  return !range.empty() && words_[range.begin].size() == length;
}

Dictionary::Range Dictionary::PrefixRange(std::string_view prefix) const {
  Range range = All();
  for (size_t depth = 0; depth < prefix.size() && !range.empty(); ++depth) {
    range = Narrow(range, depth, prefix[depth]);
  }
  return range;
}

bool Dictionary::Contains(std::string_view word) const {
  std::string normalized;
  if (!Alphabet::NormalizeWord(word, &normalized)) {
    return false;
  }
  return IsWord(PrefixRange(normalized), normalized.size());
}

bool Dictionary::HasPrefix(std::string_view prefix) const {
  if (prefix.empty()) {
    return !words_.empty();
  }
  std::string normalized;
  if (!Alphabet::NormalizeWord(prefix, &normalized)) {
    return false;
  }
  return !PrefixRange(normalized).empty();
}

}  // namespace hexword
