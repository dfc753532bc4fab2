#include "Game.hpp"

#include <iomanip>
#include <sstream>

namespace hexword {
namespace {
constexpr size_t kGroupBits = 32;
constexpr size_t kGroupDigits = 8;

bool ParseHex(std::string_view text, uint32_t* out) {
  if (text.empty() || text.size() > kGroupDigits) {
    return false;
  }
  uint32_t value = 0;
  for (char c : text) {
    int digit = 0;
    if (c >= '0' && c <= '9') {
      digit = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      digit = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      digit = c - 'A' + 10;
    } else {
      return false;
    }
    value = (value << 4) | static_cast<uint32_t>(digit);
  }
  *out = value;
  return true;
}

bool Fail(std::string* error, const char* message) {
  if (error) {
    *error = message;
  }
  return false;
}
}  // namespace

SaveState::SaveState(uint32_t misses, int hint_level,
                     const std::vector<size_t>& found_words)
    : misses_(misses), hint_level_(hint_level) {
  for (size_t word : found_words) {
    size_t group = word / kGroupBits;
    if (group >= found_bits_.size()) {
      found_bits_.resize(group + 1, 0);
    }
    found_bits_[group] |= 1U << (word % kGroupBits);
  }
}

std::vector<size_t> SaveState::found_words() const {
  std::vector<size_t> out;
  for (size_t group = 0; group < found_bits_.size(); ++group) {
    for (size_t bit = 0; bit < kGroupBits; ++bit) {
      if (found_bits_[group] & (1U << bit)) {
        out.push_back(group * kGroupBits + bit);
      }
    }
  }
  return out;
}

std::string SaveState::ToString() const {
  std::ostringstream out;
  out << std::hex << misses_ << "." << std::dec << hint_level_ << ".";

  size_t last = found_bits_.size();
  while (last > 0 && found_bits_[last - 1] == 0) {
    --last;
  }
  if (last == 0) {
    out << "0";
    return out.str();
  }
  out << std::hex;
  for (size_t group = 0; group + 1 < last; ++group) {
    out << std::setw(kGroupDigits) << std::setfill('0') << found_bits_[group];
  }
  out << found_bits_[last - 1];
  return out.str();
}

bool SaveState::Parse(std::string_view text, SaveState* out,
                      std::string* error) {
  size_t first_dot = text.find('.');
  if (first_dot == std::string_view::npos) {
    return Fail(error, "invalid misses");
  }
  uint32_t misses = 0;
  if (!ParseHex(text.substr(0, first_dot), &misses)) {
    return Fail(error, "invalid misses");
  }

  size_t second_dot = text.find('.', first_dot + 1);
  std::string_view level =
      text.substr(first_dot + 1, second_dot == std::string_view::npos
                                     ? std::string_view::npos
                                     : second_dot - first_dot - 1);
  if (level.size() != 1 || level[0] < '0' ||
      level[0] > static_cast<char>('0' + kMaxHintLevel)) {
    return Fail(error, "invalid hint level");
  }
  if (second_dot == std::string_view::npos) {
    return Fail(error, "invalid found words");
  }

  std::string_view bits = text.substr(second_dot + 1);
  if (bits.find('.') != std::string_view::npos) {
    return Fail(error, "trailing text");
  }
  if (bits.empty()) {
    return Fail(error, "invalid found words");
  }
  std::vector<uint32_t> groups;
  while (bits.size() > kGroupDigits) {
    uint32_t group = 0;
    if (!ParseHex(bits.substr(0, kGroupDigits), &group)) {
      return Fail(error, "invalid found words");
    }
    groups.push_back(group);
    bits.remove_prefix(kGroupDigits);
  }
  uint32_t group = 0;
  if (!ParseHex(bits, &group)) {
    return Fail(error, "invalid found words");
  }
  groups.push_back(group);

  out->misses_ = misses;
  out->hint_level_ = level[0] - '0';
  out->found_bits_ = std::move(groups);
  return true;
}

}  // namespace hexword
