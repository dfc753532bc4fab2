#include "Puzzle.hpp"

namespace hexword {
namespace {
constexpr int kUpperCount = 26;
}  // namespace

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "ok";
    case ErrorKind::kMalformedGrid:
      return "malformed grid";
    case ErrorKind::kMalformedCode:
      return "malformed code";
    case ErrorKind::kUnknownClassificationWord:
      return "unknown classification word";
    case ErrorKind::kInvalidAction:
      return "invalid action";
    case ErrorKind::kIo:
      return "i/o error";
  }
  return "unknown";
}

bool Alphabet::IsLetter(char c) {
  return (c >= 'A' && c <= 'Z') ||
         (c >= 'a' && c < 'a' + (kAlphabetSize - kUpperCount));
}

int Alphabet::Index(char c) {
  if (c >= 'A' && c <= 'Z') {
    return c - 'A';
  }
  if (c >= 'a' && c < 'a' + (kAlphabetSize - kUpperCount)) {
    return c - 'a' + kUpperCount;
  }
  return -1;
}

char Alphabet::LetterAt(int index) {
  if (index < 0 || index >= kAlphabetSize) {
    return '\0';
  }
  if (index < kUpperCount) {
    return static_cast<char>('A' + index);
  }
  return static_cast<char>('a' + index - kUpperCount);
}

char Alphabet::FromCodePoint(char32_t code_point) {
  if (code_point >= kFirstCodePoint && code_point <= kLastCodePoint) {
    return LetterAt(static_cast<int>(code_point - kFirstCodePoint));
  }
  if (code_point < 0x80 && IsLetter(static_cast<char>(code_point))) {
    return static_cast<char>(code_point);
  }
  return '\0';
}

char32_t Alphabet::ToCodePoint(char letter) {
  int index = Index(letter);
  if (index < 0) {
    return static_cast<unsigned char>(letter);
  }
  return kFirstCodePoint + static_cast<char32_t>(index);
}

size_t Alphabet::DecodeUtf8(std::string_view text, size_t pos,
                            char32_t* out) {
  if (pos >= text.size()) {
    return 0;
  }
  unsigned char lead = static_cast<unsigned char>(text[pos]);
  size_t length = 0;
  char32_t value = 0;
  if (lead < 0x80) {
    *out = lead;
    return 1;
  } else if ((lead & 0xE0) == 0xC0) {
    length = 2;
    value = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    value = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    value = lead & 0x07;
  } else {
    return 0;
  }
  if (pos + length > text.size()) {
    return 0;
  }
  for (size_t i = 1; i < length; ++i) {
    unsigned char next = static_cast<unsigned char>(text[pos + i]);
    if ((next & 0xC0) != 0x80) {
      return 0;
    }
    value = (value << 6) | (next & 0x3F);
  }
  *out = value;
  return length;
}

void Alphabet::AppendUtf8(char32_t code_point, std::string* out) {
  if (code_point < 0x80) {
    out->push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

bool Alphabet::NormalizeWord(std::string_view word, std::string* out) {
  out->clear();
  size_t pos = 0;
  while (pos < word.size()) {
    char32_t code_point = 0;
    size_t used = DecodeUtf8(word, pos, &code_point);
    if (used == 0) {
      return false;
    }
    char letter = FromCodePoint(code_point);
    if (letter == '\0') {
      return false;
    }
    out->push_back(letter);
    pos += used;
  }
  return !out->empty();
}

std::string Alphabet::ToShavian(std::string_view letters) {
  std::string out;
  out.reserve(letters.size() * 4);
  for (char c : letters) {
    AppendUtf8(ToCodePoint(c), &out);
  }
  return out;
}

}  // namespace hexword
