#include <lootwatch/core/text_correction.hpp>
#include <array>
#include <cctype>

namespace lootwatch::core {

namespace {

bool is_space(char c) noexcept {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_word_char(char c) noexcept {
  // Bytes >= 0x80 belong to multi-byte UTF-8 letters; treat them as word characters.
  const auto u = static_cast<unsigned char>(c);
  return std::isalnum(u) != 0 || u >= 0x80;
}

// U+2019 RIGHT SINGLE QUOTATION MARK
constexpr std::string_view kRightQuote = "\xE2\x80\x99";

constexpr std::array<char, 256> make_confusion_table() {
  std::array<char, 256> t{};
  for (std::size_t i = 0; i < t.size(); ++i) {
    t[i] = static_cast<char>(i);
  }
  t[static_cast<unsigned char>('|')] = 'l';
  t[static_cast<unsigned char>('0')] = 'o';
  t[static_cast<unsigned char>('5')] = 's';
  t[static_cast<unsigned char>('1')] = 'i';
  t[static_cast<unsigned char>('8')] = 'b';
  t[static_cast<unsigned char>('6')] = 'g';
  return t;
}

constexpr std::array<char, 256> kConfusionTable = make_confusion_table();

}  // namespace

std::string_view trim_view(std::string_view text) noexcept {
  std::size_t start = 0;
  while (start < text.size() && is_space(text[start])) ++start;
  std::size_t end = text.size();
  while (end > start && is_space(text[end - 1])) --end;
  return text.substr(start, end - start);
}

std::string normalize_text(std::string_view text) {
  const std::string_view trimmed = trim_view(text);
  std::string out;
  out.reserve(trimmed.size());
  bool pending_space = false;
  for (std::size_t i = 0; i < trimmed.size(); ++i) {
    const char c = trimmed[i];
    if (c == '\'' || c == '`') continue;
    if (trimmed.substr(i, kRightQuote.size()) == kRightQuote) {
      i += kRightQuote.size() - 1;
      continue;
    }
    if (is_space(c)) {
      pending_space = true;
      continue;
    }
    if (pending_space && !out.empty()) out.push_back(' ');
    pending_space = false;
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

std::string correct_ocr_confusions(std::string_view text) {
  std::string out(text);
  for (char& c : out) {
    c = kConfusionTable[static_cast<unsigned char>(c)];
  }
  return out;
}

std::string confusion_key(std::string_view text) {
  std::string out = correct_ocr_confusions(text);
  for (char& c : out) {
    if (c == 'l') c = 'i';
  }
  return out;
}

bool contains_phrase(std::string_view text, std::string_view phrase) noexcept {
  if (phrase.empty() || phrase.size() > text.size()) return false;
  std::size_t pos = text.find(phrase);
  while (pos != std::string_view::npos) {
    const std::size_t end = pos + phrase.size();
    const bool left_ok = pos == 0 || !is_word_char(text[pos - 1]) || !is_word_char(phrase.front());
    const bool right_ok = end == text.size() || !is_word_char(text[end]) || !is_word_char(phrase.back());
    if (left_ok && right_ok) return true;
    pos = text.find(phrase, pos + 1);
  }
  return false;
}

}  // namespace lootwatch::core
