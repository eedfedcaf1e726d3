#include <lootwatch/core/item_matcher.hpp>
#include <lootwatch/core/text_correction.hpp>
#include <charconv>
#include <cctype>
#include <cmath>
#include <string>

namespace lootwatch::core {

namespace {

// U+00D7 MULTIPLICATION SIGN
constexpr std::string_view kTimesSign = "\xC3\x97";

bool is_digit(char c) noexcept {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_letter(char c) noexcept {
  return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

/// Length of the multiplier token at `pos`, 0 if none. A letter x only counts
/// when it is not glued to other letters on the side away from the number.
std::size_t multiplier_at(std::string_view text, std::size_t pos, bool number_follows) {
  if (text.substr(pos, kTimesSign.size()) == kTimesSign) return kTimesSign.size();
  const char c = text[pos];
  if (c == '*') return 1;
  if (c == 'x' || c == 'X') {
    if (number_follows) {
      return (pos == 0 || !is_letter(text[pos - 1])) ? 1 : 0;
    }
    return (pos + 1 >= text.size() || !is_letter(text[pos + 1])) ? 1 : 0;
  }
  return 0;
}

std::size_t skip_spaces(std::string_view text, std::size_t pos) {
  while (pos < text.size() && text[pos] == ' ') ++pos;
  return pos;
}

/// Parses the digit run at [begin, end); nullopt on overflow.
std::optional<std::uint64_t> parse_count(std::string_view text, std::size_t begin, std::size_t end) {
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data() + begin, text.data() + end, value);
  if (ec != std::errc{} || ptr != text.data() + end) return std::nullopt;
  return value;
}

}  // namespace

ItemMatcher::ItemMatcher(MatcherConfig config) : config_(config) {}

std::optional<std::uint32_t> ItemMatcher::extract_quantity(std::string_view text) const {
  std::optional<std::uint64_t> found;
  for (std::size_t i = 0; i < text.size(); ++i) {
    // "x5", "× 3", "*2"
    if (const std::size_t len = multiplier_at(text, i, true); len > 0) {
      const std::size_t begin = skip_spaces(text, i + len);
      std::size_t end = begin;
      while (end < text.size() && is_digit(text[end])) ++end;
      if (end > begin) {
        found = parse_count(text, begin, end);
        if (!found) return std::nullopt;
        break;
      }
    }
    // "5x", "12 ×"
    if (is_digit(text[i]) && (i == 0 || !is_digit(text[i - 1]))) {
      std::size_t end = i;
      while (end < text.size() && is_digit(text[end])) ++end;
      const std::size_t after = skip_spaces(text, end);
      if (after < text.size() && multiplier_at(text, after, false) > 0) {
        found = parse_count(text, i, end);
        if (!found) return std::nullopt;
        break;
      }
    }
  }
  if (!found || *found < 1 || *found > config_.max_quantity) return std::nullopt;
  return static_cast<std::uint32_t>(*found);
}

bool ItemMatcher::fuzzy_hit(std::string_view text_key, const MatchCandidate& candidate) const {
  const std::string_view name = candidate.confusion;
  if (name.size() < config_.fuzzy_min_name_length) return false;
  if (text_key.size() > 2 * name.size()) return false;

  auto window = static_cast<std::size_t>(
      std::ceil(static_cast<double>(name.size()) * static_cast<double>(config_.fuzzy_ratio)));
  if (window == 0 || window > name.size()) window = name.size();

  for (std::size_t start = 0; start + window <= name.size(); ++start) {
    if (text_key.find(name.substr(start, window)) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

std::optional<LootMatch> ItemMatcher::match(const OcrReading& reading,
                                            const ItemCatalog& catalog) const {
  const std::string text = normalize_text(reading.text);
  if (text.empty() || catalog.empty()) return std::nullopt;
  const std::string text_key = confusion_key(text);

  auto make = [&](const MatchCandidate& c, MatchMethod method, float confidence) {
    LootMatch m;
    m.item = c.name;
    m.quantity = extract_quantity(reading.text).value_or(1);
    m.confidence = confidence;
    m.method = method;
    m.original_text = reading.text;
    m.bbox = reading.bbox;
    m.item_id = c.id;
    return m;
  };

  for (const auto& c : catalog.candidates()) {
    if (contains_phrase(text, c.lowered) || contains_phrase(text_key, c.confusion)) {
      return make(c, MatchMethod::Exact, reading.confidence);
    }
  }

  for (const auto& c : catalog.candidates()) {
    if (fuzzy_hit(text_key, c)) {
      return make(c, MatchMethod::Fuzzy, reading.confidence * config_.fuzzy_confidence_scale);
    }
  }
  return std::nullopt;
}

}  // namespace lootwatch::core
