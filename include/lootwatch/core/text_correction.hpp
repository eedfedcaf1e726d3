#pragma once

#include <string>
#include <string_view>

namespace lootwatch::core {

/// Lowercases, trims, collapses whitespace runs to one space and drops
/// apostrophes (ASCII ' and `, UTF-8 right single quote), which the target
/// font renders too thin for OCR to keep reliably.
[[nodiscard]] std::string normalize_text(std::string_view text);

/// Substitutes glyphs the OCR engine confuses in the game font:
/// '|' -> 'l', '0' -> 'o', '5' -> 's', '1' -> 'i', '8' -> 'b', '6' -> 'g'.
/// Length-preserving; expects lowercased input.
[[nodiscard]] std::string correct_ocr_confusions(std::string_view text);

/// Comparison key: correct_ocr_confusions() followed by folding 'l' into 'i',
/// since '|', '1', 'l' and 'i' form one confusion class in that font and the
/// table alone maps them to two different letters. Apply to both sides of a
/// comparison. Length-preserving.
[[nodiscard]] std::string confusion_key(std::string_view text);

/// True if `phrase` occurs in `text` delimited by non-alphanumeric characters
/// (or the string ends) on both sides.
[[nodiscard]] bool contains_phrase(std::string_view text, std::string_view phrase) noexcept;

/// Trims ASCII whitespace at both ends.
[[nodiscard]] std::string_view trim_view(std::string_view text) noexcept;

}  // namespace lootwatch::core
