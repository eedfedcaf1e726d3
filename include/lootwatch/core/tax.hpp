#pragma once

#include <cstdint>

namespace lootwatch::core {

inline constexpr double kBaseTaxRate = 0.35;
inline constexpr double kValuePackBonus = 0.30;
inline constexpr double kRichMerchantRingBonus = 0.05;

/// Family fame bonus on the post-tax base: 0 below 1000, then 0.5 %, 1 % (4000+)
/// and 1.5 % (7000+). Negative fame gives no bonus.
[[nodiscard]] double family_fame_bonus(std::int64_t family_fame) noexcept;

/// Marketplace proceeds of a sale: 35 % tax, then each bonus is computed on the
/// post-tax base (bonuses do not stack on each other). Floored.
[[nodiscard]] std::int64_t post_tax_value(std::int64_t pre_tax_value,
                                          bool value_pack,
                                          bool rich_merchant_ring,
                                          std::int64_t family_fame) noexcept;

}  // namespace lootwatch::core
