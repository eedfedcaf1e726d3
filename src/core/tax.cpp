#include <lootwatch/core/tax.hpp>
#include <array>
#include <cmath>

namespace lootwatch::core {

namespace {

struct FameBracket {
  std::int64_t threshold;
  double bonus;
};

constexpr std::array<FameBracket, 4> kFameBrackets{{
    {0, 0.0},
    {1000, 0.005},
    {4000, 0.01},
    {7000, 0.015},
}};

}  // namespace

double family_fame_bonus(std::int64_t family_fame) noexcept {
  if (family_fame < 0) return 0.0;
  double bonus = 0.0;
  for (const auto& b : kFameBrackets) {
    if (family_fame < b.threshold) break;
    bonus = b.bonus;
  }
  return bonus;
}

std::int64_t post_tax_value(std::int64_t pre_tax_value,
                            bool value_pack,
                            bool rich_merchant_ring,
                            std::int64_t family_fame) noexcept {
  const double base = static_cast<double>(pre_tax_value) * (1.0 - kBaseTaxRate);
  double total = base;
  if (value_pack) total += base * kValuePackBonus;
  if (rich_merchant_ring) total += base * kRichMerchantRingBonus;
  total += base * family_fame_bonus(family_fame);
  return static_cast<std::int64_t>(std::floor(total));
}

}  // namespace lootwatch::core
