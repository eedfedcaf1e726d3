#pragma once

#include <lootwatch/core/error.hpp>
#include <lootwatch/core/item_catalog.hpp>
#include <lootwatch/core/loot_match.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace lootwatch::core {

using LootCounts = std::map<std::string, std::uint64_t, std::less<>>;

/// Session lifecycle as derived from the session fields.
enum class LedgerState : std::uint8_t {
  Idle,    // no location
  Ready,   // location set, never started
  Active,  // started, not ended
  Ended,
};

[[nodiscard]] std::string_view to_string(LedgerState state) noexcept;

struct Session {
  std::optional<std::string> location;
  LootCounts loot;
  std::int64_t silver{0};
  std::optional<std::chrono::system_clock::time_point> start_time;
  std::optional<std::chrono::system_clock::time_point> end_time;
};

struct SessionSummary {
  std::string location;
  std::chrono::milliseconds duration{0};
  LootCounts loot;
  std::uint64_t item_count{0};
  std::int64_t silver{0};
  std::int64_t total_value{0};  // silver only until item prices are tracked
};

/// Owns one Session and its catalog snapshot. All mutation of loot counts goes
/// through record_match(). Not thread-safe; the pipeline worker owns it.
class SessionLedger {
 public:
  using NowFn = std::function<std::chrono::system_clock::time_point()>;

  explicit SessionLedger(NowFn now = {});

  /// Stores the location and swaps in its catalog (null means empty).
  void set_location(std::string name, CatalogSnapshot catalog);

  /// Stores the location and loads its catalog from `provider`. On load failure
  /// the location is still set, the catalog falls back to an empty one and
  /// NoCatalog is returned.
  std::expected<void, LootError> set_location(std::string name,
                                              IItemCatalogProvider& provider);

  /// NoLocation if no location is set; otherwise clears counts and silver and
  /// opens a new session.
  std::expected<void, LootError> start();

  /// NotActive unless a session is open; otherwise adds match.quantity to the item.
  std::expected<void, LootError> record_match(const LootMatch& match);

  std::expected<void, LootError> add_silver(std::int64_t amount);

  /// NotActive unless a session is open; otherwise closes it and returns the summary.
  std::expected<SessionSummary, LootError> end();

  /// Forgets counts and times, keeps location and catalog.
  void reset();

  [[nodiscard]] bool is_active() const noexcept;
  [[nodiscard]] LedgerState state() const noexcept;

  /// Summary at any time; duration runs up to now while active.
  [[nodiscard]] SessionSummary summary() const;

  [[nodiscard]] std::uint64_t count(std::string_view item) const;
  [[nodiscard]] const Session& session() const noexcept { return session_; }
  [[nodiscard]] const CatalogSnapshot& catalog() const noexcept { return catalog_; }

 private:
  NowFn now_;
  Session session_;
  CatalogSnapshot catalog_;
};

}  // namespace lootwatch::core
