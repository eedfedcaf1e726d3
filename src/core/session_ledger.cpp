#include <lootwatch/core/session_ledger.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <numeric>

namespace lootwatch::core {

std::string_view to_string(LedgerState state) noexcept {
  switch (state) {
    case LedgerState::Idle:
      return "Idle";
    case LedgerState::Ready:
      return "Ready";
    case LedgerState::Active:
      return "Active";
    case LedgerState::Ended:
      return "Ended";
  }
  return "Unknown";
}

SessionLedger::SessionLedger(NowFn now)
    : now_(now ? std::move(now) : NowFn([]() { return std::chrono::system_clock::now(); })),
      catalog_(empty_catalog()) {}

void SessionLedger::set_location(std::string name, CatalogSnapshot catalog) {
  session_.location = std::move(name);
  catalog_ = catalog ? std::move(catalog) : empty_catalog();
  CV_LOG_INFO(NULL, "ledger: location \"" << *session_.location << "\" ("
                        << catalog_->size() << " catalog items)");
}

std::expected<void, LootError> SessionLedger::set_location(std::string name,
                                                           IItemCatalogProvider& provider) {
  auto loaded = provider.load(name);
  if (!loaded) {
    CV_LOG_WARNING(NULL, "ledger: no catalog for \"" << name << "\" ("
                             << to_string(loaded.error()) << "), matching disabled");
    set_location(std::move(name), empty_catalog());
    return std::unexpected(LootError::NoCatalog);
  }
  set_location(std::move(name), make_catalog(std::move(*loaded)));
  return {};
}

std::expected<void, LootError> SessionLedger::start() {
  if (!session_.location) {
    return std::unexpected(LootError::NoLocation);
  }
  session_.loot.clear();
  session_.silver = 0;
  session_.start_time = now_();
  session_.end_time.reset();
  CV_LOG_INFO(NULL, "ledger: session started at \"" << *session_.location << "\"");
  return {};
}

std::expected<void, LootError> SessionLedger::record_match(const LootMatch& match) {
  if (!is_active()) {
    return std::unexpected(LootError::NotActive);
  }
  auto it = session_.loot.find(match.item);
  if (it == session_.loot.end()) {
    it = session_.loot.emplace(match.item, 0).first;
  }
  it->second += match.quantity;
  CV_LOG_DEBUG(NULL, "ledger: +" << match.quantity << "x " << match.item << " (total "
                                 << it->second << ") [" << to_string(match.method) << ", "
                                 << match.confidence << "]");
  return {};
}

std::expected<void, LootError> SessionLedger::add_silver(std::int64_t amount) {
  if (!is_active()) {
    return std::unexpected(LootError::NotActive);
  }
  session_.silver += amount;
  return {};
}

std::expected<SessionSummary, LootError> SessionLedger::end() {
  if (!is_active()) {
    return std::unexpected(LootError::NotActive);
  }
  session_.end_time = now_();
  SessionSummary s = summary();
  CV_LOG_INFO(NULL, "ledger: session ended, " << s.item_count << " items in "
                        << s.duration.count() << "ms");
  return s;
}

void SessionLedger::reset() {
  session_.loot.clear();
  session_.silver = 0;
  session_.start_time.reset();
  session_.end_time.reset();
}

bool SessionLedger::is_active() const noexcept {
  return session_.start_time.has_value() && !session_.end_time.has_value();
}

LedgerState SessionLedger::state() const noexcept {
  if (is_active()) return LedgerState::Active;
  if (session_.end_time) return LedgerState::Ended;
  if (session_.location) return LedgerState::Ready;
  return LedgerState::Idle;
}

SessionSummary SessionLedger::summary() const {
  SessionSummary s;
  s.location = session_.location.value_or("");
  if (session_.start_time) {
    const auto until = session_.end_time.value_or(now_());
    s.duration = std::chrono::duration_cast<std::chrono::milliseconds>(until - *session_.start_time);
  }
  s.loot = session_.loot;
  s.item_count = std::accumulate(session_.loot.begin(), session_.loot.end(), std::uint64_t{0},
                                 [](std::uint64_t sum, const auto& kv) { return sum + kv.second; });
  s.silver = session_.silver;
  s.total_value = session_.silver;
  return s;
}

std::uint64_t SessionLedger::count(std::string_view item) const {
  const auto it = session_.loot.find(item);
  return it == session_.loot.end() ? 0 : it->second;
}

}  // namespace lootwatch::core
