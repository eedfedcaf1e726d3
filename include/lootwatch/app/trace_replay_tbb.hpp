#pragma once

#include <lootwatch/app/trace_replay.hpp>
#include <cstdint>
#include <span>
#include <vector>

#ifdef LOOTWATCH_HAS_TBB

namespace lootwatch::app {

/// evaluate_dedup_configs on TBB's task scheduler: one tbb::parallel_for task
/// range over the candidates. Each candidate replays with its own pipeline, so
/// nothing is shared between tasks except the read-only trace and catalog.
[[nodiscard]] std::vector<DedupEvaluation>
evaluate_dedup_configs_tbb(std::span<const lootwatch::core::OcrReading> trace,
                           const ReplayOptions& base,
                           const std::vector<lootwatch::core::DedupConfig>& candidates,
                           std::uint64_t expected_items);

}  // namespace lootwatch::app

#endif  // LOOTWATCH_HAS_TBB
