#include <lootwatch/app/trace_replay_tbb.hpp>

#ifdef LOOTWATCH_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace lootwatch::app {

namespace lc = lootwatch::core;

std::vector<DedupEvaluation>
evaluate_dedup_configs_tbb(std::span<const lc::OcrReading> trace,
                           const ReplayOptions& base,
                           const std::vector<lc::DedupConfig>& candidates,
                           std::uint64_t expected_items) {
  std::vector<DedupEvaluation> results(candidates.size());
  if (candidates.empty()) return results;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, candidates.size()),
      [&](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          ReplayOptions options = base;
          options.dedup = candidates[i];
          DedupEvaluation& eval = results[i];
          eval.config = candidates[i];
          eval.result = replay_trace(trace, options);
          const std::uint64_t got = eval.result.item_count;
          eval.abs_error = got > expected_items ? got - expected_items : expected_items - got;
        }
      });
  return results;
}

}  // namespace lootwatch::app

#endif  // LOOTWATCH_HAS_TBB
