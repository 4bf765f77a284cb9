#include "s3pane/transfer/transfer_planner.hpp"

#include <algorithm>

namespace s3pane {

TransferPlanner::TransferPlanner(const TransferOverrides& overrides)
    : overrides_(overrides) {}

uint64_t TransferPlanner::auto_part_size_mb(uint64_t file_size) {
    uint64_t per_part = (file_size + constants::TARGET_PART_COUNT - 1) / constants::TARGET_PART_COUNT;
    uint64_t part_mb = (per_part + constants::MiB - 1) / constants::MiB;
    part_mb = std::max(part_mb, constants::MIN_PART_SIZE_MB);
    return std::max(part_mb, constants::MIN_AUTO_PART_SIZE_MB);
}

TransferPlan TransferPlanner::build(uint64_t file_size, bool force_single_thread, bool bump_part) const {
    uint64_t part_mb = overrides_.part_size_mb > 0
        ? overrides_.part_size_mb
        : auto_part_size_mb(file_size);

    if (bump_part) {
        part_mb *= 2;
    }
    part_mb = std::clamp(part_mb, constants::MIN_PART_SIZE_MB, constants::MAX_PART_SIZE_MB);

    TransferPlan plan;
    plan.part_size_bytes = part_mb * constants::MiB;
    plan.concurrency = std::max<size_t>(overrides_.max_concurrency, 1);
    plan.use_threads = overrides_.use_threads;

    if (force_single_thread) {
        plan.use_threads = false;
        plan.concurrency = 1;
    }
    return plan;
}

TransferPlan TransferPlanner::plan(uint64_t file_size) const {
    return build(file_size, false, false);
}

TransferPlan TransferPlanner::fallback_plan(uint64_t file_size) const {
    return build(file_size, true, overrides_.fallback_bump);
}

}  // namespace s3pane
