#pragma once

#include "s3pane/core/constants.hpp"
#include "s3pane/storage/object_store.hpp"

#include <cstdint>

namespace s3pane {

// Tuning knobs for uploads, normally taken from Settings
struct TransferOverrides {
    uint64_t part_size_mb = 0;  // 0 = size-based automatic choice
    size_t max_concurrency = constants::DEFAULT_UPLOAD_CONCURRENCY;
    bool use_threads = true;
    bool fallback_bump = false;  // Double the part size in the fallback plan
};

/// Chooses multipart parameters per upload.
///
/// The automatic part size targets about TARGET_PART_COUNT parts with a
/// 64 MB floor. Every result is clamped to [MIN_PART_SIZE_MB, MAX_PART_SIZE_MB].
class TransferPlanner {
public:
    explicit TransferPlanner(const TransferOverrides& overrides = {});

    TransferPlan plan(uint64_t file_size) const;

    // Single-threaded plan for the one retry after a failed upload
    TransferPlan fallback_plan(uint64_t file_size) const;

    const TransferOverrides& overrides() const { return overrides_; }

    // Part size in MB before clamping
    static uint64_t auto_part_size_mb(uint64_t file_size);

private:
    TransferPlan build(uint64_t file_size, bool force_single_thread, bool bump_part) const;

    TransferOverrides overrides_;
};

}  // namespace s3pane
