#pragma once

#include <atomic>
#include <memory>

namespace s3pane {

/// Shared cancellation signal for long operations (transfers, tree walks).
/// A null flag means "not cancellable".
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

inline CancelFlag make_cancel_flag() {
    return std::make_shared<std::atomic<bool>>(false);
}

inline bool is_cancelled(const CancelFlag& flag) {
    return flag && flag->load(std::memory_order_relaxed);
}

}  // namespace s3pane
