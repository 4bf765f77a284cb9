#include "s3pane/transfer/progress_tracker.hpp"

#include <algorithm>

namespace s3pane {

ProgressTracker::ProgressTracker(uint64_t total_bytes, ProgressSink* sink)
    : total_(std::max<uint64_t>(total_bytes, 1))
    , sink_(sink) {}

void ProgressTracker::add(uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    seen_ += bytes;
    int pct = seen_ >= total_ ? 100 : static_cast<int>(seen_ * 100 / total_);
    last_percent_ = std::clamp(pct, 0, 100);
    if (sink_) {
        sink_->on_progress(last_percent_);
    }
}

ByteCallback ProgressTracker::callback() {
    return [this](uint64_t bytes) { add(bytes); };
}

int ProgressTracker::percent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_percent_;
}

uint64_t ProgressTracker::seen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_;
}

}  // namespace s3pane
