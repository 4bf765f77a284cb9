#pragma once

#include "s3pane/storage/object_store.hpp"

#include <cstdint>
#include <mutex>

namespace s3pane {

// Receives whole-number percentages (0..100) as a transfer advances
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void on_progress(int percent) = 0;
};

/// Turns byte deltas into percentage events.
///
/// The total is clamped to at least 1 so empty files report 100. Safe to
/// feed from several transfer workers at once; events are delivered in
/// non-decreasing order.
class ProgressTracker {
public:
    ProgressTracker(uint64_t total_bytes, ProgressSink* sink);

    void add(uint64_t bytes);

    // Adapter for ObjectStore transfer calls
    ByteCallback callback();

    int percent() const;
    uint64_t seen() const;
    uint64_t total() const { return total_; }

private:
    const uint64_t total_;
    ProgressSink* sink_;
    mutable std::mutex mutex_;
    uint64_t seen_ = 0;
    int last_percent_ = 0;
};

}  // namespace s3pane
