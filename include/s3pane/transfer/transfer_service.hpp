#pragma once

#include "s3pane/core/cancel.hpp"
#include "s3pane/storage/object_store.hpp"
#include "s3pane/transfer/progress_tracker.hpp"
#include "s3pane/transfer/transfer_planner.hpp"

#include <filesystem>
#include <string>

namespace s3pane {

class MetricsExporter;

/// Single-file upload and download with progress reporting.
///
/// A failed upload is retried exactly once with the planner's fallback
/// plan; progress keeps accumulating across both attempts so the reported
/// percentage never goes backwards. Cancellation is never retried.
class TransferService {
public:
    TransferService(ObjectStore& store, const TransferPlanner& planner);

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    OpResult upload(const std::filesystem::path& local_path, const std::string& key,
                    ProgressSink* sink = nullptr, const CancelFlag& cancel = {});

    OpResult download(const std::string& key, const std::filesystem::path& local_path,
                      ProgressSink* sink = nullptr, const CancelFlag& cancel = {});

private:
    ObjectStore& store_;
    const TransferPlanner& planner_;
    MetricsExporter* metrics_ = nullptr;
};

}  // namespace s3pane
