#include "s3pane/transfer/transfer_service.hpp"
#include "s3pane/core/log.hpp"
#include "s3pane/core/metrics.hpp"

#include <optional>

namespace s3pane {

namespace {

// Keeps the active-transfers gauge and duration histogram in step
class TransferScope {
public:
    TransferScope(MetricsExporter* metrics, prometheus::Histogram* duration)
        : metrics_(metrics) {
        if (metrics_) {
            metrics_->transfers_active().Increment();
            timer_.emplace(*duration);
        }
    }

    ~TransferScope() {
        if (metrics_) {
            metrics_->transfers_active().Decrement();
        }
    }

    TransferScope(const TransferScope&) = delete;
    TransferScope& operator=(const TransferScope&) = delete;

private:
    MetricsExporter* metrics_;
    std::optional<ScopedTimer> timer_;
};

}  // namespace

TransferService::TransferService(ObjectStore& store, const TransferPlanner& planner)
    : store_(store)
    , planner_(planner) {}

OpResult TransferService::upload(const std::filesystem::path& local_path, const std::string& key,
                                 ProgressSink* sink, const CancelFlag& cancel) {
    if (key.empty()) {
        return OpResult::failure("empty destination key for " + local_path.string());
    }

    std::error_code ec;
    uint64_t file_size = std::filesystem::file_size(local_path, ec);
    if (ec) {
        return OpResult::failure("cannot read " + local_path.string() + ": " + ec.message());
    }

    TransferScope scope(metrics_, metrics_ ? &metrics_->upload_duration() : nullptr);
    ProgressTracker tracker(file_size, sink);

    TransferPlan plan = planner_.plan(file_size);
    log_debug("Uploading %s -> %s (%llu bytes, part %llu MB, %zu workers%s)",
              local_path.c_str(), store_.display_uri(key).c_str(),
              static_cast<unsigned long long>(file_size),
              static_cast<unsigned long long>(plan.part_size_bytes / constants::MiB),
              plan.concurrency, plan.use_threads ? "" : ", sequential");

    OpResult result = store_.put_file(key, local_path, plan, tracker.callback(), cancel);

    if (!result.success && !result.cancelled) {
        TransferPlan fallback = planner_.fallback_plan(file_size);
        log_warn("%s; retrying once single-threaded with %llu MB parts",
                 result.error_message.c_str(),
                 static_cast<unsigned long long>(fallback.part_size_bytes / constants::MiB));
        if (metrics_) metrics_->upload_fallbacks_total().Increment();

        result = store_.put_file(key, local_path, fallback, tracker.callback(), cancel);
    }

    if (metrics_) {
        if (result.success) {
            metrics_->uploads_success().Increment();
            metrics_->upload_bytes_total().Increment(static_cast<double>(file_size));
        } else if (result.cancelled) {
            metrics_->uploads_cancelled().Increment();
        } else {
            metrics_->uploads_failure().Increment();
        }
    }

    if (result.success) {
        log_info("Uploaded %s -> %s", local_path.c_str(), store_.display_uri(key).c_str());
    }
    return result;
}

OpResult TransferService::download(const std::string& key, const std::filesystem::path& local_path,
                                   ProgressSink* sink, const CancelFlag& cancel) {
    HeadResult head = store_.head(key);
    if (!head.exists()) {
        if (metrics_) metrics_->downloads_failure().Increment();
        return OpResult::failure(head.error_message);
    }

    TransferScope scope(metrics_, metrics_ ? &metrics_->download_duration() : nullptr);
    uint64_t size = head.size.value_or(1);
    ProgressTracker tracker(size, sink);

    OpResult result = store_.get_file(key, local_path, tracker.callback(), cancel);

    if (metrics_) {
        if (result.success) {
            metrics_->downloads_success().Increment();
            metrics_->download_bytes_total().Increment(static_cast<double>(tracker.seen()));
        } else if (result.cancelled) {
            metrics_->downloads_cancelled().Increment();
        } else {
            metrics_->downloads_failure().Increment();
        }
    }

    if (result.success) {
        log_info("Downloaded %s -> %s", store_.display_uri(key).c_str(), local_path.c_str());
    }
    return result;
}

}  // namespace s3pane
