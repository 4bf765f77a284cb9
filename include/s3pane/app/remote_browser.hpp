#pragma once

#include "s3pane/core/cancel.hpp"
#include "s3pane/storage/object_store.hpp"
#include "s3pane/storage/prefix_lister.hpp"
#include "s3pane/transfer/conflict_resolver.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace s3pane {

class MetricsExporter;

// "1.50 GB", "12.00 KB", "512 B"
std::string human_size(uint64_t size);

/// Background listing thread with refresh coalescing.
///
/// At most one listing runs at a time. Requests that arrive while a listing
/// is in flight collapse into a single follow-up listing of the most
/// recently requested prefix. Finished listings queue up until the
/// foreground calls take_results().
class RefreshWorker {
public:
    explicit RefreshWorker(const ObjectStore& store,
                           uint32_t page_size = constants::DEFAULT_LIST_MAX_KEYS);
    ~RefreshWorker();

    RefreshWorker(const RefreshWorker&) = delete;
    RefreshWorker& operator=(const RefreshWorker&) = delete;

    /// Applies from the next listing the worker starts.
    void set_metrics(MetricsExporter* metrics);

    void request(const std::string& prefix);

    std::vector<PrefixListing> take_results();

    /// Wait until nothing is running or pending.
    /// Returns false on timeout.
    bool wait_idle(std::chrono::milliseconds timeout);

    // Listings started since construction
    size_t listings_started() const { return listings_started_.load(); }

    /// Cancel the in-flight listing and join the thread. Pending requests
    /// are dropped.
    void stop();

private:
    void worker_loop();

    PrefixLister lister_;
    MetricsExporter* metrics_ = nullptr;  // Guarded by mutex_
    CancelFlag cancel_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    bool stopping_ = false;
    bool running_ = false;
    std::optional<std::string> pending_;
    std::vector<PrefixListing> results_;
    std::atomic<size_t> listings_started_{0};
};

/// Current-folder navigation over an object store.
///
/// The prefix is kept without leading or trailing '/'; "" is the bucket
/// root. Listings are produced by a RefreshWorker and only the ones for
/// the current prefix are handed out by poll().
class RemoteBrowser {
public:
    RemoteBrowser(ObjectStore& store, UserPrompt& prompt,
                  uint32_t page_size = constants::DEFAULT_LIST_MAX_KEYS);

    void set_metrics(MetricsExporter* metrics) { worker_.set_metrics(metrics); }

    const std::string& prefix() const { return prefix_; }
    void set_prefix(const std::string& prefix);

    void enter(const std::string& dir_name);
    void up();

    // Full key for an entry name shown in the current folder
    std::string full_key_for_name(const std::string& name) const;

    /// If the current prefix is itself a plain file, offer to convert it
    /// into a folder (delete, then create the marker). Declining moves up
    /// one level and checks again.
    OpResult ensure_prefix_folder();

    /// ensure_prefix_folder() then queue a listing of the current prefix.
    OpResult refresh();

    /// Latest finished listing for the current prefix, if any arrived since
    /// the last call. Listings for other prefixes are discarded.
    std::optional<PrefixListing> poll();

    /// refresh() and block until the listing for the current prefix lands.
    PrefixListing refresh_and_wait(std::chrono::milliseconds timeout);

    RefreshWorker& worker() { return worker_; }

private:
    ObjectStore& store_;
    UserPrompt& prompt_;
    RefreshWorker worker_;
    std::string prefix_;
};

}  // namespace s3pane
