#include "s3pane/app/remote_browser.hpp"
#include "s3pane/core/log.hpp"
#include "s3pane/core/metrics.hpp"

#include <cstdio>

namespace s3pane {

namespace {

std::string strip_slashes(const std::string& s) {
    size_t start = s.find_first_not_of('/');
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of('/');
    return s.substr(start, end - start + 1);
}

std::string parent_of(const std::string& prefix) {
    size_t slash = prefix.rfind('/');
    return slash == std::string::npos ? "" : strip_slashes(prefix.substr(0, slash));
}

}  // namespace

std::string human_size(uint64_t size) {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    char buf[64];
    if (size > GB) {
        snprintf(buf, sizeof(buf), "%.2f GB", static_cast<double>(size) / GB);
    } else if (size > MB) {
        snprintf(buf, sizeof(buf), "%.2f MB", static_cast<double>(size) / MB);
    } else if (size > KB) {
        snprintf(buf, sizeof(buf), "%.2f KB", static_cast<double>(size) / KB);
    } else {
        snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(size));
    }
    return buf;
}

// ============================================================================
// RefreshWorker
// ============================================================================

RefreshWorker::RefreshWorker(const ObjectStore& store, uint32_t page_size)
    : lister_(store, page_size)
    , cancel_(make_cancel_flag()) {
    thread_ = std::thread(&RefreshWorker::worker_loop, this);
}

RefreshWorker::~RefreshWorker() {
    stop();
}

void RefreshWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
        pending_.reset();
    }
    cancel_->store(true);
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    idle_cv_.notify_all();
}

void RefreshWorker::request(const std::string& prefix) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        if (running_ && pending_) {
            log_debug("Coalescing refresh of '%s' into '%s'", pending_->c_str(), prefix.c_str());
        }
        pending_ = prefix;
    }
    cv_.notify_one();
}

std::vector<PrefixListing> RefreshWorker::take_results() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PrefixListing> out;
    out.swap(results_);
    return out;
}

bool RefreshWorker::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] {
        return stopping_ || (!running_ && !pending_);
    });
}

void RefreshWorker::set_metrics(MetricsExporter* metrics) {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_ = metrics;
}

void RefreshWorker::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] { return stopping_ || pending_.has_value(); });
        if (stopping_) break;

        std::string prefix = std::move(*pending_);
        pending_.reset();
        running_ = true;
        MetricsExporter* metrics = metrics_;
        listings_started_.fetch_add(1);
        lock.unlock();

        PrefixListing listing;
        {
            std::optional<ScopedTimer> timer;
            if (metrics) timer.emplace(metrics->listing_duration());
            listing = lister_.list(prefix, cancel_);
        }

        if (metrics) {
            if (listing.success) {
                metrics->listings_success().Increment();
                if (!listing.complete) metrics->listings_incomplete_total().Increment();
            } else if (!listing.cancelled) {
                metrics->listings_failure().Increment();
            }
        }
        if (!listing.success && !listing.cancelled) {
            log_error("Failed to list '%s': %s", prefix.c_str(), listing.error_message.c_str());
        }

        lock.lock();
        running_ = false;
        if (!listing.cancelled) {
            results_.push_back(std::move(listing));
        }
        if (!pending_) {
            idle_cv_.notify_all();
        }
    }
    running_ = false;
}

// ============================================================================
// RemoteBrowser
// ============================================================================

RemoteBrowser::RemoteBrowser(ObjectStore& store, UserPrompt& prompt, uint32_t page_size)
    : store_(store)
    , prompt_(prompt)
    , worker_(store, page_size) {}

void RemoteBrowser::set_prefix(const std::string& prefix) {
    prefix_ = strip_slashes(prefix);
}

void RemoteBrowser::enter(const std::string& dir_name) {
    std::string name = strip_slashes(dir_name);
    if (name.empty()) return;
    if (name == "..") {
        up();
        return;
    }
    prefix_ = prefix_.empty() ? name : prefix_ + "/" + name;
}

void RemoteBrowser::up() {
    prefix_ = parent_of(prefix_);
}

std::string RemoteBrowser::full_key_for_name(const std::string& name) const {
    std::string n = strip_slashes(name);
    return prefix_.empty() ? n : prefix_ + "/" + n;
}

OpResult RemoteBrowser::ensure_prefix_folder() {
    while (!prefix_.empty() && store_.exists(prefix_)) {
        bool convert = prompt_.confirm("Path is a file",
                                       "'" + prefix_ + "' is a file. Convert it to a folder?");
        if (!convert) {
            up();
            continue;
        }

        OpResult removed = store_.remove(prefix_);
        if (!removed.success) {
            return OpResult::failure("convert of " + prefix_ + " failed: " + removed.error_message);
        }
        OpResult marker = store_.create_folder_marker(prefix_ + "/");
        if (!marker.success) {
            return OpResult::failure("convert of " + prefix_ + " failed: " + marker.error_message);
        }
        log_info("Converted %s into a folder", store_.display_uri(prefix_).c_str());
        break;
    }
    return OpResult::ok();
}

OpResult RemoteBrowser::refresh() {
    OpResult ready = ensure_prefix_folder();
    if (!ready.success) {
        return ready;
    }
    worker_.request(prefix_);
    return ready;
}

std::optional<PrefixListing> RemoteBrowser::poll() {
    std::optional<PrefixListing> latest;
    const std::string current = normalize_prefix(prefix_);
    for (auto& listing : worker_.take_results()) {
        if (listing.prefix != current) {
            log_debug("Dropping stale listing of '%s'", listing.prefix.c_str());
            continue;
        }
        latest = std::move(listing);
    }
    return latest;
}

PrefixListing RemoteBrowser::refresh_and_wait(std::chrono::milliseconds timeout) {
    OpResult ready = refresh();
    if (!ready.success) {
        PrefixListing failed;
        failed.prefix = normalize_prefix(prefix_);
        failed.error_message = ready.error_message;
        return failed;
    }

    if (!worker_.wait_idle(timeout)) {
        PrefixListing failed;
        failed.prefix = normalize_prefix(prefix_);
        failed.error_message = "listing of '" + prefix_ + "' timed out";
        return failed;
    }

    auto listing = poll();
    if (!listing) {
        PrefixListing failed;
        failed.prefix = normalize_prefix(prefix_);
        failed.error_message = "listing of '" + prefix_ + "' was cancelled";
        failed.cancelled = true;
        return failed;
    }
    return std::move(*listing);
}

}  // namespace s3pane
