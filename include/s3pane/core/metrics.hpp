#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace s3pane {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports transfer and listing metrics to a Prometheus textfile.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename. Recording is safe from any thread.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels = {});
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Serialize now. Returns false if the file could not be written.
    bool write_file();

    // --- Counter accessors ---
    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& uploads_cancelled() { return *uploads_cancelled_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& upload_fallbacks_total() { return *upload_fallbacks_total_; }
    prometheus::Counter& downloads_success() { return *downloads_success_; }
    prometheus::Counter& downloads_failure() { return *downloads_failure_; }
    prometheus::Counter& downloads_cancelled() { return *downloads_cancelled_; }
    prometheus::Counter& download_bytes_total() { return *download_bytes_total_; }
    prometheus::Counter& deletes_total() { return *deletes_total_; }
    prometheus::Counter& renames_success() { return *renames_success_; }
    prometheus::Counter& renames_failure() { return *renames_failure_; }
    prometheus::Counter& listings_success() { return *listings_success_; }
    prometheus::Counter& listings_failure() { return *listings_failure_; }
    prometheus::Counter& listings_incomplete_total() { return *listings_incomplete_total_; }

    // --- Gauge accessors ---
    prometheus::Gauge& transfers_active() { return *transfers_active_; }

    // --- Histogram accessors ---
    prometheus::Histogram& upload_duration() { return *upload_duration_; }
    prometheus::Histogram& download_duration() { return *download_duration_; }
    prometheus::Histogram& listing_duration() { return *listing_duration_; }

private:
    void writer_loop();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // --- Counters ---
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* uploads_cancelled_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* upload_fallbacks_total_;
    prometheus::Counter* downloads_success_;
    prometheus::Counter* downloads_failure_;
    prometheus::Counter* downloads_cancelled_;
    prometheus::Counter* download_bytes_total_;
    prometheus::Counter* deletes_total_;
    prometheus::Counter* renames_success_;
    prometheus::Counter* renames_failure_;
    prometheus::Counter* listings_success_;
    prometheus::Counter* listings_failure_;
    prometheus::Counter* listings_incomplete_total_;

    // --- Gauges ---
    prometheus::Gauge* transfers_active_;

    // --- Histograms ---
    prometheus::Histogram* upload_duration_;
    prometheus::Histogram* download_duration_;
    prometheus::Histogram* listing_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    std::mutex write_mutex_;
};

}  // namespace s3pane
