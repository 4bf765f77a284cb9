#include "s3pane/core/metrics.hpp"
#include "s3pane/core/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace s3pane {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    auto counter_reg = [&](const std::string& name, const std::string& help) -> prometheus::Counter& {
        return prometheus::BuildCounter()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    // --- Counters ---

    auto& uploads_family = prometheus::BuildCounter()
        .Name("s3pane_uploads_total")
        .Help("Total file uploads by result")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &uploads_family.Add({{"result", "success"}});
    uploads_failure_ = &uploads_family.Add({{"result", "failure"}});
    uploads_cancelled_ = &uploads_family.Add({{"result", "cancelled"}});

    upload_bytes_total_ = &counter_reg("s3pane_upload_bytes_total", "Total bytes uploaded");
    upload_fallbacks_total_ = &counter_reg("s3pane_upload_fallbacks_total",
                                           "Uploads retried with the single-threaded fallback plan");

    auto& downloads_family = prometheus::BuildCounter()
        .Name("s3pane_downloads_total")
        .Help("Total file downloads by result")
        .Labels(labels)
        .Register(*registry_);
    downloads_success_ = &downloads_family.Add({{"result", "success"}});
    downloads_failure_ = &downloads_family.Add({{"result", "failure"}});
    downloads_cancelled_ = &downloads_family.Add({{"result", "cancelled"}});

    download_bytes_total_ = &counter_reg("s3pane_download_bytes_total", "Total bytes downloaded");
    deletes_total_ = &counter_reg("s3pane_deletes_total", "Total remote keys deleted");

    auto& renames_family = prometheus::BuildCounter()
        .Name("s3pane_renames_total")
        .Help("Total remote renames by result")
        .Labels(labels)
        .Register(*registry_);
    renames_success_ = &renames_family.Add({{"result", "success"}});
    renames_failure_ = &renames_family.Add({{"result", "failure"}});

    auto& listings_family = prometheus::BuildCounter()
        .Name("s3pane_listings_total")
        .Help("Total prefix listings by result")
        .Labels(labels)
        .Register(*registry_);
    listings_success_ = &listings_family.Add({{"result", "success"}});
    listings_failure_ = &listings_family.Add({{"result", "failure"}});

    listings_incomplete_total_ = &counter_reg("s3pane_listings_incomplete_total",
                                              "Listings cut short by repeated pagination markers");

    // --- Gauges ---

    transfers_active_ = &prometheus::BuildGauge()
        .Name("s3pane_transfers_active")
        .Help("Uploads and downloads in progress")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("s3pane_upload_duration_seconds")
        .Help("Upload duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.1, 0.5, 1, 5, 10, 30, 60, 300, 900, 1800, 3600, 7200});

    download_duration_ = &prometheus::BuildHistogram()
        .Name("s3pane_download_duration_seconds")
        .Help("Download duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.1, 0.5, 1, 5, 10, 30, 60, 300, 900, 1800, 3600});

    listing_duration_ = &prometheus::BuildHistogram()
        .Name("s3pane_listing_duration_seconds")
        .Help("Prefix listing duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    if (!write_file()) {
        log_warn("Failed to write metrics file %s", prom_file_path_.c_str());
    }
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        if (!write_file()) {
            log_warn("Failed to write metrics file %s", prom_file_path_.c_str());
        }
    }
}

bool MetricsExporter::write_file() {
    std::lock_guard lock(write_mutex_);

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return false;
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    return !ec;
}

}  // namespace s3pane
