#include "s3pane/storage/object_store.hpp"
#include "s3pane/core/log.hpp"
#include "s3pane/net/http.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <future>
#include <mutex>
#include <sstream>

namespace s3pane {

const char* exists_status_to_string(ExistsStatus status) {
    switch (status) {
        case ExistsStatus::Exists: return "exists";
        case ExistsStatus::NotFound: return "not found";
        case ExistsStatus::PermissionDenied: return "permission denied";
        case ExistsStatus::TransportError: return "transport error";
    }
    return "unknown";
}

// ============================================================================
// XML parsing helpers for S3 responses
// ============================================================================

namespace xml {

// Value between <tag>value</tag>, empty if not found
static std::string get_element(const std::string& doc, const std::string& tag, size_t start_pos = 0) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = doc.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = doc.find(close_tag, start);
    if (end == std::string::npos) return "";

    return doc.substr(start, end - start);
}

// Contents of every <tag>...</tag>
static std::vector<std::string> find_elements(const std::string& doc, const std::string& tag) {
    std::vector<std::string> results;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t pos = 0;
    while (pos < doc.size()) {
        size_t start = doc.find(open_tag, pos);
        if (start == std::string::npos) break;

        size_t content_start = start + open_tag.length();
        size_t end = doc.find(close_tag, content_start);
        if (end == std::string::npos) break;

        results.push_back(doc.substr(content_start, end - content_start));
        pos = end + close_tag.length();
    }

    return results;
}

static std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) { result += '<'; i += 4; }
            else if (s.compare(i, 4, "&gt;") == 0) { result += '>'; i += 4; }
            else if (s.compare(i, 5, "&amp;") == 0) { result += '&'; i += 5; }
            else if (s.compare(i, 6, "&quot;") == 0) { result += '"'; i += 6; }
            else if (s.compare(i, 6, "&apos;") == 0) { result += '\''; i += 6; }
            else { result += s[i++]; }
        } else {
            result += s[i++];
        }
    }

    return result;
}

static std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

}  // namespace xml

// ============================================================================
// Public parsing helpers
// ============================================================================

namespace s3 {

std::string build_list_query(const ListRequest& request) {
    std::vector<std::string> params;
    params.push_back("list-type=2");
    if (!request.prefix.empty()) {
        params.push_back("prefix=" + net::url_encode(request.prefix));
    }
    if (!request.delimiter.empty()) {
        params.push_back("delimiter=" + net::url_encode(request.delimiter));
    }
    params.push_back("max-keys=" + std::to_string(request.max_keys));
    if (!request.continuation_token.empty()) {
        params.push_back("continuation-token=" + net::url_encode(request.continuation_token));
    } else if (!request.start_after.empty()) {
        params.push_back("start-after=" + net::url_encode(request.start_after));
    }

    std::string query;
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) query += "&";
        query += params[i];
    }
    return query;
}

std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& value) {
    if (value.empty()) return std::nullopt;

    std::tm tm = {};
    int year = 0, month = 0, day = 0, hour = 0, min = 0, sec = 0;
    int millis = 0;

    if (sscanf(value.c_str(), "%d-%d-%dT%d:%d:%d.%dZ",
               &year, &month, &day, &hour, &min, &sec, &millis) >= 6) {
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = min;
        tm.tm_sec = sec;
    } else if (strptime(value.c_str(), "%a, %d %b %Y %H:%M:%S", &tm) == nullptr) {
        return std::nullopt;
    }
    tm.tm_isdst = 0;

    time_t tt = timegm(&tm);
    if (tt == -1) return std::nullopt;

    auto tp = std::chrono::system_clock::from_time_t(tt);
    if (millis > 0) {
        tp += std::chrono::milliseconds(millis);
    }
    return tp;
}

ListPage parse_list_objects_xml(const std::string& body) {
    ListPage page;
    page.success = true;

    page.truncated = xml::get_element(body, "IsTruncated") == "true";
    page.next_continuation_token = xml::decode_entities(xml::get_element(body, "NextContinuationToken"));

    for (const auto& content : xml::find_elements(body, "Contents")) {
        ObjectInfo info;
        info.key = xml::decode_entities(xml::get_element(content, "Key"));

        std::string size_str = xml::get_element(content, "Size");
        if (!size_str.empty()) {
            try {
                info.size = std::stoull(size_str);
            } catch (const std::exception&) {
                page.success = false;
                page.error_message = "invalid Size '" + size_str + "' for key " + info.key;
                return page;
            }
        }

        info.last_modified = parse_timestamp(xml::get_element(content, "LastModified"));
        info.etag = xml::decode_entities(xml::get_element(content, "ETag"));
        page.objects.push_back(std::move(info));
    }

    for (const auto& content : xml::find_elements(body, "CommonPrefixes")) {
        std::string prefix = xml::decode_entities(xml::get_element(content, "Prefix"));
        if (!prefix.empty()) {
            page.common_prefixes.push_back(std::move(prefix));
        }
    }

    return page;
}

ExistsStatus classify_head_status(int status_code) {
    if (net::is_success_status(status_code)) return ExistsStatus::Exists;
    if (status_code == 404) return ExistsStatus::NotFound;
    if (status_code == 401 || status_code == 403) return ExistsStatus::PermissionDenied;
    return ExistsStatus::TransportError;
}

}  // namespace s3

// ============================================================================
// S3ObjectStore
// ============================================================================

namespace {

// Ensure ETag has surrounding quotes (required for CompleteMultipartUpload)
std::string ensure_etag_quotes(const std::string& etag) {
    if (etag.empty()) return etag;
    std::string result = etag;
    if (result.front() != '"') result = "\"" + result;
    if (result.back() != '"') result += "\"";
    return result;
}

// "HTTP 403 AccessDenied: Access Denied" from an S3 error response
std::string describe_failure(const net::HttpResponse& response) {
    std::string text = response.describe();
    if (response.error.empty() && !response.body.empty()) {
        std::string body = response.body_string();
        std::string code = xml::get_element(body, "Code");
        std::string message = xml::decode_entities(xml::get_element(body, "Message"));
        if (!code.empty()) text += " " + code;
        if (!message.empty()) text += ": " + message;
    }
    return text;
}

// Tracks bytes already reported for one request so a retried attempt
// only reports bytes beyond the previous high-water mark
class ProgressHighWater {
public:
    ProgressHighWater(const ByteCallback& on_bytes, std::mutex& mutex)
        : on_bytes_(on_bytes), mutex_(mutex) {}

    void update(uint64_t attempt_bytes) {
        if (!on_bytes_ || attempt_bytes <= reported_) return;
        uint64_t delta = attempt_bytes - reported_;
        reported_ = attempt_bytes;
        std::lock_guard<std::mutex> lock(mutex_);
        on_bytes_(delta);
    }

private:
    const ByteCallback& on_bytes_;
    std::mutex& mutex_;
    uint64_t reported_ = 0;
};

bool read_file_range(const std::filesystem::path& path, uint64_t offset, uint64_t size,
                     std::vector<uint8_t>& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return false;
    file.seekg(static_cast<std::streamoff>(offset));
    out.resize(size);
    file.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size));
    return static_cast<uint64_t>(file.gcount()) == size;
}

}  // namespace

class S3ObjectStore : public ObjectStore {
public:
    explicit S3ObjectStore(const S3StoreConfig& config)
        : config_(config)
        , signer_(config.access_key, config.secret_key, config.region, "s3") {
        net::HttpClientConfig http_config;
        http_config.verify_ssl_by_default = config_.verify_ssl;
        http_config.default_connect_timeout = std::chrono::milliseconds(
            static_cast<int64_t>(config_.connect_timeout_secs) * 1000);
        http_config.default_read_timeout = std::chrono::milliseconds(
            static_cast<int64_t>(config_.read_timeout_secs) * 1000);
        http_config.max_idle_handles = std::max<size_t>(16, constants::DEFAULT_UPLOAD_CONCURRENCY * 2);
        http_config.verbose = log_verbose();
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "s3"; }

    std::string display_uri(const std::string& key) const override {
        return "s3://" + config_.bucket + "/" + key;
    }

    ListPage list_page(const ListRequest& list_request) const override {
        std::string url = build_url("") + "?" + s3::build_list_query(list_request);

        net::HttpRequest request = net::HttpRequest::get(url);
        auto response = send(request);

        if (!response.ok()) {
            ListPage page;
            page.error_message = "list " + display_uri(list_request.prefix) + " failed: " +
                                 describe_failure(response);
            return page;
        }

        ListPage page = s3::parse_list_objects_xml(response.body_string());
        if (!page.success) {
            page.error_message = "list " + display_uri(list_request.prefix) + ": " + page.error_message;
        }
        return page;
    }

    HeadResult head(const std::string& key) const override {
        HeadResult result;

        net::HttpRequest request = net::HttpRequest::head(build_url(key));
        auto response = send(request);

        if (!response.error.empty()) {
            result.status = ExistsStatus::TransportError;
            result.error_message = "head " + display_uri(key) + " failed: " + response.error;
            return result;
        }

        result.status = s3::classify_head_status(response.status_code);
        if (result.status == ExistsStatus::Exists) {
            result.size = response.headers.content_length();
            if (auto lm = response.headers.get("Last-Modified")) {
                result.last_modified = s3::parse_timestamp(*lm);
            }
        } else {
            result.error_message = "head " + display_uri(key) + ": " +
                                   exists_status_to_string(result.status) +
                                   " (HTTP " + std::to_string(response.status_code) + ")";
        }
        return result;
    }

    OpResult put_file(const std::string& key,
                      const std::filesystem::path& path,
                      const TransferPlan& plan,
                      const ByteCallback& on_bytes,
                      const CancelFlag& cancel) override {
        std::error_code ec;
        uint64_t size = std::filesystem::file_size(path, ec);
        if (ec) {
            return OpResult::failure("cannot read " + path.string() + ": " + ec.message());
        }

        if (size >= plan.multipart_threshold() && size > 0) {
            return put_multipart_file(key, path, size, plan, on_bytes, cancel);
        }

        std::vector<uint8_t> data;
        if (!read_file_range(path, 0, size, data)) {
            return OpResult::failure("failed to read " + path.string());
        }

        net::HttpRequest request = net::HttpRequest::put(build_url(key), std::move(data));
        request.headers.set_content_type("application/octet-stream");
        request.cancel = cancel;

        std::mutex progress_mutex;
        ProgressHighWater progress(on_bytes, progress_mutex);
        request.progress_callback = [&progress](const net::HttpProgress& p) {
            progress.update(p.upload_now);
            return true;
        };

        auto response = send(request);
        if (response.cancelled) {
            return OpResult::cancelled_result();
        }
        if (!response.ok()) {
            return OpResult::failure("upload " + path.string() + " to " + display_uri(key) +
                                     " failed: " + describe_failure(response));
        }
        progress.update(size);
        return OpResult::ok();
    }

    OpResult get_file(const std::string& key,
                      const std::filesystem::path& path,
                      const ByteCallback& on_bytes,
                      const CancelFlag& cancel) override {
        // Stream into a sibling temp file and move it into place on success
        std::filesystem::path temp_path = path;
        temp_path += ".s3pane-part";

        std::ofstream out;
        auto open_output = [&]() {
            if (out.is_open()) out.close();
            out.open(temp_path, std::ios::binary | std::ios::trunc);
            return out.is_open();
        };
        if (!open_output()) {
            return OpResult::failure("cannot write " + temp_path.string());
        }

        std::mutex progress_mutex;
        ProgressHighWater progress(on_bytes, progress_mutex);
        uint64_t attempt_bytes = 0;

        net::HttpRequest request = net::HttpRequest::get(build_url(key));
        request.cancel = cancel;
        request.response_sink = [&](const uint8_t* bytes, size_t n) {
            out.write(reinterpret_cast<const char*>(bytes), static_cast<std::streamsize>(n));
            if (!out) return false;
            attempt_bytes += n;
            progress.update(attempt_bytes);
            return true;
        };
        bool reopen_failed = false;
        request.on_retry = [&](int, const net::HttpResponse&) {
            attempt_bytes = 0;
            if (!open_output()) reopen_failed = true;
        };

        auto response = send(request);
        out.close();

        std::error_code ec;
        if (response.cancelled) {
            std::filesystem::remove(temp_path, ec);
            return OpResult::cancelled_result();
        }
        if (reopen_failed || !response.ok()) {
            std::filesystem::remove(temp_path, ec);
            std::string why = reopen_failed ? "cannot reopen " + temp_path.string()
                                            : describe_failure(response);
            return OpResult::failure("download " + display_uri(key) + " to " + path.string() +
                                     " failed: " + why);
        }

        std::filesystem::rename(temp_path, path, ec);
        if (ec) {
            std::error_code ignore;
            std::filesystem::remove(temp_path, ignore);
            return OpResult::failure("cannot move download into " + path.string() + ": " + ec.message());
        }
        return OpResult::ok();
    }

    OpResult remove(const std::string& key) override {
        net::HttpRequest request = net::HttpRequest::del(build_url(key));
        auto response = send(request);

        // S3 answers 204 for missing keys too; some providers answer 404
        if (response.ok() || response.status_code == 404) {
            return OpResult::ok();
        }
        return OpResult::failure("delete " + display_uri(key) + " failed: " + describe_failure(response));
    }

    OpResult copy(const std::string& source, const std::string& destination) override {
        net::HttpRequest request = net::HttpRequest::put(build_url(destination), std::vector<uint8_t>{});
        request.headers.set("x-amz-copy-source",
                            "/" + config_.bucket + "/" + net::url_encode(source, true));

        auto response = send(request);

        // CopyObject can fail after sending 200; the error is then in the body
        bool body_error = response.ok() &&
                          response.body_string().find("<Error>") != std::string::npos;
        if (!response.ok() || body_error) {
            return OpResult::failure("copy " + display_uri(source) + " to " + display_uri(destination) +
                                     " failed: " + describe_failure(response));
        }
        return OpResult::ok();
    }

    OpResult create_folder_marker(const std::string& key) override {
        std::string marker = key;
        if (marker.empty() || marker.back() != '/') {
            marker += '/';
        }

        net::HttpRequest request = net::HttpRequest::put(build_url(marker), std::vector<uint8_t>{});
        auto response = send(request);
        if (!response.ok()) {
            return OpResult::failure("create folder " + display_uri(marker) + " failed: " +
                                     describe_failure(response));
        }
        return OpResult::ok();
    }

private:
    S3StoreConfig config_;
    net::AwsSigV4Signer signer_;
    std::unique_ptr<net::HttpClient> http_client_;

    // Sign and execute with the configured retry policy. The request is
    // re-signed for every attempt so X-Amz-Date stays fresh.
    net::HttpResponse send(net::HttpRequest& request) const {
        request.max_attempts = static_cast<int>(std::max<uint32_t>(1, config_.max_attempts));
        request.initial_retry_delay = std::chrono::milliseconds(config_.retry_base_delay_ms);
        request.max_retry_delay = std::chrono::milliseconds(constants::MAX_RETRY_DELAY_MS);

        auto caller_on_retry = request.on_retry;
        request.on_retry = [&request, caller_on_retry](int attempt, const net::HttpResponse& failed) {
            log_warn("%s %s: attempt %d/%d failed (%s), retrying",
                     net::http_method_to_string(request.method), request.url.c_str(),
                     attempt, request.max_attempts, failed.describe().c_str());
            if (caller_on_retry) {
                caller_on_retry(attempt, failed);
            }
        };

        return http_client_->execute_with_retry(request, [this](net::HttpRequest& r) {
            signer_.sign(r);
        });
    }

    std::string build_url(const std::string& key) const {
        std::string url;
        if (!config_.endpoint.empty()) {
            url = config_.endpoint;
            while (!url.empty() && url.back() == '/') url.pop_back();
            if (config_.use_path_style && !config_.bucket.empty()) {
                url += "/" + config_.bucket;
            }
        } else {
            if (config_.use_path_style) {
                url = "https://s3." + config_.region + ".amazonaws.com/" + config_.bucket;
            } else {
                url = "https://" + config_.bucket + ".s3." + config_.region + ".amazonaws.com";
            }
        }
        if (!key.empty()) {
            url += "/" + net::url_encode(key, true);
        } else {
            url += "/";
        }
        return url;
    }

    // ========================================================================
    // Multipart upload
    // ========================================================================

    OpResult put_multipart_file(const std::string& key,
                                const std::filesystem::path& path,
                                uint64_t file_size,
                                const TransferPlan& plan,
                                const ByteCallback& on_bytes,
                                const CancelFlag& cancel) {
        std::string error;
        std::string upload_id = initiate_multipart_upload(key, error);
        if (upload_id.empty()) {
            return OpResult::failure("initiate multipart upload for " + display_uri(key) +
                                     " failed: " + error);
        }

        struct PartRange { int number = 0; uint64_t offset = 0; uint64_t size = 0; };
        std::vector<PartRange> parts;
        uint64_t off = 0;
        int pn = 1;
        while (off < file_size) {
            uint64_t chunk_size = std::min(plan.part_size_bytes, file_size - off);
            parts.push_back({pn++, off, chunk_size});
            off += chunk_size;
        }

        std::vector<std::string> part_etags(parts.size());
        std::atomic<size_t> next_part{0};
        std::atomic<bool> any_failed{false};
        std::mutex error_mutex;
        std::string first_error;
        bool was_cancelled = false;
        std::mutex progress_mutex;

        auto worker = [&]() {
            while (!any_failed.load()) {
                size_t index = next_part.fetch_add(1);
                if (index >= parts.size()) return;
                const auto& part = parts[index];

                std::vector<uint8_t> chunk;
                if (!read_file_range(path, part.offset, part.size, chunk)) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (first_error.empty()) {
                        first_error = "failed to read part " + std::to_string(part.number) +
                                      " of " + path.string();
                    }
                    any_failed = true;
                    return;
                }

                ProgressHighWater progress(on_bytes, progress_mutex);
                auto response = upload_part(key, upload_id, part.number, std::move(chunk),
                                            progress, cancel);
                if (!response.ok() || response.headers.get("ETag").value_or("").empty()) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (response.cancelled) {
                        was_cancelled = true;
                    } else if (first_error.empty()) {
                        first_error = "part " + std::to_string(part.number) + ": " +
                                      (response.ok() ? "missing ETag" : describe_failure(response));
                    }
                    any_failed = true;
                    return;
                }
                progress.update(part.size);
                part_etags[index] = ensure_etag_quotes(*response.headers.get("ETag"));
            }
        };

        size_t workers = plan.use_threads ? std::max<size_t>(1, plan.concurrency) : 1;
        workers = std::min(workers, parts.size());
        if (workers <= 1) {
            worker();
        } else {
            std::vector<std::future<void>> futures;
            for (size_t i = 0; i < workers; ++i) {
                futures.push_back(std::async(std::launch::async, worker));
            }
            for (auto& fut : futures) {
                fut.get();
            }
        }

        if (any_failed || is_cancelled(cancel)) {
            abort_multipart_upload(key, upload_id);
            if (was_cancelled || is_cancelled(cancel)) {
                return OpResult::cancelled_result();
            }
            return OpResult::failure("upload " + path.string() + " to " + display_uri(key) +
                                     " failed: " + first_error);
        }

        std::vector<std::pair<int, std::string>> completed;
        completed.reserve(parts.size());
        for (size_t i = 0; i < parts.size(); ++i) {
            completed.emplace_back(parts[i].number, part_etags[i]);
        }

        if (!complete_multipart_upload(key, upload_id, completed, error)) {
            abort_multipart_upload(key, upload_id);
            return OpResult::failure("complete multipart upload for " + display_uri(key) +
                                     " failed: " + error);
        }
        return OpResult::ok();
    }

    std::string initiate_multipart_upload(const std::string& key, std::string& error) {
        std::string url = build_url(key) + "?uploads";

        net::HttpRequest request = net::HttpRequest::post(url, "");
        request.headers.set_content_type("application/octet-stream");

        auto response = send(request);
        if (!response.ok()) {
            error = describe_failure(response);
            return "";
        }

        std::string upload_id = xml::get_element(response.body_string(), "UploadId");
        if (upload_id.empty()) {
            error = "response carried no UploadId";
        }
        return upload_id;
    }

    net::HttpResponse upload_part(const std::string& key, const std::string& upload_id,
                                  int part_number, std::vector<uint8_t> data,
                                  ProgressHighWater& progress, const CancelFlag& cancel) {
        std::string url = build_url(key) +
            "?partNumber=" + std::to_string(part_number) +
            "&uploadId=" + net::url_encode(upload_id);

        net::HttpRequest request = net::HttpRequest::put(url, std::move(data));
        request.cancel = cancel;
        request.progress_callback = [&progress](const net::HttpProgress& p) {
            progress.update(p.upload_now);
            return true;
        };

        return send(request);
    }

    bool complete_multipart_upload(const std::string& key, const std::string& upload_id,
                                   const std::vector<std::pair<int, std::string>>& part_etags,
                                   std::string& error) {
        std::string url = build_url(key) + "?uploadId=" + net::url_encode(upload_id);

        std::ostringstream doc;
        doc << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        doc << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
        for (const auto& [part_num, etag] : part_etags) {
            doc << "  <Part>\n";
            doc << "    <PartNumber>" << part_num << "</PartNumber>\n";
            doc << "    <ETag>" << xml::escape(etag) << "</ETag>\n";
            doc << "  </Part>\n";
        }
        doc << "</CompleteMultipartUpload>";

        net::HttpRequest request = net::HttpRequest::post(url, doc.str());
        request.headers.set_content_type("application/xml");

        auto response = send(request);
        if (!response.ok()) {
            error = describe_failure(response);
            return false;
        }

        // Completion may fail after a 200 status; the error is in the body
        std::string body = response.body_string();
        if (body.find("<Error>") != std::string::npos) {
            error = xml::get_element(body, "Code") + ": " +
                    xml::decode_entities(xml::get_element(body, "Message"));
            return false;
        }
        return true;
    }

    void abort_multipart_upload(const std::string& key, const std::string& upload_id) {
        std::string url = build_url(key) + "?uploadId=" + net::url_encode(upload_id);

        net::HttpRequest request = net::HttpRequest::del(url);
        auto response = send(request);
        if (!response.ok()) {
            log_warn("abort multipart upload %s for %s failed: %s", upload_id.c_str(),
                     display_uri(key).c_str(), describe_failure(response).c_str());
        }
    }
};

// ============================================================================
// ObjectStoreFactory
// ============================================================================

std::unique_ptr<ObjectStore> ObjectStoreFactory::create_s3(const S3StoreConfig& config) {
    return std::make_unique<S3ObjectStore>(config);
}

}  // namespace s3pane
