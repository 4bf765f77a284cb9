#include "s3pane/net/http.hpp"
#include "s3pane/core/log.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

namespace s3pane::net {

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_server_error_status(int status) {
    return status >= 500 && status < 600;
}

bool is_retryable_status(int status) {
    // Server errors and rate limiting; other 4xx are semantic and final
    return status == 429 || is_server_error_status(status);
}

std::string url_encode(const std::string& str, bool keep_slash) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (keep_slash && c == '/')) {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

static std::string to_hex(const unsigned char* data, size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string sha256_hex(const uint8_t* data, size_t size) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data, size, hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(normalize_name(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

std::optional<size_t> HttpHeaders::content_length() const {
    auto val = get("Content-Length");
    if (val) {
        try {
            return std::stoull(*val);
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
    }
    return std::nullopt;
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::head(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::HEAD;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = url;
    req.body.assign(body.begin(), body.end());
    return req;
}

HttpRequest HttpRequest::put(const std::string& url, std::vector<uint8_t> body) {
    HttpRequest req;
    req.method = HttpMethod::PUT;
    req.url = url;
    req.body = std::move(body);
    return req;
}

HttpRequest HttpRequest::del(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::DELETE;
    req.url = url;
    return req;
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

std::string HttpResponse::describe() const {
    if (cancelled) return "cancelled";
    if (!error.empty()) return error;
    return "HTTP " + std::to_string(status_code);
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    size_t sep = url.find("://");
    if (sep == std::string::npos || sep == 0) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, sep);

    std::string rest = url.substr(sep + 3);
    size_t fragment = rest.find('#');
    if (fragment != std::string::npos) {
        rest.resize(fragment);
    }
    size_t question = rest.find('?');
    if (question != std::string::npos) {
        result.query = rest.substr(question + 1);
        rest.resize(question);
    }
    size_t slash = rest.find('/');
    if (slash != std::string::npos) {
        result.path = rest.substr(slash);
        rest.resize(slash);
    }
    if (rest.empty()) {
        return std::nullopt;
    }

    // rest is the authority: host, [v6-host], either with an optional :port
    std::string port_text;
    if (rest.front() == '[') {
        size_t close = rest.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        result.host = rest.substr(1, close - 1);
        if (close + 1 < rest.size()) {
            if (rest[close + 1] != ':') return std::nullopt;
            port_text = rest.substr(close + 2);
        }
    } else {
        size_t colon = rest.rfind(':');
        result.host = rest.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = rest.substr(colon + 1);
        }
    }

    if (!port_text.empty()) {
        auto [end, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), result.port);
        if (ec != std::errc() || end != port_text.data() + port_text.size()) {
            return std::nullopt;
        }
    }
    return result;
}

std::string ParsedUrl::host_header() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    bool default_port = port == 0 ||
                        (scheme == "https" && port == 443) ||
                        (scheme == "http" && port == 80);
    if (!default_port) {
        h += ":" + std::to_string(port);
    }
    return h;
}

// ============================================================================
// CURL callback functions
// ============================================================================

namespace {

struct WriteContext {
    CURL* curl = nullptr;
    std::vector<uint8_t>* buffer = nullptr;
    const HttpBodySink* sink = nullptr;
    size_t max_size = 0;
    bool size_exceeded = false;
    bool sink_failed = false;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    size_t bytes = size * nmemb;

    // Error bodies are always buffered so they never reach the sink
    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    if (ctx->sink && *ctx->sink && is_success_status(static_cast<int>(status))) {
        if (!(*ctx->sink)(reinterpret_cast<const uint8_t*>(ptr), bytes)) {
            ctx->sink_failed = true;
            return 0;
        }
        return bytes;
    }

    if (ctx->max_size > 0 && ctx->buffer->size() + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;
    }

    ctx->buffer->insert(ctx->buffer->end(), ptr, ptr + bytes);
    return bytes;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A new status line starts a new header block (redirects, 100-continue)
    if (line.starts_with("HTTP/")) {
        *headers = HttpHeaders{};
        return bytes;
    }
    if (line.empty()) {
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        size_t start = value.find_first_not_of(" \t");
        value = start == std::string::npos ? "" : value.substr(start);
        headers->add(name, value);
    }

    return bytes;
}

struct ReadContext {
    const uint8_t* data = nullptr;
    size_t size = 0;
    size_t pos = 0;
};

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* rd = static_cast<ReadContext*>(userdata);
    size_t max_bytes = size * nitems;
    size_t to_copy = std::min(max_bytes, rd->size - rd->pos);

    if (to_copy > 0) {
        std::memcpy(buffer, rd->data + rd->pos, to_copy);
        rd->pos += to_copy;
    }

    return to_copy;
}

struct ProgressContext {
    const HttpProgressCallback* callback = nullptr;
    const CancelFlag* cancel = nullptr;
};

int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                      curl_off_t ultotal, curl_off_t ulnow) {
    auto* ctx = static_cast<ProgressContext*>(clientp);
    if (is_cancelled(*ctx->cancel)) {
        return 1;
    }
    if (*ctx->callback) {
        HttpProgress progress;
        progress.download_total = static_cast<size_t>(dltotal);
        progress.download_now = static_cast<size_t>(dlnow);
        progress.upload_total = static_cast<size_t>(ultotal);
        progress.upload_now = static_cast<size_t>(ulnow);
        if (!(*ctx->callback)(progress)) {
            return 1;
        }
    }
    return 0;
}

}  // namespace

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        if (is_cancelled(request.cancel)) {
            response.cancelled = true;
            response.error = "cancelled";
            return response;
        }

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "Failed to create curl handle";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
        }

        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        // Large PUTs must not wait for 100-continue
        headers_list = curl_slist_append(headers_list, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        ReadContext read_data{request.body.data(), request.body.size(), 0};
        if (request.method == HttpMethod::PUT) {
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &read_data);
            // Empty-body PUT still sends Content-Length: 0 (MinIO rejects 411 otherwise)
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        } else if (request.method == HttpMethod::POST) {
            // A null POSTFIELDS makes curl fall back to reading stdin
            static const char empty_body[] = "";
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS,
                             request.body.empty() ? empty_body
                                                  : reinterpret_cast<const char*>(request.body.data()));
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        }

        std::vector<uint8_t> response_body;
        WriteContext write_ctx;
        write_ctx.curl = curl;
        write_ctx.buffer = &response_body;
        write_ctx.sink = &request.response_sink;
        write_ctx.max_size = config_.max_response_size;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        ProgressContext progress_ctx{&request.progress_callback, &request.cancel};
        if (request.progress_callback || request.cancel) {
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &progress_ctx);
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        }

        auto connect_timeout = request.connect_timeout.count() > 0
            ? request.connect_timeout : config_.default_connect_timeout;
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(connect_timeout.count()));
        if (request.total_timeout.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                             static_cast<long>(request.total_timeout.count()));
        }
        auto read_timeout = request.low_speed_timeout.count() > 0
            ? request.low_speed_timeout : config_.default_read_timeout;
        if (read_timeout.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                             std::max(1L, static_cast<long>(read_timeout.count() / 1000)));
        }

        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

        bool verify = config_.verify_ssl_by_default;
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);

        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        CURLcode res = curl_easy_perform(curl);

        if (res == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
            response.body = std::move(response_body);
        } else if (res == CURLE_WRITE_ERROR && write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.status_code = 413;
        } else if (res == CURLE_WRITE_ERROR && write_ctx.sink_failed) {
            response.error = "Failed to write response body";
        } else if (res == CURLE_ABORTED_BY_CALLBACK && is_cancelled(request.cancel)) {
            response.cancelled = true;
            response.error = "cancelled";
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }

        curl_slist_free_all(headers_list);
        release_handle(curl);

        return response;
    }

    HttpResponse execute_with_retry(HttpRequest& request,
                                    const std::function<void(HttpRequest&)>& before_attempt) {
        int attempt = 0;
        int max_attempts = std::max(1, request.max_attempts);
        auto delay = request.initial_retry_delay;

        while (true) {
            ++attempt;
            if (before_attempt) {
                before_attempt(request);
            }
            HttpResponse response = execute(request);
            response.attempts = attempt;

            bool transient = response.is_network_error ||
                             (response.error.empty() && is_retryable_status(response.status_code));
            if (response.cancelled || !transient || attempt >= max_attempts) {
                return response;
            }

            log_debug("Retrying %s %s after attempt %d: %s",
                      http_method_to_string(request.method), request.url.c_str(),
                      attempt, response.describe().c_str());
            if (request.on_retry) {
                request.on_retry(attempt, response);
            }

            // Sleep in slices so cancellation stays responsive
            auto deadline = std::chrono::steady_clock::now() + delay;
            while (std::chrono::steady_clock::now() < deadline) {
                if (is_cancelled(request.cancel)) {
                    response.cancelled = true;
                    response.error = "cancelled";
                    return response;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }

            delay = std::min(request.max_retry_delay,
                             std::chrono::milliseconds(static_cast<long>(
                                 delay.count() * request.retry_backoff_multiplier)));
        }
    }

    const HttpClientConfig& config() const { return config_; }

private:
    CURL* acquire_handle() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (!idle_handles_.empty()) {
                CURL* handle = idle_handles_.back();
                idle_handles_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    void release_handle(CURL* handle) {
        curl_easy_reset(handle);
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (idle_handles_.size() < config_.max_idle_handles) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;
    std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
};

// ============================================================================
// HttpClient public interface
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

HttpResponse HttpClient::execute_with_retry(HttpRequest& request,
                                            const std::function<void(HttpRequest&)>& before_attempt) {
    return impl_->execute_with_retry(request, before_attempt);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

// ============================================================================
// AwsSigV4Signer
// ============================================================================

AwsSigV4Signer::AwsSigV4Signer(const std::string& access_key_id,
                               const std::string& secret_access_key,
                               const std::string& region,
                               const std::string& service)
    : access_key_id_(access_key_id)
    , secret_access_key_(secret_access_key)
    , region_(region)
    , service_(service) {}

static std::string sha256_hex(const std::string& data) {
    return sha256_hex(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

static std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key,
                                        const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.c_str()), data.size(),
         hash, &hash_len);

    return std::vector<uint8_t>(hash, hash + hash_len);
}

static std::vector<uint8_t> hmac_sha256(const std::string& key, const std::string& data) {
    return hmac_sha256(std::vector<uint8_t>(key.begin(), key.end()), data);
}

static std::string get_current_datetime() {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm;
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

// Query params are already URL-encoded in the URL; sort them and make sure
// valueless params (e.g. "uploads") render as "key="
static std::string build_canonical_query_string(const std::string& query) {
    if (query.empty()) {
        return "";
    }

    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string param = query.substr(pos, amp - pos);
        size_t eq = param.find('=');
        if (eq != std::string::npos) {
            params[param.substr(0, eq)] = param.substr(eq + 1);
        } else if (!param.empty()) {
            params[param] = "";
        }
        pos = amp + 1;
    }

    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

std::string AwsSigV4Signer::get_canonical_request(const HttpRequest& request,
                                                  const std::string& signed_headers,
                                                  const std::string& payload_hash) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return "";

    std::ostringstream oss;
    oss << http_method_to_string(request.method) << "\n";
    oss << (url->path.empty() ? "/" : url->path) << "\n";
    oss << build_canonical_query_string(url->query) << "\n";

    // HttpHeaders keys are already lowercase and sorted
    for (const auto& [name, value] : request.headers.all()) {
        oss << name << ":" << value << "\n";
    }
    oss << "\n";

    oss << signed_headers << "\n";
    oss << payload_hash;

    return oss.str();
}

std::string AwsSigV4Signer::get_string_to_sign(const std::string& datetime,
                                               const std::string& date,
                                               const std::string& canonical_request) const {
    std::ostringstream oss;
    oss << "AWS4-HMAC-SHA256\n";
    oss << datetime << "\n";
    oss << date << "/" << region_ << "/" << service_ << "/aws4_request\n";
    oss << sha256_hex(canonical_request);
    return oss.str();
}

std::string AwsSigV4Signer::calculate_signature(const std::string& date,
                                                const std::string& string_to_sign) const {
    auto k_date = hmac_sha256("AWS4" + secret_access_key_, date);
    auto k_region = hmac_sha256(k_date, region_);
    auto k_service = hmac_sha256(k_region, service_);
    auto k_signing = hmac_sha256(k_service, "aws4_request");

    auto signature = hmac_sha256(k_signing, string_to_sign);
    return to_hex(signature.data(), signature.size());
}

void AwsSigV4Signer::sign(HttpRequest& request) const {
    sign_at(request, get_current_datetime());
}

void AwsSigV4Signer::sign_at(HttpRequest& request, const std::string& datetime) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return;

    std::string date = datetime.substr(0, 8);

    request.headers.remove("Authorization");
    request.headers.set("Host", url->host_header());
    request.headers.set("X-Amz-Date", datetime);

    // Reuse a pre-set payload hash (e.g. UNSIGNED-PAYLOAD) or compute it
    std::string payload_hash;
    if (auto existing = request.headers.get("X-Amz-Content-Sha256"); existing && !existing->empty()) {
        payload_hash = *existing;
    } else {
        payload_hash = sha256_hex(request.body.data(), request.body.size());
        request.headers.set("X-Amz-Content-Sha256", payload_hash);
    }

    std::string signed_headers;
    for (const auto& [name, value] : request.headers.all()) {
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += name;
    }

    std::string canonical_request = get_canonical_request(request, signed_headers, payload_hash);
    std::string string_to_sign = get_string_to_sign(datetime, date, canonical_request);
    std::string signature = calculate_signature(date, string_to_sign);

    std::ostringstream auth;
    auth << "AWS4-HMAC-SHA256 ";
    auth << "Credential=" << access_key_id_ << "/" << date << "/" << region_ << "/"
         << service_ << "/aws4_request, ";
    auth << "SignedHeaders=" << signed_headers << ", ";
    auth << "Signature=" << signature;

    request.headers.set("Authorization", auth.str());
}

}  // namespace s3pane::net
