#pragma once

#include "s3pane/core/cancel.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace s3pane::net {

// HTTP methods
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);
bool is_server_error_status(int status);
bool is_retryable_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);
    std::optional<std::string> get(const std::string& name) const;

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    std::optional<size_t> content_length() const;

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

// Cumulative transfer counters for the current attempt
struct HttpProgress {
    size_t download_total = 0;
    size_t download_now = 0;
    size_t upload_total = 0;
    size_t upload_now = 0;
};

using HttpProgressCallback = std::function<bool(const HttpProgress&)>;  // Return false to cancel

// Receives response body bytes as they arrive. Return false to abort.
using HttpBodySink = std::function<bool(const uint8_t* data, size_t size)>;

struct HttpResponse;

// HTTP request
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Timeouts
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds total_timeout{0};  // 0 = no overall limit
    // Abort when throughput stays under 1 byte/s for this long (read timeout)
    std::chrono::milliseconds low_speed_timeout{0};

    HttpProgressCallback progress_callback;

    // Stream the response body here instead of buffering it
    HttpBodySink response_sink;

    CancelFlag cancel;

    // Retry options (execute_with_retry)
    int max_attempts = 1;
    std::chrono::milliseconds initial_retry_delay{100};
    double retry_backoff_multiplier = 2.0;
    std::chrono::milliseconds max_retry_delay{20000};

    // Called before each retry with the attempt number just failed (1-based)
    std::function<void(int, const HttpResponse&)> on_retry;

    static HttpRequest get(const std::string& url);
    static HttpRequest head(const std::string& url);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put(const std::string& url, std::vector<uint8_t> body);
    static HttpRequest del(const std::string& url);
};

// HTTP response
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    int attempts = 0;

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
    bool cancelled = false;

    // "HTTP 404" / curl error text
    std::string describe() const;
};

struct HttpClientConfig {
    size_t max_idle_handles = 16;

    std::chrono::milliseconds default_connect_timeout{30000};
    std::chrono::milliseconds default_read_timeout{7200000};

    // Buffered response size limit (0 = unlimited). Not applied to streamed bodies.
    size_t max_response_size = 64 * 1024 * 1024;

    bool verify_ssl_by_default = true;

    std::string user_agent = "s3pane/1.0";

    // Verbose curl logging (for debugging)
    bool verbose = false;
};

// HTTP client backed by a pool of reusable curl easy handles
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Single attempt
    HttpResponse execute(const HttpRequest& request);

    // Retries network errors and retryable statuses up to request.max_attempts.
    // before_attempt runs ahead of every attempt (e.g. to re-sign the request).
    HttpResponse execute_with_retry(HttpRequest& request,
                                    const std::function<void(HttpRequest&)>& before_attempt = {});

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// AWS SigV4 signing helper (used for S3)
class AwsSigV4Signer {
public:
    AwsSigV4Signer(const std::string& access_key_id,
                   const std::string& secret_access_key,
                   const std::string& region,
                   const std::string& service);

    void sign(HttpRequest& request) const;

    // Sign at a fixed time (yyyymmddThhmmssZ); used by sign() and tests
    void sign_at(HttpRequest& request, const std::string& datetime) const;

private:
    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;

    std::string get_canonical_request(const HttpRequest& request,
                                      const std::string& signed_headers,
                                      const std::string& payload_hash) const;
    std::string get_string_to_sign(const std::string& datetime,
                                   const std::string& date,
                                   const std::string& canonical_request) const;
    std::string calculate_signature(const std::string& date,
                                    const std::string& string_to_sign) const;
};

// URL parsing helper
struct ParsedUrl {
    std::string scheme;   // http, https
    std::string host;
    int port = 0;         // 0 = default for scheme
    std::string path;
    std::string query;

    // host[:port] as sent in the Host header
    std::string host_header() const;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

// RFC 3986 encoding; keep_slash leaves '/' intact (object key paths)
std::string url_encode(const std::string& str, bool keep_slash = false);

std::string sha256_hex(const uint8_t* data, size_t size);

}  // namespace s3pane::net
