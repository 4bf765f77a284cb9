#pragma once

#include "s3pane/core/cancel.hpp"
#include "s3pane/core/constants.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace s3pane {

// Object as returned by a listing page
struct ObjectInfo {
    std::string key;
    uint64_t size = 0;
    std::optional<std::chrono::system_clock::time_point> last_modified;
    std::string etag;
};

// One ListObjectsV2 call. continuation_token wins over start_after when both are set.
struct ListRequest {
    std::string prefix;
    std::string delimiter;  // Empty = flat listing
    std::string continuation_token;
    std::string start_after;
    uint32_t max_keys = constants::DEFAULT_LIST_MAX_KEYS;
};

// One raw page of a listing
struct ListPage {
    bool success = false;
    std::string error_message;
    std::vector<ObjectInfo> objects;
    std::vector<std::string> common_prefixes;
    std::string next_continuation_token;
    bool truncated = false;
};

enum class ExistsStatus {
    Exists,
    NotFound,
    PermissionDenied,
    TransportError
};

const char* exists_status_to_string(ExistsStatus status);

// Typed result of a HEAD request; callers decide how to treat ambiguity
struct HeadResult {
    ExistsStatus status = ExistsStatus::TransportError;
    std::optional<uint64_t> size;
    std::optional<std::chrono::system_clock::time_point> last_modified;
    std::string error_message;

    bool exists() const { return status == ExistsStatus::Exists; }
};

// Result of a mutating store or transfer operation.
// error_message always names the key or path involved.
struct OpResult {
    bool success = false;
    std::string error_message;
    bool cancelled = false;

    static OpResult ok() { return {true, "", false}; }
    static OpResult failure(std::string message) { return {false, std::move(message), false}; }
    static OpResult cancelled_result() { return {false, "cancelled", true}; }
};

// Receives non-negative byte deltas during a transfer
using ByteCallback = std::function<void(uint64_t)>;

// Multipart parameters for a single upload; computed per upload, never persisted
struct TransferPlan {
    uint64_t part_size_bytes = constants::MIN_AUTO_PART_SIZE_MB * constants::MiB;
    size_t concurrency = constants::DEFAULT_UPLOAD_CONCURRENCY;
    bool use_threads = true;

    // Files at or above this size go through multipart upload
    uint64_t multipart_threshold() const { return part_size_bytes; }
};

/// Flat key/value object store with delimiter-based listing.
///
/// Implementations retry transient transport failures (network errors,
/// HTTP 5xx and 429) internally with bounded exponential backoff. Semantic
/// errors (404, 403, ...) are returned immediately. None of the operations
/// throw.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Backend type name (for logging)
    virtual std::string type_name() const = 0;

    // Bucket or namespace shown in messages ("s3://bucket/key")
    virtual std::string display_uri(const std::string& key) const = 0;

    virtual ListPage list_page(const ListRequest& request) const = 0;

    virtual HeadResult head(const std::string& key) const = 0;

    /// Opt-in folding of head(): NotFound, PermissionDenied and
    /// TransportError are all reported as absent.
    bool exists(const std::string& key) const {
        return head(key).exists();
    }

    /// Upload a local file. Files below plan.multipart_threshold() use a
    /// single PUT; larger ones use multipart upload, with up to
    /// plan.concurrency parts in flight when plan.use_threads is set.
    /// A failed multipart upload is aborted server-side.
    virtual OpResult put_file(const std::string& key,
                              const std::filesystem::path& path,
                              const TransferPlan& plan,
                              const ByteCallback& on_bytes = {},
                              const CancelFlag& cancel = {}) = 0;

    // Stream an object into a local file, replacing it
    virtual OpResult get_file(const std::string& key,
                              const std::filesystem::path& path,
                              const ByteCallback& on_bytes = {},
                              const CancelFlag& cancel = {}) = 0;

    // Deleting a missing key succeeds
    virtual OpResult remove(const std::string& key) = 0;

    // Server-side copy
    virtual OpResult copy(const std::string& source, const std::string& destination) = 0;

    // Zero-byte object; a trailing '/' is appended when missing
    virtual OpResult create_folder_marker(const std::string& key) = 0;
};

// Connection settings for the S3 implementation
struct S3StoreConfig {
    std::string bucket;
    std::string region = "us-east-1";
    std::string endpoint;  // Empty for AWS, custom for MinIO/RunPod/etc
    std::string access_key;
    std::string secret_key;
    bool use_path_style = true;
    bool verify_ssl = true;
    uint32_t connect_timeout_secs = constants::DEFAULT_CONNECT_TIMEOUT_SECS;
    uint32_t read_timeout_secs = constants::DEFAULT_READ_TIMEOUT_SECS;
    uint32_t max_attempts = constants::DEFAULT_MAX_ATTEMPTS;
    uint32_t retry_base_delay_ms = constants::DEFAULT_RETRY_BASE_DELAY_MS;
};

class ObjectStoreFactory {
public:
    static std::unique_ptr<ObjectStore> create_s3(const S3StoreConfig& config);
};

namespace s3 {

// Query string for a ListObjectsV2 request (values URL-encoded)
std::string build_list_query(const ListRequest& request);

// Parse a ListBucketResult document
ListPage parse_list_objects_xml(const std::string& body);

// "2023-12-15T14:30:00.000Z" or an RFC 1123 date ("Fri, 15 Dec 2023 14:30:00 GMT")
std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& value);

// Map a HEAD status code to its existence status
ExistsStatus classify_head_status(int status_code);

}  // namespace s3

}  // namespace s3pane
