#pragma once

#include "s3pane/core/constants.hpp"
#include "s3pane/storage/object_store.hpp"
#include "s3pane/transfer/transfer_planner.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace s3pane {

// Reads one environment variable; nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Lookup backed by the process environment
EnvLookup process_env();

/// Configuration for one s3pane session.
///
/// Built once by from_args() and then passed around as a const value.
/// Layers, lowest precedence first: defaults, .env file, process
/// environment, JSON config file (--config), command-line flags.
struct Settings {
    // Connection (RUNPOD_* variables)
    std::string access_key;
    std::string secret_key;
    std::string bucket;
    std::string endpoint;
    std::string region = "us-east-1";
    bool use_path_style = true;
    bool verify_ssl = true;

    // Default local directory (LOCAL_ROOT)
    std::filesystem::path local_root;

    // Transport
    uint32_t connect_timeout_secs = constants::DEFAULT_CONNECT_TIMEOUT_SECS;
    uint32_t read_timeout_secs = constants::DEFAULT_READ_TIMEOUT_SECS;
    uint32_t max_attempts = constants::DEFAULT_MAX_ATTEMPTS;

    // Upload tuning
    uint64_t part_size_mb = 0;  // 0 = automatic
    size_t max_concurrency = constants::DEFAULT_UPLOAD_CONCURRENCY;
    bool upload_use_threads = true;
    bool upload_fallback_bump = false;

    // Front end
    std::string on_conflict = "ask";  // ask, replace, copy, skip
    bool assume_yes = false;
    bool verbose = false;
    std::filesystem::path log_file;
    std::filesystem::path env_file = ".env";
    std::filesystem::path config_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECS;

    // Command and its operands
    std::vector<std::string> command;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error or --help (prints to stderr).
    static std::optional<Settings> from_args(int argc, char* argv[],
                                             const EnvLookup& env = process_env());

    /// Apply RUNPOD_* / LOCAL_ROOT variables. Unparsable numbers and
    /// booleans keep their current value.
    void apply_env(const EnvLookup& env);

    /// KEY=VALUE lines; blank lines, comments and "export " are tolerated.
    /// A missing file yields an empty map.
    static std::map<std::string, std::string> read_env_file(const std::filesystem::path& path);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    S3StoreConfig store_config() const;
    TransferOverrides transfer_overrides() const;
};

// "0/false/no/off" and "1/true/yes/on", case-insensitive
std::optional<bool> parse_bool(const std::string& value);

}  // namespace s3pane
