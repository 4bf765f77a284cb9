#include "s3pane/app/settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace s3pane {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string strip_quotes(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

template <typename T>
std::optional<T> parse_unsigned(const std::string& value) {
    std::string v = trim(value);
    if (v.empty() || !std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return static_cast<T>(std::stoull(v));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

// Environment variable names recognized by apply_env()
constexpr const char* ENV_ACCESS_KEY = "RUNPOD_S3_ACCESS_KEY";
constexpr const char* ENV_SECRET_KEY = "RUNPOD_S3_SECRET_KEY";
constexpr const char* ENV_BUCKET = "RUNPOD_BUCKET";
constexpr const char* ENV_ENDPOINT = "RUNPOD_ENDPOINT";
constexpr const char* ENV_REGION = "RUNPOD_REGION";
constexpr const char* ENV_LOCAL_ROOT = "LOCAL_ROOT";
constexpr const char* ENV_READ_TIMEOUT = "RUNPOD_READ_TIMEOUT";
constexpr const char* ENV_CONNECT_TIMEOUT = "RUNPOD_CONNECT_TIMEOUT";
constexpr const char* ENV_PART_SIZE_MB = "RUNPOD_PART_SIZE_MB";
constexpr const char* ENV_MAX_CONCURRENCY = "RUNPOD_MAX_CONCURRENCY";
constexpr const char* ENV_USE_THREADS = "RUNPOD_UPLOAD_USE_THREADS";
constexpr const char* ENV_FALLBACK_BUMP = "RUNPOD_UPLOAD_FALLBACK_BUMP";

void print_usage() {
    std::cerr <<
        "Usage: s3pane [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  ls [prefix]                      List folders and files under prefix\n"
        "  tree [prefix]                    List every file key below prefix\n"
        "  stat <key>                       Show existence and size of a key\n"
        "  put <file>... <prefix>           Upload local files into prefix\n"
        "  get <key|dir/>... <local-dir>    Download files or folders\n"
        "  rm <key|dir/>...                 Delete files or folders (recursive)\n"
        "  mv <key> <new-name>              Rename a file within its folder\n"
        "  mkdir <prefix> <name>            Create a folder\n"
        "  rm-local <path>...               Delete local files or directories\n"
        "  browse [prefix]                  Interactive browser (cd, up, ls, quit)\n"
        "\n"
        "Connection (also RUNPOD_* environment / .env):\n"
        "  --endpoint <url>                 Endpoint URL (RUNPOD_ENDPOINT)\n"
        "  --bucket <name>                  Bucket name (RUNPOD_BUCKET)\n"
        "  --region <region>                Region (RUNPOD_REGION, default: us-east-1)\n"
        "  --access-key <key>               Access key (RUNPOD_S3_ACCESS_KEY)\n"
        "  --secret-key <key>               Secret key (RUNPOD_S3_SECRET_KEY)\n"
        "  --virtual-host-style             Use bucket.host addressing instead of path style\n"
        "  --no-verify-ssl                  Skip SSL verification\n"
        "  --connect-timeout <secs>         Connect timeout (default: 30)\n"
        "  --read-timeout <secs>            Read timeout (default: 7200)\n"
        "  --max-attempts <N>               Attempts per request (default: 10)\n"
        "\n"
        "Uploads:\n"
        "  --part-size-mb <N>               Fixed multipart part size (default: auto)\n"
        "  --max-concurrency <N>            Parallel part uploads (default: 4)\n"
        "  --no-threads                     Upload parts sequentially\n"
        "  --fallback-bump                  Double part size when retrying a failed upload\n"
        "\n"
        "General:\n"
        "  --config <path>                  JSON config file\n"
        "  --env-file <path>                .env file (default: ./.env)\n"
        "  --local-root <path>              Default local directory (LOCAL_ROOT)\n"
        "  --on-conflict <mode>             ask, replace, copy or skip (default: ask)\n"
        "  --yes                            Answer yes to confirmations\n"
        "  --verbose                        Verbose output\n"
        "  --log-file <path>                Log file path\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

}  // namespace

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        if (const char* v = std::getenv(name.c_str())) {
            return std::string(v);
        }
        return std::nullopt;
    };
}

std::optional<bool> parse_bool(const std::string& value) {
    std::string v = trim(value);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    return std::nullopt;
}

// --- Layers ---

std::map<std::string, std::string> Settings::read_env_file(const std::filesystem::path& path) {
    std::map<std::string, std::string> values;
    std::ifstream ifs(path);
    if (!ifs) return values;

    std::string line;
    while (std::getline(ifs, line)) {
        std::string stripped = trim(line);
        if (stripped.empty() || stripped.front() == '#') continue;
        if (stripped.compare(0, 7, "export ") == 0) {
            stripped = trim(stripped.substr(7));
        }
        size_t eq = stripped.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(stripped.substr(0, eq));
        std::string value = strip_quotes(trim(stripped.substr(eq + 1)));
        if (!key.empty()) {
            values[key] = value;
        }
    }
    return values;
}

void Settings::apply_env(const EnvLookup& env) {
    auto str = [&](const char* name, std::string& field) {
        if (auto v = env(name)) field = trim(*v);
    };
    auto u32 = [&](const char* name, uint32_t& field) {
        if (auto v = env(name)) {
            if (auto n = parse_unsigned<uint32_t>(*v)) field = *n;
        }
    };
    auto flag = [&](const char* name, bool& field) {
        if (auto v = env(name)) {
            if (auto b = parse_bool(*v)) field = *b;
        }
    };

    str(ENV_ACCESS_KEY, access_key);
    str(ENV_SECRET_KEY, secret_key);
    str(ENV_BUCKET, bucket);
    str(ENV_ENDPOINT, endpoint);
    if (auto v = env(ENV_REGION); v && !trim(*v).empty()) {
        region = trim(*v);
    }
    if (auto v = env(ENV_LOCAL_ROOT)) {
        local_root = strip_quotes(trim(*v));
    }

    u32(ENV_READ_TIMEOUT, read_timeout_secs);
    u32(ENV_CONNECT_TIMEOUT, connect_timeout_secs);

    if (auto v = env(ENV_PART_SIZE_MB)) {
        if (auto n = parse_unsigned<uint64_t>(*v)) part_size_mb = *n;
    }
    if (auto v = env(ENV_MAX_CONCURRENCY)) {
        if (auto n = parse_unsigned<size_t>(*v)) max_concurrency = *n;
    }
    flag(ENV_USE_THREADS, upload_use_threads);
    flag(ENV_FALLBACK_BUMP, upload_fallback_bump);
}

bool Settings::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("access_key")) access_key = j["access_key"].get<std::string>();
        if (j.contains("secret_key")) secret_key = j["secret_key"].get<std::string>();
        if (j.contains("bucket")) bucket = j["bucket"].get<std::string>();
        if (j.contains("endpoint")) endpoint = j["endpoint"].get<std::string>();
        if (j.contains("region")) region = j["region"].get<std::string>();
        if (j.contains("path_style")) use_path_style = j["path_style"].get<bool>();
        if (j.contains("verify_ssl")) verify_ssl = j["verify_ssl"].get<bool>();
        if (j.contains("local_root")) local_root = j["local_root"].get<std::string>();
        if (j.contains("connect_timeout")) connect_timeout_secs = j["connect_timeout"].get<uint32_t>();
        if (j.contains("read_timeout")) read_timeout_secs = j["read_timeout"].get<uint32_t>();
        if (j.contains("max_attempts")) max_attempts = j["max_attempts"].get<uint32_t>();
        if (j.contains("part_size_mb")) part_size_mb = j["part_size_mb"].get<uint64_t>();
        if (j.contains("max_concurrency")) max_concurrency = j["max_concurrency"].get<size_t>();
        if (j.contains("upload_use_threads")) upload_use_threads = j["upload_use_threads"].get<bool>();
        if (j.contains("upload_fallback_bump")) upload_fallback_bump = j["upload_fallback_bump"].get<bool>();
        if (j.contains("on_conflict")) on_conflict = j["on_conflict"].get<std::string>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

// --- Command line ---

std::optional<Settings> Settings::from_args(int argc, char* argv[], const EnvLookup& env) {
    Settings config;

    // --env-file and --config pick the lower layers, so find them first
    for (int i = 1; i + 1 < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--env-file") config.env_file = argv[i + 1];
        if (arg == "--config") config.config_file = argv[i + 1];
    }

    // .env values never override the real environment
    auto file_values = read_env_file(config.env_file);
    config.apply_env([&](const std::string& name) -> std::optional<std::string> {
        auto it = file_values.find(name);
        if (it == file_values.end()) return std::nullopt;
        return it->second;
    });
    config.apply_env(env);

    if (!config.config_file.empty() && !config.load_json(config.config_file)) {
        return std::nullopt;
    }

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    auto next_number = [&](int& i, const char* name) -> std::optional<uint64_t> {
        auto* v = next_arg(i, name);
        if (!v) return std::nullopt;
        auto n = parse_unsigned<uint64_t>(v);
        if (!n) {
            std::cerr << "Error: " << name << " expects a non-negative integer, got '" << v << "'\n";
        }
        return n;
    };

    bool operands_only = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (operands_only || arg.empty() || arg[0] != '-' || arg == "-") {
            config.command.push_back(arg);
            continue;
        }

        if (arg == "--") {
            operands_only = true;
        } else if (arg == "--env-file" || arg == "--config") {
            ++i;  // Already applied
        } else if (arg == "--endpoint") {
            auto* v = next_arg(i, "--endpoint");
            if (!v) return std::nullopt;
            config.endpoint = v;
        } else if (arg == "--bucket") {
            auto* v = next_arg(i, "--bucket");
            if (!v) return std::nullopt;
            config.bucket = v;
        } else if (arg == "--region") {
            auto* v = next_arg(i, "--region");
            if (!v) return std::nullopt;
            config.region = v;
        } else if (arg == "--access-key") {
            auto* v = next_arg(i, "--access-key");
            if (!v) return std::nullopt;
            config.access_key = v;
        } else if (arg == "--secret-key") {
            auto* v = next_arg(i, "--secret-key");
            if (!v) return std::nullopt;
            config.secret_key = v;
        } else if (arg == "--virtual-host-style") {
            config.use_path_style = false;
        } else if (arg == "--no-verify-ssl") {
            config.verify_ssl = false;
        } else if (arg == "--connect-timeout") {
            auto n = next_number(i, "--connect-timeout");
            if (!n) return std::nullopt;
            config.connect_timeout_secs = static_cast<uint32_t>(*n);
        } else if (arg == "--read-timeout") {
            auto n = next_number(i, "--read-timeout");
            if (!n) return std::nullopt;
            config.read_timeout_secs = static_cast<uint32_t>(*n);
        } else if (arg == "--max-attempts") {
            auto n = next_number(i, "--max-attempts");
            if (!n) return std::nullopt;
            config.max_attempts = static_cast<uint32_t>(*n);
        } else if (arg == "--part-size-mb") {
            auto n = next_number(i, "--part-size-mb");
            if (!n) return std::nullopt;
            config.part_size_mb = *n;
        } else if (arg == "--max-concurrency") {
            auto n = next_number(i, "--max-concurrency");
            if (!n) return std::nullopt;
            config.max_concurrency = static_cast<size_t>(*n);
        } else if (arg == "--no-threads") {
            config.upload_use_threads = false;
        } else if (arg == "--fallback-bump") {
            config.upload_fallback_bump = true;
        } else if (arg == "--local-root") {
            auto* v = next_arg(i, "--local-root");
            if (!v) return std::nullopt;
            config.local_root = v;
        } else if (arg == "--on-conflict") {
            auto* v = next_arg(i, "--on-conflict");
            if (!v) return std::nullopt;
            config.on_conflict = v;
        } else if (arg == "--yes" || arg == "-y") {
            config.assume_yes = true;
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--log-file") {
            auto* v = next_arg(i, "--log-file");
            if (!v) return std::nullopt;
            config.log_file = v;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            auto n = next_number(i, "--metrics-interval");
            if (!n) return std::nullopt;
            config.metrics_interval_secs = static_cast<size_t>(*n);
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return std::nullopt;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    return config;
}

std::string Settings::validate() const {
    if (bucket.empty()) return "bucket is required (--bucket or RUNPOD_BUCKET)";
    if (access_key.empty()) return "access key is required (--access-key or RUNPOD_S3_ACCESS_KEY)";
    if (secret_key.empty()) return "secret key is required (--secret-key or RUNPOD_S3_SECRET_KEY)";
    if (!endpoint.empty() && endpoint.find("://") == std::string::npos)
        return "endpoint must include a scheme (https://...): " + endpoint;
    if (connect_timeout_secs == 0) return "connect timeout must be > 0";
    if (read_timeout_secs == 0) return "read timeout must be > 0";
    if (max_attempts == 0) return "max attempts must be > 0";
    if (on_conflict != "ask" && on_conflict != "replace" && on_conflict != "copy" && on_conflict != "skip")
        return "on-conflict must be ask, replace, copy or skip: " + on_conflict;
    return {};
}

S3StoreConfig Settings::store_config() const {
    S3StoreConfig sc;
    sc.bucket = bucket;
    sc.region = region.empty() ? "us-east-1" : region;
    sc.endpoint = endpoint;
    sc.access_key = access_key;
    sc.secret_key = secret_key;
    sc.use_path_style = use_path_style;
    sc.verify_ssl = verify_ssl;
    sc.connect_timeout_secs = connect_timeout_secs;
    sc.read_timeout_secs = read_timeout_secs;
    sc.max_attempts = max_attempts;
    return sc;
}

TransferOverrides Settings::transfer_overrides() const {
    TransferOverrides o;
    o.part_size_mb = part_size_mb;
    o.max_concurrency = max_concurrency;
    o.use_threads = upload_use_threads;
    o.fallback_bump = upload_fallback_bump;
    return o;
}

}  // namespace s3pane
