#include "s3pane/transfer/conflict_resolver.hpp"

#include <algorithm>
#include <cctype>

namespace s3pane {

const char* conflict_decision_to_string(ConflictDecision decision) {
    switch (decision) {
        case ConflictDecision::Replace: return "replace";
        case ConflictDecision::Copy: return "copy";
        case ConflictDecision::Rename: return "rename";
        case ConflictDecision::Skip: return "skip";
    }
    return "skip";
}

std::optional<ConflictDecision> parse_conflict_decision(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "replace" || v == "r") return ConflictDecision::Replace;
    if (v == "copy" || v == "c") return ConflictDecision::Copy;
    if (v == "rename" || v == "n") return ConflictDecision::Rename;
    if (v == "skip" || v == "s") return ConflictDecision::Skip;
    return std::nullopt;
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static std::string copy_base(const std::string& base) {
    size_t dot = base.rfind('.');
    if (dot == std::string::npos) {
        return base + "_copy";
    }
    return base.substr(0, dot) + "_copy" + base.substr(dot);
}

std::string make_copy_name(const std::string& name) {
    size_t slash = name.rfind('/');
    if (slash == std::string::npos) {
        return copy_base(name);
    }
    return name.substr(0, slash + 1) + copy_base(name.substr(slash + 1));
}

std::string make_copy_key(const std::string& key) {
    std::string result = make_copy_name(key);
    size_t start = result.find_first_not_of('/');
    return start == std::string::npos ? "" : result.substr(start);
}

std::filesystem::path make_copy_path(const std::filesystem::path& path) {
    return path.parent_path() / copy_base(path.filename().string());
}

std::string join_key(const std::string& prefix, const std::string& name) {
    size_t start = prefix.find_first_not_of('/');
    std::string p;
    if (start != std::string::npos) {
        size_t end = prefix.find_last_not_of('/');
        p = prefix.substr(start, end - start + 1);
    }
    std::string key = p.empty() ? name : p + "/" + name;
    size_t key_start = key.find_first_not_of('/');
    return key_start == std::string::npos ? "" : key.substr(key_start);
}

// ============================================================================
// ConflictResolver
// ============================================================================

ConflictResolver::ConflictResolver(UserPrompt& prompt)
    : prompt_(prompt) {}

std::optional<std::string> ConflictResolver::ask_name(const std::string& action,
                                                      const std::string& current) {
    auto answer = prompt_.ask_new_name(action, current);
    if (!answer) return std::nullopt;
    std::string name = trim(*answer);
    if (name.empty()) return std::nullopt;
    return name;
}

Resolution ConflictResolver::resolve_key(const std::string& action, const std::string& key,
                                         const std::string& key_prefix) {
    Resolution res;
    res.decision = prompt_.ask_conflict(action, key);

    switch (res.decision) {
        case ConflictDecision::Replace:
            res.key = key;
            break;
        case ConflictDecision::Copy:
            res.key = make_copy_key(key);
            break;
        case ConflictDecision::Rename: {
            size_t slash = key.rfind('/');
            std::string current = slash == std::string::npos ? key : key.substr(slash + 1);
            auto name = ask_name(action, current);
            if (!name) {
                res.decision = ConflictDecision::Skip;
                break;
            }
            res.key = join_key(key_prefix, *name);
            break;
        }
        case ConflictDecision::Skip:
            break;
    }
    return res;
}

Resolution ConflictResolver::resolve_path(const std::string& action, const std::filesystem::path& path) {
    Resolution res;
    res.decision = prompt_.ask_conflict(action, path.string());

    switch (res.decision) {
        case ConflictDecision::Replace:
            res.path = path;
            break;
        case ConflictDecision::Copy:
            res.path = make_copy_path(path);
            break;
        case ConflictDecision::Rename: {
            auto name = ask_name(action, path.filename().string());
            if (!name) {
                res.decision = ConflictDecision::Skip;
                break;
            }
            res.path = path.parent_path() / *name;
            break;
        }
        case ConflictDecision::Skip:
            break;
    }
    return res;
}

}  // namespace s3pane
