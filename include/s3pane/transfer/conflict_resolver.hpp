#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace s3pane {

enum class ConflictDecision {
    Replace,  // Overwrite the existing item
    Copy,     // Write next to it under a "_copy" name
    Rename,   // Ask for a new name
    Skip      // Leave this item out
};

const char* conflict_decision_to_string(ConflictDecision decision);
std::optional<ConflictDecision> parse_conflict_decision(const std::string& value);

/// Interaction the core needs from whatever presents it (terminal, GUI).
class UserPrompt {
public:
    virtual ~UserPrompt() = default;

    // "Upload to remote" / "s3://bucket/a/report.pdf" already exists
    virtual ConflictDecision ask_conflict(const std::string& action, const std::string& target) = 0;

    // Empty or nullopt means the user cancelled
    virtual std::optional<std::string> ask_new_name(const std::string& action,
                                                    const std::string& current_name) = 0;

    virtual bool confirm(const std::string& title, const std::string& message) = 0;
};

// report.pdf -> report_copy.pdf, README -> README_copy; final segment only
std::string make_copy_name(const std::string& name);

// Same rule for object keys; the result never starts with '/'
std::string make_copy_key(const std::string& key);

std::filesystem::path make_copy_path(const std::filesystem::path& path);

// "prefix/name" with leading and trailing '/' of prefix ignored
std::string join_key(const std::string& prefix, const std::string& name);

// Where a conflicting item should go, or nothing if it is skipped
struct Resolution {
    ConflictDecision decision = ConflictDecision::Skip;
    std::string key;              // Remote targets
    std::filesystem::path path;   // Local targets

    bool skipped() const { return decision == ConflictDecision::Skip; }
};

/// Applies the user's conflict decision to a destination.
///
/// Copy rewrites the name with make_copy_name and does not check the new
/// name again. Rename asks for a name once; an empty answer skips the item.
class ConflictResolver {
public:
    explicit ConflictResolver(UserPrompt& prompt);

    // Remote key that already exists; a renamed key stays in key_prefix
    Resolution resolve_key(const std::string& action, const std::string& key,
                           const std::string& key_prefix);

    // Local file that already exists; a renamed file stays in its directory
    Resolution resolve_path(const std::string& action, const std::filesystem::path& path);

    UserPrompt& prompt() { return prompt_; }

private:
    std::optional<std::string> ask_name(const std::string& action, const std::string& current);

    UserPrompt& prompt_;
};

}  // namespace s3pane
