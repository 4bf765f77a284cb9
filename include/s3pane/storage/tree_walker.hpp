#pragma once

#include "s3pane/core/cancel.hpp"
#include "s3pane/core/constants.hpp"
#include "s3pane/storage/prefix_lister.hpp"

#include <functional>
#include <string>
#include <vector>

namespace s3pane {

struct KeyListResult {
    bool success = false;
    std::string error_message;
    bool cancelled = false;
    bool complete = true;  // False if any level's pagination stopped early
    std::vector<std::string> keys;
};

struct WalkResult {
    bool success = false;
    std::string error_message;
    bool cancelled = false;
    bool complete = true;
    bool stopped = false;  // Visitor asked to stop
    size_t files_visited = 0;
    size_t prefixes_listed = 0;
};

// Return false to stop the walk
using KeyVisitor = std::function<bool(const std::string& key)>;

/// Recursive enumeration below a prefix.
///
/// The breadth-first walk lists one folder level at a time with the same
/// classification rules as PrefixLister, so providers that ignore the
/// delimiter or use legacy markers produce the same tree the browser shows.
class TreeWalker {
public:
    explicit TreeWalker(const ObjectStore& store,
                        size_t max_pending_prefixes = constants::DEFAULT_MAX_PENDING_PREFIXES);

    // Every file key below prefix (leading and trailing '/' ignored)
    KeyListResult list_all_file_keys(const std::string& prefix, const CancelFlag& cancel = {}) const;

    /// Same traversal, delivering keys as each level is listed. Fails when
    /// more than max_pending_prefixes folders are waiting to be listed.
    WalkResult walk_file_keys(const std::string& prefix, const KeyVisitor& visitor,
                              const CancelFlag& cancel = {}) const;

    // Every literal key under prefix/ (markers included) via a flat listing
    KeyListResult list_all_keys(const std::string& prefix, const CancelFlag& cancel = {}) const;

private:
    const ObjectStore& store_;
    PrefixLister lister_;
    size_t max_pending_prefixes_;
};

}  // namespace s3pane
