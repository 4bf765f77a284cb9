#pragma once

#include "s3pane/core/cancel.hpp"
#include "s3pane/storage/object_store.hpp"

#include <functional>
#include <string>
#include <vector>

namespace s3pane {

enum class EntryKind {
    Dir,
    File
};

// One row of a folder listing. Dir names keep their trailing '/'.
struct Entry {
    EntryKind kind = EntryKind::File;
    std::string name;
    std::string key;  // Full key (files only)
    uint64_t size = 0;
    std::optional<std::chrono::system_clock::time_point> last_modified;

    bool is_dir() const { return kind == EntryKind::Dir; }

    static Entry dir(const std::string& name);
    static Entry file(const ObjectInfo& object, const std::string& name);
};

// Folder view of one prefix
struct PrefixListing {
    bool success = false;
    std::string error_message;
    bool cancelled = false;

    std::string prefix;               // Normalized (empty or ending in '/')
    std::vector<std::string> dirs;    // Sorted, unique, trailing '/'
    std::vector<Entry> files;         // Arrival order

    // False when pagination was abandoned because the provider kept
    // returning the same position; the listing holds what was seen
    bool complete = true;

    // Dirs first, then files
    std::vector<Entry> entries() const;
};

// Outcome of walking all pages of one listing
struct PaginationResult {
    bool success = false;
    std::string error_message;
    bool cancelled = false;
    bool complete = true;
    size_t pages = 0;
};

// Return false to stop paging early
using PageVisitor = std::function<bool(const ListPage&)>;

/// Page through a listing, tolerating providers that repeat or drop
/// continuation tokens.
///
/// A truncated page whose next token is missing or was already consumed
/// continues from the greatest key or common prefix of that page via
/// start-after. If that marker was used before, or the page carried no
/// keys at all, paging stops and the result is marked incomplete.
PaginationResult for_each_page(const ObjectStore& store,
                               const ListRequest& base,
                               const PageVisitor& visitor,
                               const CancelFlag& cancel = {});

// "" stays ""; anything else ends with exactly the one trailing '/' it had or gained
std::string normalize_prefix(const std::string& prefix);

// Turns flat delimiter listings into dirs and files for one prefix
class PrefixLister {
public:
    explicit PrefixLister(const ObjectStore& store,
                          uint32_t page_size = constants::DEFAULT_LIST_MAX_KEYS);

    PrefixListing list(const std::string& prefix, const CancelFlag& cancel = {}) const;

private:
    const ObjectStore& store_;
    uint32_t page_size_;
};

}  // namespace s3pane
