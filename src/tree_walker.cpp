#include "s3pane/storage/tree_walker.hpp"
#include "s3pane/core/log.hpp"

#include <deque>
#include <unordered_set>

namespace s3pane {

static std::string strip_slashes(const std::string& s) {
    size_t start = s.find_first_not_of('/');
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of('/');
    return s.substr(start, end - start + 1);
}

TreeWalker::TreeWalker(const ObjectStore& store, size_t max_pending_prefixes)
    : store_(store)
    , lister_(store)
    , max_pending_prefixes_(max_pending_prefixes) {}

WalkResult TreeWalker::walk_file_keys(const std::string& prefix, const KeyVisitor& visitor,
                                      const CancelFlag& cancel) const {
    WalkResult result;

    std::deque<std::string> pending{strip_slashes(prefix)};
    std::unordered_set<std::string> visited;

    while (!pending.empty()) {
        if (is_cancelled(cancel)) {
            result.cancelled = true;
            result.error_message = "cancelled";
            return result;
        }

        std::string current = strip_slashes(pending.front());
        pending.pop_front();
        if (!visited.insert(current).second) {
            continue;
        }

        PrefixListing listing = lister_.list(current, cancel);
        if (!listing.success) {
            result.cancelled = listing.cancelled;
            result.error_message = listing.error_message;
            return result;
        }
        ++result.prefixes_listed;
        if (!listing.complete) {
            result.complete = false;
        }

        for (const auto& file : listing.files) {
            ++result.files_visited;
            if (!visitor(file.key)) {
                result.stopped = true;
                result.success = true;
                return result;
            }
        }

        for (const auto& dir : listing.dirs) {
            std::string name = strip_slashes(dir);
            if (name.empty()) continue;

            std::string child = current.empty() ? name : current + "/" + name;
            if (visited.count(child) > 0) continue;

            if (pending.size() >= max_pending_prefixes_) {
                result.error_message = "tree walk below " + store_.display_uri(current) +
                                       " exceeded " + std::to_string(max_pending_prefixes_) +
                                       " pending folders";
                return result;
            }
            pending.push_back(std::move(child));
        }
    }

    result.success = true;
    return result;
}

KeyListResult TreeWalker::list_all_file_keys(const std::string& prefix, const CancelFlag& cancel) const {
    KeyListResult result;

    WalkResult walked = walk_file_keys(prefix, [&](const std::string& key) {
        result.keys.push_back(key);
        return true;
    }, cancel);

    result.success = walked.success;
    result.error_message = walked.error_message;
    result.cancelled = walked.cancelled;
    result.complete = walked.complete;
    if (!result.success) {
        result.keys.clear();
    }
    return result;
}

KeyListResult TreeWalker::list_all_keys(const std::string& prefix, const CancelFlag& cancel) const {
    KeyListResult result;

    ListRequest request;
    request.prefix = normalize_prefix(prefix);

    PaginationResult paged = for_each_page(store_, request, [&](const ListPage& page) {
        for (const auto& object : page.objects) {
            if (!object.key.empty()) {
                result.keys.push_back(object.key);
            }
        }
        return true;
    }, cancel);

    result.success = paged.success;
    result.error_message = paged.error_message;
    result.cancelled = paged.cancelled;
    result.complete = paged.complete;
    if (!result.success) {
        result.keys.clear();
    }
    log_debug("Flat listing of %s: %zu keys in %zu pages",
              store_.display_uri(request.prefix).c_str(), result.keys.size(), paged.pages);
    return result;
}

}  // namespace s3pane
