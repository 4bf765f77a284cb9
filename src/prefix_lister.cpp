#include "s3pane/storage/prefix_lister.hpp"
#include "s3pane/core/log.hpp"

#include <algorithm>
#include <set>

namespace s3pane {

Entry Entry::dir(const std::string& name) {
    Entry entry;
    entry.kind = EntryKind::Dir;
    entry.name = name;
    return entry;
}

Entry Entry::file(const ObjectInfo& object, const std::string& name) {
    Entry entry;
    entry.kind = EntryKind::File;
    entry.name = name;
    entry.key = object.key;
    entry.size = object.size;
    entry.last_modified = object.last_modified;
    return entry;
}

std::vector<Entry> PrefixListing::entries() const {
    std::vector<Entry> result;
    result.reserve(dirs.size() + files.size());
    for (const auto& d : dirs) {
        result.push_back(Entry::dir(d));
    }
    result.insert(result.end(), files.begin(), files.end());
    return result;
}

std::string normalize_prefix(const std::string& prefix) {
    if (prefix.empty() || prefix.back() == '/') {
        return prefix;
    }
    return prefix + "/";
}

// ============================================================================
// Resilient pagination
// ============================================================================

PaginationResult for_each_page(const ObjectStore& store,
                               const ListRequest& base,
                               const PageVisitor& visitor,
                               const CancelFlag& cancel) {
    PaginationResult result;

    ListRequest request = base;
    request.continuation_token.clear();
    request.start_after.clear();

    std::set<std::string> seen_tokens;
    std::set<std::string> seen_markers;

    while (true) {
        if (is_cancelled(cancel)) {
            result.cancelled = true;
            result.error_message = "cancelled";
            return result;
        }

        ListPage page = store.list_page(request);
        if (!page.success) {
            result.error_message = page.error_message;
            return result;
        }
        ++result.pages;

        if (!visitor(page)) {
            break;
        }

        if (!page.truncated) {
            break;
        }

        const std::string& next_token = page.next_continuation_token;
        if (!next_token.empty() && seen_tokens.count(next_token) == 0) {
            seen_tokens.insert(next_token);
            request.continuation_token = next_token;
            request.start_after.clear();
            continue;
        }

        // Token missing or repeated: resume after the greatest position seen
        std::string marker;
        for (const auto& object : page.objects) {
            marker = std::max(marker, object.key);
        }
        for (const auto& cp : page.common_prefixes) {
            marker = std::max(marker, cp);
        }

        if (marker.empty() || seen_markers.count(marker) > 0) {
            log_warn("Listing %s stopped early: provider keeps returning the same page",
                     store.display_uri(base.prefix).c_str());
            result.complete = false;
            break;
        }

        log_debug("Listing %s: continuation token %s, resuming after '%s'",
                  store.display_uri(base.prefix).c_str(),
                  next_token.empty() ? "missing" : "repeated", marker.c_str());
        seen_markers.insert(marker);
        request.continuation_token.clear();
        request.start_after = marker;
    }

    result.success = true;
    return result;
}

// ============================================================================
// PrefixLister
// ============================================================================

PrefixLister::PrefixLister(const ObjectStore& store, uint32_t page_size)
    : store_(store)
    , page_size_(page_size) {}

static std::string strip_slashes(const std::string& s) {
    size_t start = s.find_first_not_of('/');
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of('/');
    return s.substr(start, end - start + 1);
}

PrefixListing PrefixLister::list(const std::string& prefix, const CancelFlag& cancel) const {
    PrefixListing listing;
    listing.prefix = normalize_prefix(prefix);
    const std::string& pfx = listing.prefix;

    std::set<std::string> dirs;

    ListRequest request;
    request.prefix = pfx;
    request.delimiter = "/";
    request.max_keys = page_size_;

    auto visit = [&](const ListPage& page) {
        for (const auto& cp : page.common_prefixes) {
            std::string residual = cp.size() >= pfx.size() ? cp.substr(pfx.size()) : "";
            std::string name = strip_slashes(residual);
            if (!name.empty()) {
                dirs.insert(name + "/");
            }
        }

        for (const auto& object : page.objects) {
            if (object.key == pfx || object.key.size() <= pfx.size()) {
                continue;
            }
            std::string name = object.key.substr(pfx.size());

            // "folder/" is a marker, not a file. A nested path (the provider
            // ignored the delimiter) keeps only its first segment.
            size_t slash = name.find('/');
            if (slash != std::string::npos) {
                if (slash > 0) {
                    dirs.insert(name.substr(0, slash) + "/");
                }
                continue;
            }

            // Legacy marker: zero bytes, no slash, no extension
            if (object.size == 0 && name.find('.') == std::string::npos) {
                dirs.insert(name + "/");
                continue;
            }

            listing.files.push_back(Entry::file(object, name));
        }
        return true;
    };

    PaginationResult paged = for_each_page(store_, request, visit, cancel);
    if (!paged.success) {
        listing.error_message = paged.error_message;
        listing.cancelled = paged.cancelled;
        listing.files.clear();
        return listing;
    }

    listing.success = true;
    listing.complete = paged.complete;
    listing.dirs.assign(dirs.begin(), dirs.end());
    return listing;
}

}  // namespace s3pane
