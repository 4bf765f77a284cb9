#include "s3pane/app/file_manager.hpp"
#include "s3pane/core/log.hpp"
#include "s3pane/core/metrics.hpp"

namespace s3pane {

namespace {

std::string strip_slashes(const std::string& s) {
    size_t start = s.find_first_not_of('/');
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of('/');
    return s.substr(start, end - start + 1);
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string last_segment(const std::string& key) {
    std::string k = strip_slashes(key);
    size_t slash = k.rfind('/');
    return slash == std::string::npos ? k : k.substr(slash + 1);
}

std::string parent_prefix(const std::string& key) {
    std::string k = strip_slashes(key);
    size_t slash = k.rfind('/');
    return slash == std::string::npos ? "" : k.substr(0, slash);
}

// A relative path from a key must stay below the download directory
bool is_contained(const std::filesystem::path& rel) {
    if (rel.empty() || rel.is_absolute()) return false;
    for (const auto& part : rel) {
        if (part == "..") return false;
    }
    return true;
}

BatchResult fail(BatchResult& result, const std::string& item, const OpResult& op) {
    result.success = false;
    result.cancelled = op.cancelled;
    result.error_message = op.error_message;
    result.failed_item = item;
    return result;
}

}  // namespace

FileManager::FileManager(ObjectStore& store, TransferService& transfers, UserPrompt& prompt)
    : store_(store)
    , transfers_(transfers)
    , resolver_(prompt)
    , walker_(store) {}

// ============================================================================
// Folder safety
// ============================================================================

OpResult FileManager::ensure_remote_folder(const std::string& prefix) {
    std::string current;
    size_t pos = 0;
    std::string path = strip_slashes(prefix);

    while (pos <= path.size() && !path.empty()) {
        size_t slash = path.find('/', pos);
        std::string part = path.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
        pos = slash == std::string::npos ? path.size() + 1 : slash + 1;
        if (part.empty()) continue;

        current = current.empty() ? part : current + "/" + part;

        // A plain object at this level would shadow the folder
        if (store_.exists(current)) {
            bool replace = resolver_.prompt().confirm(
                "Path is a file",
                "'" + current + "' exists as a file. Replace it with a folder?\n"
                "The file will be deleted and replaced with an empty folder.");
            if (!replace) {
                OpResult declined = OpResult::failure("'" + current + "' exists as a file and was kept");
                declined.cancelled = true;
                return declined;
            }
            OpResult removed = store_.remove(current);
            if (!removed.success) {
                return removed;
            }
            if (metrics_) metrics_->deletes_total().Increment();
            log_info("Replaced file %s with a folder", store_.display_uri(current).c_str());
        }

        OpResult marker = store_.create_folder_marker(current + "/");
        if (!marker.success) {
            log_warn("%s", marker.error_message.c_str());
        }
    }
    return OpResult::ok();
}

OpResult FileManager::create_folder(const std::string& prefix, const std::string& name) {
    std::string folder = trim(name);
    while (!folder.empty() && folder.back() == '/') folder.pop_back();
    if (folder.empty()) {
        return OpResult::failure("folder name is empty");
    }
    if (folder.find('/') != std::string::npos) {
        return OpResult::failure("folder name must not contain '/': " + folder);
    }

    OpResult parent = ensure_remote_folder(prefix);
    if (!parent.success) {
        return parent;
    }

    std::string key = join_key(prefix, folder);
    if (store_.exists(key)) {
        return OpResult::failure("'" + key + "' already exists as a file");
    }
    return store_.create_folder_marker(key + "/");
}

// ============================================================================
// Upload
// ============================================================================

BatchResult FileManager::upload_files(const std::vector<std::filesystem::path>& files,
                                      const std::string& remote_prefix,
                                      ProgressSink* sink,
                                      const CancelFlag& cancel) {
    BatchResult result;
    std::string base_prefix = strip_slashes(remote_prefix);

    OpResult folder = ensure_remote_folder(base_prefix);
    if (!folder.success) {
        return fail(result, base_prefix, folder);
    }

    for (const auto& local_path : files) {
        if (is_cancelled(cancel)) {
            return fail(result, local_path.string(), OpResult::cancelled_result());
        }

        std::string key = join_key(base_prefix, local_path.filename().string());

        if (store_.exists(key)) {
            Resolution res = resolver_.resolve_key("Upload to remote", key, base_prefix);
            if (res.skipped()) {
                log_info("Skipped %s", local_path.c_str());
                ++result.skipped;
                continue;
            }
            key = res.key;
        }

        OpResult op = transfers_.upload(local_path, key, sink, cancel);
        if (!op.success) {
            return fail(result, local_path.string(), op);
        }
        ++result.completed;
    }
    return result;
}

// ============================================================================
// Download
// ============================================================================

OpResult FileManager::download_one(const std::string& key, std::filesystem::path local_path,
                                   const std::string& action, ProgressSink* sink,
                                   const CancelFlag& cancel, bool& skipped) {
    skipped = false;
    std::error_code ec;
    if (std::filesystem::exists(local_path, ec)) {
        Resolution res = resolver_.resolve_path(action, local_path);
        if (res.skipped()) {
            log_info("Skipped %s", local_path.c_str());
            skipped = true;
            return OpResult::ok();
        }
        local_path = res.path;
    }
    return transfers_.download(key, local_path, sink, cancel);
}

BatchResult FileManager::download(const std::vector<RemoteItem>& items,
                                  const std::filesystem::path& local_dir,
                                  ProgressSink* sink,
                                  const CancelFlag& cancel) {
    BatchResult result;

    for (const auto& item : items) {
        if (is_cancelled(cancel)) {
            return fail(result, item.key, OpResult::cancelled_result());
        }

        if (item.kind == EntryKind::File) {
            bool skipped = false;
            OpResult op = download_one(item.key, local_dir / last_segment(item.key),
                                       "Download to local", sink, cancel, skipped);
            if (!op.success) {
                return fail(result, item.key, op);
            }
            skipped ? ++result.skipped : ++result.completed;
            continue;
        }

        std::string dir_key = strip_slashes(item.key);
        std::filesystem::path local_base = dir_key.empty() ? local_dir : local_dir / last_segment(dir_key);

        KeyListResult keys = walker_.list_all_file_keys(dir_key, cancel);
        if (!keys.success) {
            OpResult op = OpResult::failure(keys.error_message);
            op.cancelled = keys.cancelled;
            return fail(result, item.key, op);
        }

        // Create the folder even if it only holds nested folders
        std::error_code ec;
        std::filesystem::create_directories(local_base, ec);
        if (ec) {
            return fail(result, local_base.string(),
                        OpResult::failure("cannot create " + local_base.string() + ": " + ec.message()));
        }

        std::string prefix_with_slash = dir_key.empty() ? "" : dir_key + "/";
        for (const auto& child_key : keys.keys) {
            if (child_key.empty() || child_key.back() == '/') continue;

            std::string rel = child_key.compare(0, prefix_with_slash.size(), prefix_with_slash) == 0
                ? child_key.substr(prefix_with_slash.size())
                : last_segment(child_key);

            std::filesystem::path rel_path = std::filesystem::path(rel).lexically_normal();
            if (!is_contained(rel_path)) {
                log_warn("Skipping %s: key does not map to a path inside %s",
                         child_key.c_str(), local_base.c_str());
                ++result.skipped;
                continue;
            }

            std::filesystem::path local_path = local_base / rel_path;
            std::filesystem::create_directories(local_path.parent_path(), ec);
            if (ec) {
                return fail(result, child_key,
                            OpResult::failure("cannot create " + local_path.parent_path().string() +
                                              ": " + ec.message()));
            }

            bool skipped = false;
            OpResult op = download_one(child_key, local_path, "Download folder to local",
                                       sink, cancel, skipped);
            if (!op.success) {
                return fail(result, child_key, op);
            }
            skipped ? ++result.skipped : ++result.completed;
        }
    }
    return result;
}

// ============================================================================
// Delete / rename
// ============================================================================

BatchResult FileManager::delete_remote(const std::vector<RemoteItem>& items, const CancelFlag& cancel) {
    BatchResult result;

    auto remove_key = [&](const std::string& key) {
        OpResult op = store_.remove(key);
        if (op.success && metrics_) metrics_->deletes_total().Increment();
        return op;
    };

    for (const auto& item : items) {
        if (is_cancelled(cancel)) {
            return fail(result, item.key, OpResult::cancelled_result());
        }

        if (item.kind == EntryKind::File) {
            OpResult op = remove_key(item.key);
            if (!op.success) {
                return fail(result, item.key, op);
            }
            ++result.completed;
            continue;
        }

        std::string prefix = strip_slashes(item.key);
        if (prefix.empty()) {
            return fail(result, item.key, OpResult::failure("refusing to delete the bucket root"));
        }

        KeyListResult keys = walker_.list_all_keys(prefix, cancel);
        if (!keys.success) {
            OpResult op = OpResult::failure(keys.error_message);
            op.cancelled = keys.cancelled;
            return fail(result, item.key, op);
        }
        if (!keys.complete) {
            log_warn("Listing of %s was cut short; some keys may remain", store_.display_uri(prefix).c_str());
        }

        for (const auto& child_key : keys.keys) {
            if (is_cancelled(cancel)) {
                return fail(result, child_key, OpResult::cancelled_result());
            }
            OpResult op = remove_key(child_key);
            if (!op.success) {
                return fail(result, child_key, op);
            }
        }

        // Marker if present; deleting a missing key succeeds
        OpResult op = remove_key(prefix + "/");
        if (!op.success) {
            return fail(result, prefix + "/", op);
        }
        log_info("Deleted %s (%zu keys)", store_.display_uri(prefix + "/").c_str(), keys.keys.size());
        ++result.completed;
    }
    return result;
}

OpResult FileManager::rename_remote(const std::string& key, const std::string& new_name) {
    auto count = [&](bool ok) {
        if (!metrics_) return;
        ok ? metrics_->renames_success().Increment() : metrics_->renames_failure().Increment();
    };

    std::string name = trim(new_name);
    if (name.empty()) {
        return OpResult::failure("new name for " + key + " is empty");
    }

    std::string prefix = parent_prefix(key);
    std::string new_key = join_key(prefix, name);
    if (new_key == key) {
        return OpResult::ok();
    }

    if (store_.exists(new_key)) {
        Resolution res = resolver_.resolve_key("Rename on remote", new_key, prefix);
        if (res.skipped()) {
            OpResult skipped = OpResult::failure("rename of " + key + " skipped");
            skipped.cancelled = true;
            return skipped;
        }
        new_key = res.key;
        // A rename or copy name can land back on the source key
        if (new_key == key) {
            return OpResult::ok();
        }
    }

    OpResult copied = store_.copy(key, new_key);
    if (!copied.success) {
        count(false);
        return copied;
    }

    OpResult removed = store_.remove(key);
    if (!removed.success) {
        count(false);
        return OpResult::failure("copied " + key + " to " + new_key + " but could not delete " + key +
                                 "; both keys now exist: " + removed.error_message);
    }

    count(true);
    log_info("Renamed %s -> %s", store_.display_uri(key).c_str(), store_.display_uri(new_key).c_str());
    return OpResult::ok();
}

// ============================================================================
// Local
// ============================================================================

BatchResult FileManager::delete_local(const std::vector<std::filesystem::path>& paths) {
    BatchResult result;
    for (const auto& path : paths) {
        std::error_code ec;
        auto status = std::filesystem::symlink_status(path, ec);
        if (ec || !std::filesystem::exists(status)) {
            ++result.skipped;
            continue;
        }
        std::filesystem::remove_all(path, ec);
        if (ec) {
            return fail(result, path.string(),
                        OpResult::failure("cannot delete " + path.string() + ": " + ec.message()));
        }
        ++result.completed;
    }
    return result;
}

}  // namespace s3pane
