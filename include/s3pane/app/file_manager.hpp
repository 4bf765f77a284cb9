#pragma once

#include "s3pane/core/cancel.hpp"
#include "s3pane/storage/object_store.hpp"
#include "s3pane/storage/prefix_lister.hpp"
#include "s3pane/storage/tree_walker.hpp"
#include "s3pane/transfer/conflict_resolver.hpp"
#include "s3pane/transfer/transfer_service.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace s3pane {

class MetricsExporter;

// Outcome of a multi-item operation
struct BatchResult {
    bool success = true;
    std::string error_message;
    bool cancelled = false;
    size_t completed = 0;
    size_t skipped = 0;
    std::string failed_item;  // Key or path that stopped the batch
};

// A selected remote item; folder keys may carry a trailing '/'
struct RemoteItem {
    std::string key;
    EntryKind kind = EntryKind::File;

    static RemoteItem file(const std::string& key) { return {key, EntryKind::File}; }
    static RemoteItem dir(const std::string& key) { return {key, EntryKind::Dir}; }
};

/// User-level file operations built from flat store primitives.
///
/// Batches stop at the first fatal error and report it together with the
/// key or path involved. Items completed before the failure are not rolled
/// back, so the store (or local disk) may be left partially modified.
/// Conflicts and confirmations go through the UserPrompt.
class FileManager {
public:
    FileManager(ObjectStore& store, TransferService& transfers, UserPrompt& prompt);

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    /// Upload local files into remote_prefix. The prefix is made safe with
    /// ensure_remote_folder() first; existing keys go through conflict
    /// resolution.
    BatchResult upload_files(const std::vector<std::filesystem::path>& files,
                             const std::string& remote_prefix,
                             ProgressSink* sink = nullptr,
                             const CancelFlag& cancel = {});

    /// Download files and folders into local_dir. A folder is recreated as
    /// local_dir/<folder name> (even when it holds no files) with relative
    /// paths mirrored below it.
    BatchResult download(const std::vector<RemoteItem>& items,
                         const std::filesystem::path& local_dir,
                         ProgressSink* sink = nullptr,
                         const CancelFlag& cancel = {});

    /// Delete files, and folders recursively: every key below the folder,
    /// then its marker. The bucket root cannot be deleted this way.
    BatchResult delete_remote(const std::vector<RemoteItem>& items,
                              const CancelFlag& cancel = {});

    /// Rename a file within its folder by copy then delete. Not atomic: if
    /// the copy succeeds and the delete fails, both keys exist and the
    /// error says so.
    OpResult rename_remote(const std::string& key, const std::string& new_name);

    // Create prefix/name/ after making sure no file blocks the path
    OpResult create_folder(const std::string& prefix, const std::string& name);

    /// Make every level of prefix usable as a folder. A plain file sitting
    /// at a level is deleted (after confirmation) and replaced by a marker.
    /// Declining the confirmation aborts. Marker creation errors are only
    /// logged.
    OpResult ensure_remote_folder(const std::string& prefix);

    // Recursive local delete; stops on the first error
    BatchResult delete_local(const std::vector<std::filesystem::path>& paths);

private:
    OpResult download_one(const std::string& key, std::filesystem::path local_path,
                          const std::string& action, ProgressSink* sink,
                          const CancelFlag& cancel, bool& skipped);

    ObjectStore& store_;
    TransferService& transfers_;
    ConflictResolver resolver_;
    TreeWalker walker_;
    MetricsExporter* metrics_ = nullptr;
};

}  // namespace s3pane
