#include "s3pane/app/file_manager.hpp"
#include "s3pane/app/remote_browser.hpp"
#include "s3pane/app/settings.hpp"
#include "s3pane/core/log.hpp"
#include "s3pane/core/metrics.hpp"
#include "s3pane/storage/tree_walker.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unistd.h>

namespace {
std::atomic<bool>* g_cancel = nullptr;

void signal_handler(int sig) {
    (void)sig;
    if (g_cancel) g_cancel->store(true);
}

bool read_line(std::string& line) {
    if (!std::getline(std::cin, line)) return false;
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
    return true;
}

// Terminal prompt; non-"ask" policies answer conflicts without reading stdin
class StdioPrompt : public s3pane::UserPrompt {
public:
    StdioPrompt(const std::string& on_conflict, bool assume_yes)
        : policy_(on_conflict == "ask" ? std::nullopt : s3pane::parse_conflict_decision(on_conflict))
        , assume_yes_(assume_yes) {}

    s3pane::ConflictDecision ask_conflict(const std::string& action, const std::string& target) override {
        if (policy_) return *policy_;

        while (true) {
            std::cerr << action << ": '" << target << "' already exists.\n"
                      << "  [r]eplace, [c]opy, re[n]ame, [s]kip? " << std::flush;
            std::string answer;
            if (!read_line(answer)) return s3pane::ConflictDecision::Skip;
            auto decision = s3pane::parse_conflict_decision(answer);
            if (decision) return *decision;
        }
    }

    std::optional<std::string> ask_new_name(const std::string& action,
                                            const std::string& current_name) override {
        std::cerr << action << ": new name for '" << current_name << "': " << std::flush;
        std::string answer;
        if (!read_line(answer) || answer.empty()) return std::nullopt;
        return answer;
    }

    bool confirm(const std::string& title, const std::string& message) override {
        if (assume_yes_) return true;
        std::cerr << title << "\n" << message << " [y/N] " << std::flush;
        std::string answer;
        if (!read_line(answer)) return false;
        return answer == "y" || answer == "Y" || answer == "yes";
    }

private:
    std::optional<s3pane::ConflictDecision> policy_;
    bool assume_yes_;
};

// Single-line percentage on stderr when attached to a terminal
class TerminalProgress : public s3pane::ProgressSink {
public:
    TerminalProgress()
        : enabled_(isatty(STDERR_FILENO)) {}

    void on_progress(int percent) override {
        if (!enabled_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        fprintf(stderr, "\r  %3d%%", percent);
        if (percent >= 100) fputc('\n', stderr);
        fflush(stderr);
    }

private:
    bool enabled_;
    std::mutex mutex_;
};

std::string format_time(const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (!tp) return "";
    std::time_t t = std::chrono::system_clock::to_time_t(*tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

void print_listing(const s3pane::PrefixListing& listing) {
    for (const auto& entry : listing.entries()) {
        if (entry.is_dir()) {
            printf("%-5s %12s %16s  %s\n", "DIR", "", "", entry.name.c_str());
        } else {
            printf("%-5s %12s %16s  %s\n", "FILE", s3pane::human_size(entry.size).c_str(),
                   format_time(entry.last_modified).c_str(), entry.name.c_str());
        }
    }
    if (!listing.complete) {
        printf("(listing incomplete: the server kept repeating a page)\n");
    }
}

int report(const s3pane::BatchResult& result, const char* verb) {
    if (result.success) {
        s3pane::log_info("%s %zu item(s), skipped %zu", verb, result.completed, result.skipped);
        return 0;
    }
    if (result.cancelled) {
        s3pane::log_warn("Cancelled at %s after %zu item(s)", result.failed_item.c_str(), result.completed);
        return 130;
    }
    s3pane::log_error("%s: %s", result.failed_item.c_str(), result.error_message.c_str());
    return 1;
}

int report(const s3pane::OpResult& result) {
    if (result.success) return 0;
    if (result.cancelled) {
        s3pane::log_warn("%s", result.error_message.c_str());
        return 130;
    }
    s3pane::log_error("%s", result.error_message.c_str());
    return 1;
}

// Operands ending in '/' are folders; otherwise a key that exists is a file
s3pane::RemoteItem classify(s3pane::ObjectStore& store, const std::string& operand) {
    if (!operand.empty() && operand.back() == '/') {
        return s3pane::RemoteItem::dir(operand);
    }
    s3pane::HeadResult head = store.head(operand);
    if (head.status == s3pane::ExistsStatus::Exists) {
        return s3pane::RemoteItem::file(operand);
    }
    return s3pane::RemoteItem::dir(operand);
}

int run_browse(s3pane::RemoteBrowser& browser, const std::string& start) {
    browser.set_prefix(start);
    constexpr auto kListTimeout = std::chrono::minutes(10);

    auto show = [&]() {
        s3pane::PrefixListing listing = browser.refresh_and_wait(kListTimeout);
        printf("s3pane: /%s\n", browser.prefix().c_str());
        if (!listing.success) {
            s3pane::log_error("%s", listing.error_message.c_str());
            return;
        }
        print_listing(listing);
    };

    show();
    while (true) {
        std::cerr << "s3pane:/" << browser.prefix() << "> " << std::flush;
        std::string line;
        if (!read_line(line)) break;

        std::string cmd = line.substr(0, line.find(' '));
        std::string arg = line.size() > cmd.size() ? line.substr(cmd.size() + 1) : "";

        if (cmd.empty()) continue;
        if (cmd == "quit" || cmd == "exit" || cmd == "q") break;
        if (cmd == "ls") {
            show();
        } else if (cmd == "cd") {
            if (arg == "/" || arg.empty()) {
                browser.set_prefix("");
            } else {
                browser.enter(arg);
            }
            show();
        } else if (cmd == "up" || cmd == "..") {
            browser.up();
            show();
        } else if (cmd == "pwd") {
            printf("/%s\n", browser.prefix().c_str());
        } else {
            std::cerr << "commands: ls, cd <dir>, up, pwd, quit\n";
        }
    }
    return 0;
}

int run_command(const s3pane::Settings& settings, s3pane::ObjectStore& store,
                s3pane::FileManager& files, s3pane::RemoteBrowser& browser,
                s3pane::ProgressSink& progress, StdioPrompt& prompt,
                const s3pane::CancelFlag& cancel) {
    const auto& args = settings.command;
    const std::string& cmd = args[0];
    const size_t nargs = args.size() - 1;

    auto usage = [&](const char* text) {
        std::cerr << "Usage: s3pane " << text << "\n";
        return 2;
    };

    if (cmd == "ls") {
        s3pane::PrefixLister lister(store);
        s3pane::PrefixListing listing = lister.list(nargs >= 1 ? args[1] : "", cancel);
        if (!listing.success) {
            s3pane::log_error("%s", listing.error_message.c_str());
            return listing.cancelled ? 130 : 1;
        }
        print_listing(listing);
        return 0;
    }

    if (cmd == "tree") {
        s3pane::TreeWalker walker(store);
        s3pane::WalkResult walk = walker.walk_file_keys(
            nargs >= 1 ? args[1] : "",
            [](const std::string& key) {
                printf("%s\n", key.c_str());
                return true;
            },
            cancel);
        if (!walk.success) {
            s3pane::log_error("%s", walk.error_message.c_str());
            return walk.cancelled ? 130 : 1;
        }
        if (!walk.complete) {
            s3pane::log_warn("Some folders could not be listed completely");
        }
        return 0;
    }

    if (cmd == "stat") {
        if (nargs != 1) return usage("stat <key>");
        s3pane::HeadResult head = store.head(args[1]);
        printf("%s: %s", store.display_uri(args[1]).c_str(), s3pane::exists_status_to_string(head.status));
        if (head.size) printf(", %s (%llu bytes)", s3pane::human_size(*head.size).c_str(),
                              static_cast<unsigned long long>(*head.size));
        if (head.last_modified) printf(", modified %s", format_time(head.last_modified).c_str());
        printf("\n");
        if (!head.error_message.empty() && head.status != s3pane::ExistsStatus::NotFound) {
            s3pane::log_warn("%s", head.error_message.c_str());
        }
        return head.exists() ? 0 : 1;
    }

    if (cmd == "put") {
        if (nargs < 2) return usage("put <file>... <prefix>");
        std::vector<std::filesystem::path> locals(args.begin() + 1, args.end() - 1);
        return report(files.upload_files(locals, args.back(), &progress, cancel), "Uploaded");
    }

    if (cmd == "get") {
        if (nargs < 1) return usage("get <key|dir/>... [local-dir]");
        std::filesystem::path local_dir;
        size_t last = args.size();
        if (nargs >= 2) {
            local_dir = args.back();
            last = args.size() - 1;
        } else {
            local_dir = settings.local_root.empty() ? std::filesystem::path(".") : settings.local_root;
        }
        std::vector<s3pane::RemoteItem> items;
        for (size_t i = 1; i < last; i++) items.push_back(classify(store, args[i]));
        return report(files.download(items, local_dir, &progress, cancel), "Downloaded");
    }

    if (cmd == "rm") {
        if (nargs < 1) return usage("rm <key|dir/>...");
        std::vector<s3pane::RemoteItem> items;
        std::string listing;
        for (size_t i = 1; i < args.size(); i++) {
            items.push_back(classify(store, args[i]));
            listing += "  " + args[i] + (items.back().kind == s3pane::EntryKind::Dir ? " (folder)\n" : "\n");
        }
        if (!prompt.confirm("Delete from remote", "Delete these items?\n" + listing)) {
            s3pane::log_info("Nothing deleted");
            return 0;
        }
        return report(files.delete_remote(items, cancel), "Deleted");
    }

    if (cmd == "mv") {
        if (nargs != 2) return usage("mv <key> <new-name>");
        return report(files.rename_remote(args[1], args[2]));
    }

    if (cmd == "mkdir") {
        if (nargs != 2) return usage("mkdir <prefix> <name>");
        return report(files.create_folder(args[1], args[2]));
    }

    if (cmd == "rm-local") {
        if (nargs < 1) return usage("rm-local <path>...");
        std::vector<std::filesystem::path> paths(args.begin() + 1, args.end());
        std::string listing;
        for (const auto& p : paths) listing += "  " + p.string() + "\n";
        if (!prompt.confirm("Delete local", "Delete these local items?\n" + listing)) {
            s3pane::log_info("Nothing deleted");
            return 0;
        }
        return report(files.delete_local(paths), "Deleted");
    }

    if (cmd == "browse") {
        return run_browse(browser, nargs >= 1 ? args[1] : "");
    }

    std::cerr << "Unknown command: " << cmd << " (see --help)\n";
    return 2;
}
}  // namespace

int main(int argc, char* argv[]) {
    auto settings_opt = s3pane::Settings::from_args(argc, argv);
    if (!settings_opt) {
        return 1;
    }
    const s3pane::Settings settings = std::move(*settings_opt);

    auto err = settings.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }
    if (settings.command.empty()) {
        std::cerr << "No command given (see --help)\n";
        return 1;
    }

    s3pane::set_log_verbose(settings.verbose);

    // Redirect log output if log file specified
    if (!settings.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(settings.log_file.parent_path(), ec);
        FILE* log = fopen(settings.log_file.c_str(), "a");
        if (!log) {
            std::cerr << "Cannot open log file " << settings.log_file << "\n";
            return 1;
        }
        dup2(fileno(log), STDERR_FILENO);
        fclose(log);
    }

    s3pane::CancelFlag cancel = s3pane::make_cancel_flag();
    g_cancel = cancel.get();

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    s3pane::log_debug("Endpoint %s, bucket %s, region %s, %s addressing",
                      settings.endpoint.empty() ? "(aws)" : settings.endpoint.c_str(),
                      settings.bucket.c_str(), settings.region.c_str(),
                      settings.use_path_style ? "path-style" : "virtual-host");

    std::unique_ptr<s3pane::MetricsExporter> metrics;
    if (!settings.metrics_file.empty()) {
        metrics = std::make_unique<s3pane::MetricsExporter>(
            settings.metrics_file, std::chrono::seconds(settings.metrics_interval_secs),
            std::map<std::string, std::string>{{"bucket", settings.bucket}});
        metrics->start();
    }

    auto store = s3pane::ObjectStoreFactory::create_s3(settings.store_config());
    s3pane::TransferPlanner planner(settings.transfer_overrides());
    s3pane::TransferService transfers(*store, planner);
    StdioPrompt prompt(settings.on_conflict, settings.assume_yes);
    s3pane::FileManager files(*store, transfers, prompt);
    s3pane::RemoteBrowser browser(*store, prompt);
    TerminalProgress progress;

    if (metrics) {
        transfers.set_metrics(metrics.get());
        files.set_metrics(metrics.get());
        browser.set_metrics(metrics.get());
    }

    int rc = run_command(settings, *store, files, browser, progress, prompt, cancel);

    browser.worker().stop();
    if (metrics) metrics->stop();
    g_cancel = nullptr;
    return rc;
}
