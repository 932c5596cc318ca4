#pragma once
#include "config.hpp"
#include "render_cache/types.hpp"
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <cstdint>

namespace docserve {

// Polls a directory tree and reports added, modified and removed documents.
// Paths are reported relative to the root with '/' separators, matching the
// file paths the site uses when caching renders.
class PollingWatcher {
public:
    using Handler = std::function<void(const FileChangeEvent&)>;

    PollingWatcher(std::string root, WatcherConfig config);
    ~PollingWatcher();

    // Record the current tree as the baseline without reporting anything.
    void prime();

    // Compare the tree against the previous snapshot and return the
    // differences. Before prime(), every file is reported as Add.
    std::vector<FileChangeEvent> scan();

    // Prime, then scan every poll_interval_ms on a background thread and
    // pass each event to `handler`.
    bool start(Handler handler, std::string& error);
    void stop();

    // True if a relative path has a watched extension and no excluded
    // directory component.
    bool is_watched(const std::string& relative_path) const;

    size_t tracked_count() const;

private:
    std::map<std::string, uint64_t> snapshot() const;
    void poll_loop();

    std::string root_;
    WatcherConfig config_;
    Handler handler_;

    mutable std::mutex scan_mutex_;
    std::map<std::string, uint64_t> known_;

    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace docserve
