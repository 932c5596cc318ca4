#include "watcher.hpp"
#include "util.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace docserve {

PollingWatcher::PollingWatcher(std::string root, WatcherConfig config)
    : root_(std::move(root)), config_(std::move(config))
{
    for (auto& ext : config_.extensions) ext = to_lower(ext);
}

PollingWatcher::~PollingWatcher() {
    stop();
}

bool PollingWatcher::is_watched(const std::string& relative_path) const {
    auto parts = split(relative_path, '/');
    if (parts.empty()) return false;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (std::find(config_.exclude_dirs.begin(), config_.exclude_dirs.end(), parts[i])
                != config_.exclude_dirs.end())
            return false;
    }
    if (config_.extensions.empty()) return true;
    std::string ext = to_lower(fs::path(parts.back()).extension().string());
    return std::find(config_.extensions.begin(), config_.extensions.end(), ext)
               != config_.extensions.end();
}

std::map<std::string, uint64_t> PollingWatcher::snapshot() const {
    std::map<std::string, uint64_t> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "[watcher] Cannot scan " << root_ << ": " << ec.message() << "\n";
        return files;
    }

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            std::cerr << "[watcher] Scan of " << root_ << " interrupted: " << ec.message() << "\n";
            break;
        }
        const auto& entry = *it;
        std::string name = entry.path().filename().string();

        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            if (std::find(config_.exclude_dirs.begin(), config_.exclude_dirs.end(), name)
                    != config_.exclude_dirs.end())
                it.disable_recursion_pending();
            continue;
        }
        if (!entry.is_regular_file(type_ec)) continue;

        std::string rel = fs::relative(entry.path(), root_, type_ec).generic_string();
        if (type_ec || !is_watched(rel)) continue;

        uint64_t mtime = 0;
        if (file_mtime_millis(entry.path().string(), mtime)) files[rel] = mtime;
    }
    return files;
}

void PollingWatcher::prime() {
    auto current = snapshot();
    std::lock_guard<std::mutex> lock(scan_mutex_);
    known_ = std::move(current);
}

std::vector<FileChangeEvent> PollingWatcher::scan() {
    auto current = snapshot();
    std::vector<FileChangeEvent> events;

    std::lock_guard<std::mutex> lock(scan_mutex_);
    for (const auto& [path, mtime] : current) {
        auto it = known_.find(path);
        if (it == known_.end()) {
            events.push_back({path, FileChangeKind::Add, mtime});
        } else if (it->second != mtime) {
            events.push_back({path, FileChangeKind::Change, mtime});
        }
    }
    for (const auto& [path, mtime] : known_) {
        if (current.find(path) == current.end()) {
            events.push_back({path, FileChangeKind::Unlink, std::nullopt});
        }
    }
    known_ = std::move(current);
    return events;
}

size_t PollingWatcher::tracked_count() const {
    std::lock_guard<std::mutex> lock(scan_mutex_);
    return known_.size();
}

bool PollingWatcher::start(Handler handler, std::string& error) {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        error = "Not a directory: " + root_;
        return false;
    }
    if (running_.exchange(true)) {
        error = "Watcher already running";
        return false;
    }
    handler_ = std::move(handler);
    prime();
    std::cerr << "[watcher] Watching " << tracked_count() << " files under " << root_
              << " every " << config_.poll_interval_ms << "ms\n";
    thread_ = std::thread([this]() { poll_loop(); });
    return true;
}

void PollingWatcher::stop() {
    if (!running_.exchange(false)) return;
    { std::lock_guard<std::mutex> lock(wake_mutex_); }
    wake_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void PollingWatcher::poll_loop() {
    auto interval = std::chrono::milliseconds(std::max<uint32_t>(config_.poll_interval_ms, 10));
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_.wait_for(lock, interval, [this]() { return !running_.load(); });
        }
        if (!running_.load()) break;

        for (const auto& ev : scan()) {
            try {
                handler_(ev);
            } catch (const std::exception& e) {
                std::cerr << "[watcher] Handler failed for " << ev.path << ": "
                          << e.what() << "\n";
            }
        }
    }
}

} // namespace docserve
