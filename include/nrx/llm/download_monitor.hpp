#pragma once

#include "provider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <thread>

namespace nrx {
namespace fs = std::filesystem;
}  // namespace nrx

namespace nrx::llm {

/**
 * Reports progress of a transfer by polling the size of the file it is
 * writing.
 *
 * Runs its own thread from construction until stop() or destruction.
 * Reports nothing while `cancelled` is set or the file does not exist
 * yet. The percentage stays at 99 or below; the owner reports 100
 * once the file has been verified.
 */
class DownloadMonitor {
public:
    DownloadMonitor(fs::path file, uint64_t total_bytes,
                    std::chrono::milliseconds interval,
                    const std::atomic<bool>& cancelled,
                    DownloadProgressCallback on_progress);
    ~DownloadMonitor();

    DownloadMonitor(const DownloadMonitor&) = delete;
    DownloadMonitor& operator=(const DownloadMonitor&) = delete;

    // Joins the polling thread; no callback runs after this returns
    void stop();

    // Progress for `bytes` of `total` after `elapsed`
    static DownloadProgress compute(uint64_t bytes, uint64_t total,
                                    std::chrono::steady_clock::duration elapsed);

private:
    fs::path file_;
    uint64_t total_bytes_;
    std::chrono::milliseconds interval_;
    const std::atomic<bool>& cancelled_;
    DownloadProgressCallback on_progress_;
    std::chrono::steady_clock::time_point start_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::thread thread_;

    void run();
    void poll_once();
};

}  // namespace nrx::llm
