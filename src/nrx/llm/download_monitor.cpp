#include <nrx/llm/download_monitor.hpp>

#include <algorithm>
#include <cmath>

namespace nrx::llm {

DownloadMonitor::DownloadMonitor(fs::path file, uint64_t total_bytes,
                                 std::chrono::milliseconds interval,
                                 const std::atomic<bool>& cancelled,
                                 DownloadProgressCallback on_progress)
    : file_(std::move(file))
    , total_bytes_(total_bytes)
    , interval_(interval)
    , cancelled_(cancelled)
    , on_progress_(std::move(on_progress))
    , start_(std::chrono::steady_clock::now()) {
    thread_ = std::thread([this]() { run(); });
}

DownloadMonitor::~DownloadMonitor() {
    stop();
}

void DownloadMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void DownloadMonitor::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!cv_.wait_for(lock, interval_, [this]() { return stopping_; })) {
        lock.unlock();
        poll_once();
        lock.lock();
    }
}

void DownloadMonitor::poll_once() {
    if (cancelled_ || !on_progress_) {
        return;
    }

    std::error_code ec;
    if (!fs::exists(file_, ec)) {
        return;
    }
    uint64_t bytes = fs::file_size(file_, ec);
    if (ec) {
        return;
    }

    on_progress_(compute(bytes, total_bytes_, std::chrono::steady_clock::now() - start_));
}

DownloadProgress DownloadMonitor::compute(uint64_t bytes, uint64_t total,
                                          std::chrono::steady_clock::duration elapsed) {
    DownloadProgress progress;
    progress.bytes_downloaded = bytes;
    progress.total_bytes = total;

    if (total > 0) {
        double pct = std::round(static_cast<double>(bytes) / static_cast<double>(total) * 100.0);
        progress.percentage = static_cast<int>(std::min(99.0, pct));
    }

    double seconds = std::chrono::duration<double>(elapsed).count();
    double bytes_per_second = seconds > 0.0 ? static_cast<double>(bytes) / seconds : 0.0;
    if (bytes_per_second > 0.0) {
        double remaining = bytes < total ? static_cast<double>(total - bytes) : 0.0;
        progress.estimated_seconds_remaining =
            static_cast<int>(std::round(remaining / bytes_per_second));
    }
    return progress;
}

}  // namespace nrx::llm
