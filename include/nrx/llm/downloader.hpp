#pragma once

#include <nrx/result.hpp>
#include <nrx/util/logger.hpp>

#include <atomic>
#include <filesystem>
#include <string>

namespace nrx {
namespace fs = std::filesystem;
}  // namespace nrx

namespace nrx::llm {

/**
 * Streams a remote URL into a local file.
 *
 * Implementations write straight into `destination` so that its growing
 * size can be observed while the transfer runs. `cancel` is a request
 * only; an implementation may stop early when it sees it set, or finish
 * the transfer and let the caller clean up.
 */
class Downloader {
public:
    virtual ~Downloader() = default;

    virtual Result<void> download(const std::string& url,
                                  const fs::path& destination,
                                  const std::atomic<bool>& cancel) = 0;
};

struct CurlDownloaderConfig {
    long connect_timeout_s = 30;
    long low_speed_limit = 1024;   // bytes/s
    long low_speed_time_s = 60;    // abort if below limit this long
    std::string user_agent = "nrx/1.0";
};

/**
 * libcurl implementation. Follows redirects, fails on HTTP >= 400 and
 * aborts between chunks once cancellation is requested.
 */
class CurlDownloader : public Downloader {
public:
    explicit CurlDownloader(Logger& logger, CurlDownloaderConfig config = {});

    Result<void> download(const std::string& url,
                          const fs::path& destination,
                          const std::atomic<bool>& cancel) override;

private:
    Logger& logger_;
    CurlDownloaderConfig config_;
};

}  // namespace nrx::llm
