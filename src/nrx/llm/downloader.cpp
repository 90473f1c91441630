#include <nrx/llm/downloader.hpp>

#include <curl/curl.h>

#include <cstdio>
#include <mutex>

namespace nrx::llm {

namespace {

size_t file_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* file = static_cast<std::FILE*>(userdata);
    return std::fwrite(ptr, size, nmemb, file) * size;
}

// Non-zero return makes curl abort with CURLE_ABORTED_BY_CALLBACK
int cancel_check_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const std::atomic<bool>*>(clientp);
    return cancel->load() ? 1 : 0;
}

void init_curl_once() {
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

}  // namespace

CurlDownloader::CurlDownloader(Logger& logger, CurlDownloaderConfig config)
    : logger_(logger), config_(std::move(config)) {}

Result<void> CurlDownloader::download(const std::string& url,
                                      const fs::path& destination,
                                      const std::atomic<bool>& cancel) {
    init_curl_once();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return Error(ErrorCode::INTERNAL_ERROR, "Failed to initialize CURL");
    }

    std::FILE* file = std::fopen(destination.string().c_str(), "wb");
    if (!file) {
        curl_easy_cleanup(curl);
        return Error(ErrorCode::IO_ERROR, "Cannot open " + destination.string() + " for writing");
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, file_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, static_cast<void*>(file));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config_.connect_timeout_s);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, config_.low_speed_limit);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, config_.low_speed_time_s);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, cancel_check_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA,
                     static_cast<void*>(const_cast<std::atomic<bool>*>(&cancel)));
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    logger_.debug("[CurlDownloader] GET " + url + " -> " + destination.string());

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    bool write_failed = std::fclose(file) != 0;

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return Error(ErrorCode::CANCELLED, "Transfer aborted");
    }
    if (res == CURLE_HTTP_RETURNED_ERROR) {
        return Error(ErrorCode::NETWORK_ERROR,
            "Server returned HTTP " + std::to_string(http_code));
    }
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return Error(ErrorCode::NETWORK_ERROR, "Download timed out: " + url);
    }
    if (res == CURLE_WRITE_ERROR || write_failed) {
        return Error(ErrorCode::IO_ERROR, "Failed writing " + destination.string());
    }
    if (res != CURLE_OK) {
        return Error(ErrorCode::NETWORK_ERROR, curl_easy_strerror(res));
    }

    return {};
}

}  // namespace nrx::llm
