#include <nrx/llm/local_provider.hpp>
#include <nrx/llm/download_monitor.hpp>
#include <nrx/llm/error_messages.hpp>
#include <nrx/llm/prompt_format.hpp>

#include <sstream>

namespace nrx::llm {

LocalRuntimeProvider::LocalRuntimeProvider(ModelDefinition model,
                                           const EngineConfig& config,
                                           InferenceRuntime* runtime,
                                           Downloader* downloader,
                                           Logger& logger)
    : model_(std::move(model))
    , models_dir_(config.models_dir)
    , sandboxed_(config.sandboxed)
    , poll_interval_(config.download_poll_interval)
    , min_free_space_factor_(config.min_free_space_factor)
    , runtime_(runtime)
    , downloader_(downloader)
    , logger_(logger) {}

LocalRuntimeProvider::~LocalRuntimeProvider() {
    cleanup();
}

ProviderInfo LocalRuntimeProvider::info() const {
    ProviderInfo pinfo;
    pinfo.name = "llama-" + model_.tier;
    pinfo.is_local = true;
    pinfo.platform_model = false;
    return pinfo;
}

bool LocalRuntimeProvider::is_available() {
    return !sandboxed_ && runtime_ != nullptr;
}

fs::path LocalRuntimeProvider::model_path() const {
    return models_dir_ / model_.filename;
}

bool LocalRuntimeProvider::is_model_downloaded() const {
    std::error_code ec;
    const fs::path path = model_path();
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    uint64_t size = fs::file_size(path, ec);
    if (ec || model_.size_bytes == 0) {
        return false;
    }
    double ratio = static_cast<double>(size) / static_cast<double>(model_.size_bytes);
    return ratio >= MIN_SIZE_RATIO && ratio <= MAX_SIZE_RATIO;
}

uint64_t LocalRuntimeProvider::model_size() const {
    std::error_code ec;
    const fs::path path = model_path();
    if (!fs::is_regular_file(path, ec)) {
        return 0;
    }
    uint64_t size = fs::file_size(path, ec);
    return ec ? 0 : size;
}

Result<void> LocalRuntimeProvider::initialize(ProgressCallback on_progress) {
    std::lock_guard<std::mutex> lock(context_mutex_);
    return initialize_locked(on_progress);
}

Result<void> LocalRuntimeProvider::initialize_locked(const ProgressCallback& on_progress) {
    if (context_) {
        return {};
    }

    if (!is_available()) {
        status_ = ProviderStatus::UNSUPPORTED;
        return Error(ErrorCode::RUNTIME_UNAVAILABLE, messages::RUNTIME_UNAVAILABLE);
    }

    status_ = ProviderStatus::CHECKING;
    if (!is_model_downloaded()) {
        status_ = ProviderStatus::DOWNLOADING;

        DownloadProgressCallback forward;
        if (on_progress) {
            forward = [&on_progress](const DownloadProgress& p) {
                on_progress(static_cast<float>(p.percentage) / 100.0f);
            };
        }

        auto downloaded = download_model(forward);
        if (!downloaded.ok()) {
            status_ = ProviderStatus::ERROR;
            return downloaded.error();
        }
    }

    status_ = ProviderStatus::INITIALIZING;

    std::ostringstream ss;
    ss << "[LocalRuntimeProvider] Initializing " << model_.name
       << " - ctx=" << model_.context_size << ", threads=" << model_.threads;
    logger_.info(ss.str());

    RuntimeParams params;
    params.model_path = model_path().string();
    params.n_ctx = model_.context_size;
    params.n_threads = model_.threads;
    params.n_gpu_layers = 0;

    auto context = runtime_->init(params);
    if (!context.ok()) {
        status_ = ProviderStatus::ERROR;
        logger_.error("[LocalRuntimeProvider] " + context.error().to_string());
        return context.error();
    }

    context_ = std::move(context.value());
    status_ = ProviderStatus::READY;
    logger_.info("[LocalRuntimeProvider] " + model_.name + " initialized successfully");
    return {};
}

Result<std::string> LocalRuntimeProvider::generate(const std::string& system_prompt,
                                                   const std::string& user_message) {
    std::lock_guard<std::mutex> lock(context_mutex_);

    auto init = initialize_locked(nullptr);
    if (!init.ok()) {
        return init.error();
    }

    std::string prompt = truncate_prompt(
        format_prompt(model_.dialect, system_prompt, user_message),
        model_.context_size);

    // Every request starts from an empty cache
    auto cleared = context_->clear_cache(false);
    if (!cleared.ok()) {
        return cleared.error();
    }

    CompletionParams params;
    params.prompt = std::move(prompt);
    params.n_predict = MAX_NEW_TOKENS;
    params.temperature = LOCAL_TEMPERATURE;
    params.top_p = LOCAL_TOP_P;
    params.stop = model_.stop_tokens;

    auto output = context_->completion(params, nullptr);
    if (!output.ok()) {
        return output.error();
    }
    return output->text.value_or("");
}

void LocalRuntimeProvider::cleanup() {
    std::lock_guard<std::mutex> lock(context_mutex_);
    cleanup_locked();
}

void LocalRuntimeProvider::cleanup_locked() {
    if (context_) {
        auto released = context_->release();
        if (!released.ok()) {
            logger_.error("[LocalRuntimeProvider] Error releasing context: " +
                          released.error().to_string());
        }
        context_.reset();
    }
    status_ = ProviderStatus::UNINITIALIZED;
}

Result<void> LocalRuntimeProvider::check_free_space() const {
    std::error_code ec;
    fs::space_info space = fs::space(models_dir_, ec);
    if (ec) {
        // Unknown free space: let the transfer itself fail if it must
        return {};
    }

    auto required = static_cast<uint64_t>(
        static_cast<double>(model_.size_bytes) * min_free_space_factor_);
    if (space.available < required) {
        return Error(ErrorCode::OUT_OF_SPACE,
            "Insufficient storage space: need " + std::to_string(required) +
            " bytes free, have " + std::to_string(space.available));
    }
    return {};
}

void LocalRuntimeProvider::remove_model_file() {
    std::error_code ec;
    fs::remove(model_path(), ec);
    if (ec) {
        logger_.warning("[LocalRuntimeProvider] Could not remove " +
                        model_path().string() + ": " + ec.message());
    }
}

Result<void> LocalRuntimeProvider::download_model(DownloadProgressCallback on_progress) {
    if (is_model_downloaded()) {
        return {};
    }

    download_cancelled_ = false;

    std::error_code ec;
    fs::create_directories(models_dir_, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
            "Cannot create " + models_dir_.string() + ": " + ec.message());
    }

    auto space = check_free_space();
    if (!space.ok()) {
        return space;
    }

    if (!downloader_) {
        return Error(ErrorCode::NETWORK_ERROR, "No downloader configured");
    }

    const fs::path path = model_path();
    Result<void> transfer;
    {
        DownloadMonitor monitor(path, model_.size_bytes, poll_interval_,
                                download_cancelled_, on_progress);
        try {
            transfer = downloader_->download(model_.download_url, path, download_cancelled_);
        } catch (const std::exception& e) {
            transfer = Error(ErrorCode::NETWORK_ERROR, e.what());
        } catch (...) {
            transfer = Error(ErrorCode::NETWORK_ERROR, messages::DOWNLOAD_FAILED);
        }
    }

    if (download_cancelled_) {
        remove_model_file();
        logger_.info("[LocalRuntimeProvider] Download of " + model_.name + " cancelled");
        return Error(ErrorCode::CANCELLED, messages::DOWNLOAD_CANCELLED);
    }

    if (!transfer.ok()) {
        remove_model_file();
        logger_.error("[LocalRuntimeProvider] Download failed: " + transfer.error().to_string());
        return transfer;
    }

    if (!is_model_downloaded()) {
        remove_model_file();
        logger_.error("[LocalRuntimeProvider] " + model_.name + " failed size verification");
        return Error(ErrorCode::CORRUPTION, messages::DOWNLOAD_INTEGRITY);
    }

    if (on_progress) {
        DownloadProgress done;
        done.bytes_downloaded = model_.size_bytes;
        done.total_bytes = model_.size_bytes;
        done.percentage = 100;
        on_progress(done);
    }

    logger_.info("[LocalRuntimeProvider] " + model_.name + " downloaded and verified");
    return Ok();
}

void LocalRuntimeProvider::cancel_download() {
    download_cancelled_ = true;
}

void LocalRuntimeProvider::delete_model() {
    cleanup();

    std::error_code ec;
    const fs::path path = model_path();
    if (fs::exists(path, ec)) {
        remove_model_file();
        logger_.info("[LocalRuntimeProvider] " + model_.name + " model deleted");
    }
    status_ = ProviderStatus::UNINITIALIZED;
}

}  // namespace nrx::llm
