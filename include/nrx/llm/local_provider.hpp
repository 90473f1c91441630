#pragma once

#include "downloader.hpp"
#include "inference_runtime.hpp"
#include "model_catalog.hpp"
#include "provider.hpp"

#include <nrx/config.hpp>
#include <nrx/util/logger.hpp>

#include <atomic>
#include <memory>
#include <mutex>

namespace nrx::llm {

constexpr float LOCAL_TEMPERATURE = 0.7f;
constexpr float LOCAL_TOP_P = 0.9f;

// Accepted on-disk size range, relative to the catalog size
constexpr double MIN_SIZE_RATIO = 0.80;
constexpr double MAX_SIZE_RATIO = 1.20;

/**
 * Backend that runs a downloaded GGUF model through the embedded runtime.
 *
 * Owns the model file lifecycle (download, size verification, delete)
 * and one inference context. The file itself is the only persisted
 * state: a file whose size is within 20% of the catalog size counts as
 * downloaded.
 *
 * generate() clears the runtime cache before every call, so calls on
 * one instance are serialized.
 */
class LocalRuntimeProvider : public LLMProvider, public ModelStore {
public:
    /**
     * @param model      Catalog entry to serve
     * @param config     Models directory, sandbox flag, download tuning
     * @param runtime    Embedded runtime, or nullptr if it failed to load
     * @param downloader Transfer implementation for the model file
     */
    LocalRuntimeProvider(ModelDefinition model,
                         const EngineConfig& config,
                         InferenceRuntime* runtime,
                         Downloader* downloader,
                         Logger& logger);
    ~LocalRuntimeProvider() override;

    LocalRuntimeProvider(const LocalRuntimeProvider&) = delete;
    LocalRuntimeProvider& operator=(const LocalRuntimeProvider&) = delete;

    // LLMProvider interface
    ProviderInfo info() const override;
    bool is_available() override;
    Result<void> initialize(ProgressCallback on_progress = nullptr) override;
    Result<std::string> generate(const std::string& system_prompt,
                                 const std::string& user_message) override;
    void cleanup() override;
    ProviderStatus status() const override { return status_; }
    ModelStore* model_store() override { return this; }

    // ModelStore interface
    bool is_model_downloaded() const override;
    Result<void> download_model(DownloadProgressCallback on_progress = nullptr) override;
    void cancel_download() override;
    void delete_model() override;
    uint64_t model_size() const override;
    const ModelDefinition& model_definition() const override { return model_; }

    fs::path model_path() const;

private:
    ModelDefinition model_;
    fs::path models_dir_;
    bool sandboxed_;
    std::chrono::milliseconds poll_interval_;
    double min_free_space_factor_;

    InferenceRuntime* runtime_;
    Downloader* downloader_;
    Logger& logger_;

    std::unique_ptr<InferenceContext> context_;
    std::mutex context_mutex_;
    std::atomic<ProviderStatus> status_{ProviderStatus::UNINITIALIZED};
    std::atomic<bool> download_cancelled_{false};

    Result<void> initialize_locked(const ProgressCallback& on_progress);
    void cleanup_locked();
    Result<void> check_free_space() const;
    void remove_model_file();
};

}  // namespace nrx::llm
