#pragma once

#include "device_classifier.hpp"
#include "downloader.hpp"
#include "foundation_bridge.hpp"
#include "inference_runtime.hpp"
#include "model_catalog.hpp"
#include "provider.hpp"

#include <nrx/config.hpp>
#include <nrx/util/logger.hpp>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace nrx::llm {

// ============================================================================
// Provider Factory
// ============================================================================

/**
 * Builds the three kinds of backend the manager can commit to.
 * Tests substitute their own.
 */
class ProviderFactory {
public:
    virtual ~ProviderFactory() = default;

    virtual ProviderPtr make_foundation() = 0;
    virtual ProviderPtr make_local(const ModelDefinition& model) = 0;
    virtual ProviderPtr make_unsupported() = 0;
};

class DefaultProviderFactory : public ProviderFactory {
public:
    /**
     * Collaborators that are absent on this host are passed as nullptr;
     * the providers built from them then report themselves unavailable.
     */
    DefaultProviderFactory(EngineConfig config,
                           std::string host_os,
                           FoundationBridge* bridge,
                           InferenceRuntime* runtime,
                           Downloader* downloader,
                           Logger& logger);

    ProviderPtr make_foundation() override;
    ProviderPtr make_local(const ModelDefinition& model) override;
    ProviderPtr make_unsupported() override;

private:
    EngineConfig config_;
    std::string host_os_;
    FoundationBridge* bridge_;
    InferenceRuntime* runtime_;
    Downloader* downloader_;
    Logger& logger_;
};

// ============================================================================
// Provider Manager
// ============================================================================

/**
 * Picks exactly one backend for the device and fronts its lifecycle.
 *
 * Resolution order: platform foundation model, then the local runtime
 * with the largest catalog model that fits in RAM, then the unsupported
 * fallback. The committed backend stays until cleanup()/reset().
 *
 * Thread-safe. Callers that arrive while a resolution is running wait
 * for that resolution instead of starting their own.
 */
class ProviderManager {
public:
    ProviderManager(DeviceClassifier& classifier, ProviderFactory& factory, Logger& logger);
    ~ProviderManager();

    ProviderManager(const ProviderManager&) = delete;
    ProviderManager& operator=(const ProviderManager&) = delete;

    // No-op when already resolved
    void resolve();

    // Resolves first if needed, then initializes the committed backend
    Result<void> initialize(ProgressCallback on_progress = nullptr);

    /**
     * Generate with the committed backend.
     *
     * Fails with NOT_READY unless the backend has been initialized; this
     * call never initializes or downloads on its own.
     */
    Result<std::string> generate(const std::string& system_prompt,
                                 const std::string& user_message);

    ProviderStatus get_status() const;
    std::string provider_name() const;  // "none" before resolution
    std::optional<DeviceClassification> classification() const;
    bool is_resolved() const;

    // Model management; meaningful only for the local runtime backend

    // True for a platform model backend, which has nothing to download
    bool is_model_downloaded();
    Result<void> download_model(DownloadProgressCallback on_progress = nullptr);
    void cancel_download();

    // These act on the committed backend only and never trigger resolution
    Result<void> delete_model();
    uint64_t model_size() const;
    std::optional<ModelDefinition> model_config() const;

    // Tear down the backend and forget the classification
    void cleanup();
    void reset() { cleanup(); }

private:
    DeviceClassifier& classifier_;
    ProviderFactory& factory_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::condition_variable resolve_cv_;
    bool resolving_ = false;
    std::shared_ptr<LLMProvider> provider_;
    std::optional<DeviceClassification> classification_;

    std::shared_ptr<LLMProvider> current() const;
    ProviderPtr select_provider(const DeviceClassification& device);
    ProviderPtr try_provider(ProviderPtr candidate);
};

}  // namespace nrx::llm
