#include <nrx/llm/provider_manager.hpp>
#include <nrx/llm/error_messages.hpp>
#include <nrx/llm/foundation_provider.hpp>
#include <nrx/llm/local_provider.hpp>
#include <nrx/llm/unsupported_provider.hpp>

#include <sstream>

namespace nrx::llm {

// ============================================================================
// DefaultProviderFactory
// ============================================================================

DefaultProviderFactory::DefaultProviderFactory(EngineConfig config,
                                               std::string host_os,
                                               FoundationBridge* bridge,
                                               InferenceRuntime* runtime,
                                               Downloader* downloader,
                                               Logger& logger)
    : config_(std::move(config))
    , host_os_(std::move(host_os))
    , bridge_(bridge)
    , runtime_(runtime)
    , downloader_(downloader)
    , logger_(logger) {}

ProviderPtr DefaultProviderFactory::make_foundation() {
    return std::make_unique<FoundationProvider>(bridge_, host_os_, logger_);
}

ProviderPtr DefaultProviderFactory::make_local(const ModelDefinition& model) {
    return std::make_unique<LocalRuntimeProvider>(model, config_, runtime_, downloader_, logger_);
}

ProviderPtr DefaultProviderFactory::make_unsupported() {
    return std::make_unique<UnsupportedProvider>();
}

// ============================================================================
// ProviderManager
// ============================================================================

namespace {

// Clears the in-flight flag and wakes waiters however resolve() exits
class ResolveGuard {
public:
    ResolveGuard(std::mutex& mutex, bool& flag, std::condition_variable& cv)
        : mutex_(mutex), flag_(flag), cv_(cv) {}

    ~ResolveGuard() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            flag_ = false;
        }
        cv_.notify_all();
    }

private:
    std::mutex& mutex_;
    bool& flag_;
    std::condition_variable& cv_;
};

}  // namespace

ProviderManager::ProviderManager(DeviceClassifier& classifier,
                                 ProviderFactory& factory,
                                 Logger& logger)
    : classifier_(classifier), factory_(factory), logger_(logger) {}

ProviderManager::~ProviderManager() {
    cleanup();
}

std::shared_ptr<LLMProvider> ProviderManager::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return provider_;
}

void ProviderManager::resolve() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        resolve_cv_.wait(lock, [this]() { return !resolving_; });
        if (provider_) {
            return;
        }
        resolving_ = true;
    }

    ResolveGuard guard(mutex_, resolving_, resolve_cv_);

    DeviceClassification device = classifier_.classify();

    std::ostringstream ss;
    ss << "[ProviderManager] Device " << device.model << " (" << device.architecture
       << ", " << device.ram_gb << " GB) classified as " << tier_name(device.tier);
    logger_.info(ss.str());

    ProviderPtr chosen;
    try {
        chosen = select_provider(device);
    } catch (const std::exception& e) {
        logger_.error(std::string("[ProviderManager] Provider probe failed: ") + e.what());
    } catch (...) {
        logger_.error("[ProviderManager] Provider probe failed with a non-standard exception");
    }
    if (!chosen) {
        chosen = factory_.make_unsupported();
    }

    logger_.info("[ProviderManager] Using provider " + chosen->name());

    std::lock_guard<std::mutex> lock(mutex_);
    classification_ = device;
    provider_ = std::move(chosen);
}

ProviderPtr ProviderManager::try_provider(ProviderPtr candidate) {
    if (!candidate) {
        return nullptr;
    }
    if (candidate->is_available()) {
        return candidate;
    }
    logger_.info("[ProviderManager] " + candidate->name() + " not available, falling back");
    return nullptr;
}

ProviderPtr ProviderManager::select_provider(const DeviceClassification& device) {
    if (device.tier == CapabilityTier::APPLE_FOUNDATION) {
        if (auto p = try_provider(factory_.make_foundation())) {
            return p;
        }
    }

    if (device.tier != CapabilityTier::UNSUPPORTED) {
        const ModelDefinition* model = select_model_for_device(device.ram_gb);
        if (model) {
            if (auto p = try_provider(factory_.make_local(*model))) {
                return p;
            }
        } else {
            logger_.info("[ProviderManager] No catalog model fits this device");
        }
    }

    return factory_.make_unsupported();
}

Result<void> ProviderManager::initialize(ProgressCallback on_progress) {
    resolve();

    auto provider = current();
    if (!provider) {
        return Error(ErrorCode::INTERNAL_ERROR, messages::NO_PROVIDER);
    }
    return provider->initialize(std::move(on_progress));
}

Result<std::string> ProviderManager::generate(const std::string& system_prompt,
                                              const std::string& user_message) {
    auto provider = current();
    if (!provider || provider->status() != ProviderStatus::READY) {
        return Error(ErrorCode::NOT_READY, messages::PROVIDER_NOT_READY);
    }
    return provider->generate(system_prompt, user_message);
}

ProviderStatus ProviderManager::get_status() const {
    auto provider = current();
    return provider ? provider->status() : ProviderStatus::UNINITIALIZED;
}

std::string ProviderManager::provider_name() const {
    auto provider = current();
    return provider ? provider->name() : "none";
}

std::optional<DeviceClassification> ProviderManager::classification() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return classification_;
}

bool ProviderManager::is_resolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return provider_ != nullptr;
}

bool ProviderManager::is_model_downloaded() {
    resolve();

    auto provider = current();
    if (!provider) {
        return false;
    }
    if (ModelStore* store = provider->model_store()) {
        return store->is_model_downloaded();
    }
    return provider->info().platform_model;
}

Result<void> ProviderManager::download_model(DownloadProgressCallback on_progress) {
    resolve();

    auto provider = current();
    ModelStore* store = provider ? provider->model_store() : nullptr;
    if (!store) {
        return Error(ErrorCode::NOT_APPLICABLE, messages::NO_DOWNLOAD_NEEDED);
    }
    return store->download_model(std::move(on_progress));
}

void ProviderManager::cancel_download() {
    auto provider = current();
    if (!provider) {
        return;
    }
    if (ModelStore* store = provider->model_store()) {
        store->cancel_download();
    }
}

Result<void> ProviderManager::delete_model() {
    auto provider = current();
    ModelStore* store = provider ? provider->model_store() : nullptr;
    if (!store) {
        return Error(ErrorCode::NOT_APPLICABLE, messages::NO_DOWNLOAD_NEEDED);
    }
    store->delete_model();
    return Ok();
}

uint64_t ProviderManager::model_size() const {
    auto provider = current();
    ModelStore* store = provider ? provider->model_store() : nullptr;
    return store ? store->model_size() : 0;
}

std::optional<ModelDefinition> ProviderManager::model_config() const {
    auto provider = current();
    ModelStore* store = provider ? provider->model_store() : nullptr;
    if (!store) {
        return std::nullopt;
    }
    return store->model_definition();
}

void ProviderManager::cleanup() {
    std::shared_ptr<LLMProvider> provider;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        provider = std::move(provider_);
        provider_.reset();
        classification_.reset();
    }
    if (provider) {
        provider->cleanup();
        logger_.debug("[ProviderManager] Released provider " + provider->name());
    }
}

}  // namespace nrx::llm
