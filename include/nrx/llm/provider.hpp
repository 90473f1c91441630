#pragma once

#include <nrx/llm/model_catalog.hpp>
#include <nrx/result.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace nrx::llm {

// ============================================================================
// Common Types
// ============================================================================

enum class ProviderStatus {
    UNINITIALIZED,
    CHECKING,
    DOWNLOADING,
    INITIALIZING,
    READY,
    ERROR,
    UNSUPPORTED
};

const char* status_name(ProviderStatus status);

// Fraction in [0, 1]
using ProgressCallback = std::function<void(float progress)>;

struct DownloadProgress {
    uint64_t bytes_downloaded = 0;
    uint64_t total_bytes = 0;
    int percentage = 0;                              // Capped at 99 until done
    std::optional<int> estimated_seconds_remaining;  // From observed throughput
};

using DownloadProgressCallback = std::function<void(const DownloadProgress& progress)>;

struct ProviderInfo {
    std::string name;
    bool is_local = true;
    bool platform_model = false;  // Model ships with the OS, nothing to download
};

class ModelStore;

// ============================================================================
// Abstract Provider Interface
// ============================================================================

/**
 * One inference backend. The manager only talks to this surface.
 */
class LLMProvider {
public:
    virtual ~LLMProvider() = default;

    virtual ProviderInfo info() const = 0;
    std::string name() const { return info().name; }

    // Capability probe; no side effects, safe before initialize()
    virtual bool is_available() = 0;

    // Idempotent. May download before creating the runtime session.
    virtual Result<void> initialize(ProgressCallback on_progress = nullptr) = 0;

    // Auto-initializes when needed
    virtual Result<std::string> generate(const std::string& system_prompt,
                                         const std::string& user_message) = 0;

    // Idempotent and never fails; teardown errors are logged
    virtual void cleanup() = 0;

    virtual ProviderStatus status() const = 0;

    /**
     * Download management, for backends that own a model file.
     * @return nullptr when the backend has nothing to download
     */
    virtual ModelStore* model_store() { return nullptr; }
};

using ProviderPtr = std::unique_ptr<LLMProvider>;

// ============================================================================
// Model Download Capability
// ============================================================================

class ModelStore {
public:
    virtual ~ModelStore() = default;

    virtual bool is_model_downloaded() const = 0;
    virtual Result<void> download_model(DownloadProgressCallback on_progress = nullptr) = 0;
    virtual void cancel_download() = 0;
    virtual void delete_model() = 0;

    // Bytes on disk, 0 when absent
    virtual uint64_t model_size() const = 0;
    virtual const ModelDefinition& model_definition() const = 0;
};

}  // namespace nrx::llm
