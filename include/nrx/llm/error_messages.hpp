#pragma once

#include <nrx/llm/device_classifier.hpp>
#include <nrx/llm/model_catalog.hpp>
#include <nrx/result.hpp>

#include <string>

namespace nrx::llm {

// ============================================================================
// Stable Error Messages
// ============================================================================

// Callers may match on these exact strings
namespace messages {

constexpr const char* INFERENCE_UNSUPPORTED = "LLM inference is not supported on this device";
constexpr const char* PROVIDER_NOT_READY = "LLM provider not initialized or not ready";
constexpr const char* NO_PROVIDER = "No provider resolved";
constexpr const char* DOWNLOAD_CANCELLED = "Download cancelled";
constexpr const char* DOWNLOAD_INTEGRITY = "Download integrity check failed - file size mismatch";
constexpr const char* DOWNLOAD_FAILED = "Download failed";
constexpr const char* NO_DOWNLOAD_NEEDED = "Current provider does not require model download";
constexpr const char* RUNTIME_UNAVAILABLE = "llama.cpp runtime not available";
constexpr const char* BRIDGE_UNAVAILABLE = "Foundation model bridge not available";

}  // namespace messages

// ============================================================================
// Error Message Builder
// ============================================================================

/**
 * User-facing explanations with next steps, for the command-line tool.
 */
class ErrorMessages {
public:
    /**
     * Explain why no backend can run on this device.
     *
     * @param device The classification that led to the unsupported state
     * @return Formatted message listing the requirements that were not met
     */
    static std::string unsupported_device(const DeviceClassification& device);

    /**
     * Explain a failed model download.
     *
     * @param error The download error
     * @param model The model that was being downloaded
     * @return Formatted message with troubleshooting hints per error kind
     */
    static std::string download_failed(const Error& error, const ModelDefinition& model);

    /**
     * General setup help: requirements, environment variables, catalog.
     */
    static std::string setup_help();
};

}  // namespace nrx::llm
