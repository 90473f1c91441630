#pragma once

#include <nrx/result.hpp>
#include <nrx/util/logger.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace nrx {

namespace fs = std::filesystem;

/**
 * Values that replace what the host reports about itself.
 * Used on development machines to impersonate a phone.
 */
struct DeviceOverrides {
    std::optional<std::string> device_model;
    std::optional<double> ram_gb;
    std::optional<std::vector<std::string>> abis;
    std::optional<std::string> os_name;
    std::optional<std::string> os_version;
};

/**
 * Configuration for the on-device LLM engine.
 */
struct EngineConfig {
    fs::path models_dir;            // Where downloaded model files live
    LogLevel log_level = LogLevel::INFO;
    bool sandboxed = false;         // Restricted host: no embedded runtime
    std::chrono::milliseconds download_poll_interval{1000};
    double min_free_space_factor = 1.5;  // Free bytes needed = size * factor
    DeviceOverrides device;

    /**
     * Build a configuration from NRX_* environment variables.
     *
     * Recognized: NRX_MODELS_DIR, NRX_LOG_LEVEL, NRX_SANDBOXED,
     * NRX_DOWNLOAD_POLL_MS, NRX_DEVICE_MODEL, NRX_DEVICE_RAM_GB,
     * NRX_DEVICE_ABIS, NRX_HOST_OS, NRX_HOST_OS_VERSION.
     */
    static Result<EngineConfig> from_env();

    static fs::path default_models_dir();
};

}  // namespace nrx
