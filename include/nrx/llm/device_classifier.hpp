#pragma once

#include <nrx/llm/device_info.hpp>
#include <nrx/util/logger.hpp>

#include <string>
#include <vector>

namespace nrx::llm {

// ============================================================================
// Capability Tiers
// ============================================================================

enum class CapabilityTier {
    APPLE_FOUNDATION,  // Platform foundation model is usable
    STANDARD,          // arm64, >= 6 GB
    COMPACT,           // arm64, >= 4 GB
    MINIMAL,           // arm64, >= 3 GB
    UNSUPPORTED
};

const char* tier_name(CapabilityTier tier);

struct DeviceClassification {
    CapabilityTier tier = CapabilityTier::UNSUPPORTED;
    double ram_gb = 0.0;
    std::string architecture = "unknown";
    std::string model = "unknown";
    std::string os_name;
    std::string os_version;
    bool foundation_eligible = false;
};

// Hardware generations with a neural accelerator able to run the
// platform foundation model
constexpr int MIN_FOUNDATION_PHONE_MAJOR = 16;
constexpr int MIN_FOUNDATION_TABLET_MAJOR = 14;
constexpr int MIN_FOUNDATION_OS_VERSION = 26;
constexpr const char* FOUNDATION_HOST_OS = "ios";

constexpr double STANDARD_MIN_RAM_GB = 6.0;
constexpr double COMPACT_MIN_RAM_GB = 4.0;
constexpr double MINIMAL_MIN_RAM_GB = 3.0;

/**
 * Pure string match on the device model identifier, e.g. "iPhone16,1"
 * or "iPad13,4". Independent of RAM and OS.
 */
bool is_foundation_eligible(const std::string& device_model);

// True when any ABI is a 64-bit ARM variant
bool has_arm64(const std::vector<std::string>& abis);

// RAM thresholds only; never returns APPLE_FOUNDATION
CapabilityTier tier_for_ram(double ram_gb);

// ============================================================================
// Device Classifier
// ============================================================================

class DeviceClassifier {
public:
    /**
     * @param source Host device info, or nullptr when the capability
     *               is absent (e.g. restricted host)
     * @param logger Diagnostics sink
     */
    DeviceClassifier(DeviceInfoSource* source, Logger& logger);

    /**
     * Classify the running device. Never fails: every unreadable
     * property degrades to the UNSUPPORTED classification.
     */
    DeviceClassification classify() const;

private:
    DeviceInfoSource* source_;
    Logger& logger_;
};

}  // namespace nrx::llm
