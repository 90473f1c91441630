#include <nrx/llm/device_classifier.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <regex>
#include <sstream>

namespace nrx::llm {

namespace {

constexpr double BYTES_PER_GB = 1024.0 * 1024.0 * 1024.0;

// Leading integer of a version string ("26.1" -> 26), -1 if none
int major_version(const std::string& version) {
    if (version.empty() || !std::isdigit(static_cast<unsigned char>(version[0]))) {
        return -1;
    }
    return std::atoi(version.c_str());
}

std::string format_gb(double gb) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << gb;
    return ss.str();
}

}  // namespace

const char* tier_name(CapabilityTier tier) {
    switch (tier) {
        case CapabilityTier::APPLE_FOUNDATION: return "apple_foundation";
        case CapabilityTier::STANDARD: return "standard";
        case CapabilityTier::COMPACT: return "compact";
        case CapabilityTier::MINIMAL: return "minimal";
        case CapabilityTier::UNSUPPORTED: return "unsupported";
    }
    return "unsupported";
}

bool is_foundation_eligible(const std::string& device_model) {
    static const std::regex phone(R"(^iPhone(\d+),\d+$)");
    static const std::regex tablet(R"(^iPad(\d+),\d+$)");

    std::smatch match;
    if (std::regex_match(device_model, match, phone)) {
        return std::atoi(match[1].str().c_str()) >= MIN_FOUNDATION_PHONE_MAJOR;
    }
    if (std::regex_match(device_model, match, tablet)) {
        return std::atoi(match[1].str().c_str()) >= MIN_FOUNDATION_TABLET_MAJOR;
    }
    return false;
}

bool has_arm64(const std::vector<std::string>& abis) {
    return std::any_of(abis.begin(), abis.end(), [](const std::string& abi) {
        return abi.rfind("arm64", 0) == 0 || abi.rfind("aarch64", 0) == 0;
    });
}

CapabilityTier tier_for_ram(double ram_gb) {
    if (ram_gb >= STANDARD_MIN_RAM_GB) return CapabilityTier::STANDARD;
    if (ram_gb >= COMPACT_MIN_RAM_GB) return CapabilityTier::COMPACT;
    if (ram_gb >= MINIMAL_MIN_RAM_GB) return CapabilityTier::MINIMAL;
    return CapabilityTier::UNSUPPORTED;
}

DeviceClassifier::DeviceClassifier(DeviceInfoSource* source, Logger& logger)
    : source_(source), logger_(logger) {}

DeviceClassification DeviceClassifier::classify() const {
    DeviceClassification result;

    if (!source_) {
        logger_.info("[DeviceClassifier] Device info unavailable, classifying as unsupported");
        return result;
    }

    uint64_t total_bytes = 0;
    std::vector<std::string> abis;
    try {
        total_bytes = source_->total_memory_bytes();
        abis = source_->supported_abis();
        result.model = source_->model();
        result.os_name = source_->os_name();
        result.os_version = source_->os_version();
    } catch (const std::exception& e) {
        logger_.warning(std::string("[DeviceClassifier] Cannot read device info: ") + e.what());
        return DeviceClassification{};
    } catch (...) {
        logger_.warning("[DeviceClassifier] Cannot read device info: unknown error");
        return DeviceClassification{};
    }

    result.ram_gb = static_cast<double>(total_bytes) / BYTES_PER_GB;
    result.foundation_eligible = is_foundation_eligible(result.model);

    if (!has_arm64(abis)) {
        // Both backends need arm64; the model name alone is not enough
        result.foundation_eligible = false;
        result.architecture = abis.empty() ? "unknown" : abis.front();
        result.tier = CapabilityTier::UNSUPPORTED;
        logger_.info("[DeviceClassifier] No arm64 ABI on " + result.model +
                     ", classifying as unsupported");
        return result;
    }

    result.architecture = "arm64";

    if (result.os_name == FOUNDATION_HOST_OS &&
        major_version(result.os_version) >= MIN_FOUNDATION_OS_VERSION &&
        result.foundation_eligible) {
        result.tier = CapabilityTier::APPLE_FOUNDATION;
    } else {
        result.tier = tier_for_ram(result.ram_gb);
    }

    logger_.info("[DeviceClassifier] Device: " + result.model +
                 ", RAM: " + format_gb(result.ram_gb) + "GB" +
                 ", capability: " + tier_name(result.tier));
    return result;
}

}  // namespace nrx::llm
