#pragma once

#include <nrx/config.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace nrx::llm {

// ============================================================================
// Device Info Source
// ============================================================================

/**
 * Read-only view of the host hardware and operating system.
 *
 * Implementations may throw when a property cannot be read; the
 * classifier treats any failure as "capability unknown".
 */
class DeviceInfoSource {
public:
    virtual ~DeviceInfoSource() = default;

    virtual uint64_t total_memory_bytes() = 0;
    virtual std::vector<std::string> supported_abis() = 0;
    virtual std::string model() = 0;
    virtual std::string os_name() = 0;
    virtual std::string os_version() = 0;
};

/**
 * Linux host implementation.
 *
 * Memory from /proc/meminfo, architecture and kernel release from uname,
 * model name from the device tree or DMI. Every value can be replaced
 * through DeviceOverrides.
 */
class HostDeviceInfo : public DeviceInfoSource {
public:
    explicit HostDeviceInfo(DeviceOverrides overrides = {});

    uint64_t total_memory_bytes() override;
    std::vector<std::string> supported_abis() override;
    std::string model() override;
    std::string os_name() override;
    std::string os_version() override;

private:
    DeviceOverrides overrides_;
};

}  // namespace nrx::llm
