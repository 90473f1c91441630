#include <nrx/llm/device_info.hpp>

#include <sys/utsname.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace nrx::llm {

namespace {

constexpr double BYTES_PER_GB = 1024.0 * 1024.0 * 1024.0;

struct utsname read_uname() {
    struct utsname info {};
    if (uname(&info) != 0) {
        throw std::runtime_error("uname() failed");
    }
    return info;
}

// Device-tree strings are NUL terminated
std::string read_first_line(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return "";
    }
    std::string line;
    std::getline(file, line);
    line.erase(std::find(line.begin(), line.end(), '\0'), line.end());
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
        line.pop_back();
    }
    return line;
}

}  // namespace

HostDeviceInfo::HostDeviceInfo(DeviceOverrides overrides)
    : overrides_(std::move(overrides)) {}

uint64_t HostDeviceInfo::total_memory_bytes() {
    if (overrides_.ram_gb) {
        return static_cast<uint64_t>(std::llround(*overrides_.ram_gb * BYTES_PER_GB));
    }

    std::ifstream meminfo("/proc/meminfo");
    if (!meminfo) {
        throw std::runtime_error("Cannot open /proc/meminfo");
    }

    std::string line;
    while (std::getline(meminfo, line)) {
        if (line.rfind("MemTotal:", 0) == 0) {
            std::istringstream ss(line.substr(9));
            uint64_t kb = 0;
            ss >> kb;
            return kb * 1024;
        }
    }

    throw std::runtime_error("MemTotal missing from /proc/meminfo");
}

std::vector<std::string> HostDeviceInfo::supported_abis() {
    if (overrides_.abis) {
        return *overrides_.abis;
    }

    std::string machine = read_uname().machine;
    if (machine == "aarch64" || machine == "arm64") {
        return {"arm64-v8a", "aarch64"};
    }
    if (machine.rfind("armv7", 0) == 0) {
        return {"armeabi-v7a"};
    }
    if (machine == "x86_64") {
        return {"x86_64", "x86"};
    }
    return {machine};
}

std::string HostDeviceInfo::model() {
    if (overrides_.device_model) {
        return *overrides_.device_model;
    }

    std::string name = read_first_line("/sys/firmware/devicetree/base/model");
    if (name.empty()) {
        name = read_first_line("/sys/class/dmi/id/product_name");
    }
    return name.empty() ? "unknown" : name;
}

std::string HostDeviceInfo::os_name() {
    if (overrides_.os_name) {
        return *overrides_.os_name;
    }

    std::string name = read_uname().sysname;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

std::string HostDeviceInfo::os_version() {
    if (overrides_.os_version) {
        return *overrides_.os_version;
    }
    return read_uname().release;
}

}  // namespace nrx::llm
