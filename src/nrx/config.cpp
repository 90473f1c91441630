#include <nrx/config.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace nrx {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool parse_bool(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "yes";
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

}  // namespace

fs::path EngineConfig::default_models_dir() {
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return fs::path(home) / ".nrx" / "models";
    }
    return fs::path(".nrx") / "models";
}

Result<EngineConfig> EngineConfig::from_env() {
    EngineConfig config;
    config.models_dir = default_models_dir();

    if (const char* dir = std::getenv("NRX_MODELS_DIR")) {
        if (dir[0] != '\0') {
            config.models_dir = dir;
        }
    }

    if (const char* level = std::getenv("NRX_LOG_LEVEL")) {
        auto parsed = parse_log_level(level);
        if (!parsed) {
            return Error(ErrorCode::INVALID_ARGUMENT,
                std::string("NRX_LOG_LEVEL is not a log level: ") + level);
        }
        config.log_level = *parsed;
    }

    if (const char* sandboxed = std::getenv("NRX_SANDBOXED")) {
        config.sandboxed = parse_bool(sandboxed);
    }

    if (const char* poll = std::getenv("NRX_DOWNLOAD_POLL_MS")) {
        char* end = nullptr;
        errno = 0;
        long ms = std::strtol(poll, &end, 10);
        if (end == poll || *end != '\0' || errno == ERANGE || ms <= 0) {
            return Error(ErrorCode::INVALID_ARGUMENT,
                std::string("NRX_DOWNLOAD_POLL_MS must be a positive integer: ") + poll);
        }
        config.download_poll_interval = std::chrono::milliseconds(ms);
    }

    if (const char* model = std::getenv("NRX_DEVICE_MODEL")) {
        config.device.device_model = std::string(model);
    }

    if (const char* ram = std::getenv("NRX_DEVICE_RAM_GB")) {
        char* end = nullptr;
        errno = 0;
        double gb = std::strtod(ram, &end);
        if (end == ram || *end != '\0' || errno == ERANGE || gb < 0.0) {
            return Error(ErrorCode::INVALID_ARGUMENT,
                std::string("NRX_DEVICE_RAM_GB must be a non-negative number: ") + ram);
        }
        config.device.ram_gb = gb;
    }

    if (const char* abis = std::getenv("NRX_DEVICE_ABIS")) {
        config.device.abis = split_list(abis);
    }

    if (const char* os = std::getenv("NRX_HOST_OS")) {
        config.device.os_name = std::string(os);
    }

    if (const char* version = std::getenv("NRX_HOST_OS_VERSION")) {
        config.device.os_version = std::string(version);
    }

    return config;
}

}  // namespace nrx
