#include <nrx/llm/json.hpp>

namespace nrx::llm {

void to_json(nlohmann::json& j, CapabilityTier tier) {
    j = tier_name(tier);
}

void to_json(nlohmann::json& j, ProviderStatus status) {
    j = status_name(status);
}

void to_json(nlohmann::json& j, PromptDialect dialect) {
    j = dialect_name(dialect);
}

void to_json(nlohmann::json& j, const DeviceClassification& device) {
    j = nlohmann::json{
        {"tier", device.tier},
        {"ram_gb", device.ram_gb},
        {"architecture", device.architecture},
        {"model", device.model},
        {"os_name", device.os_name},
        {"os_version", device.os_version},
        {"foundation_eligible", device.foundation_eligible}
    };
}

void to_json(nlohmann::json& j, const ModelDefinition& model) {
    j = nlohmann::json{
        {"tier", model.tier},
        {"name", model.name},
        {"filename", model.filename},
        {"download_url", model.download_url},
        {"size_bytes", model.size_bytes},
        {"size_label", model.size_label},
        {"min_ram_gb", model.min_ram_gb},
        {"context_size", model.context_size},
        {"threads", model.threads},
        {"dialect", model.dialect},
        {"stop_tokens", model.stop_tokens}
    };
}

void to_json(nlohmann::json& j, const DownloadProgress& progress) {
    j = nlohmann::json{
        {"bytes_downloaded", progress.bytes_downloaded},
        {"total_bytes", progress.total_bytes},
        {"percentage", progress.percentage}
    };
    if (progress.estimated_seconds_remaining) {
        j["estimated_seconds_remaining"] = *progress.estimated_seconds_remaining;
    } else {
        j["estimated_seconds_remaining"] = nullptr;
    }
}

}  // namespace nrx::llm
