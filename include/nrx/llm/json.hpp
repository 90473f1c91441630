#pragma once

#include "device_classifier.hpp"
#include "model_catalog.hpp"
#include "provider.hpp"

#include <nlohmann/json.hpp>

namespace nrx::llm {

// nlohmann::json serializers, found by ADL

void to_json(nlohmann::json& j, CapabilityTier tier);
void to_json(nlohmann::json& j, ProviderStatus status);
void to_json(nlohmann::json& j, PromptDialect dialect);
void to_json(nlohmann::json& j, const DeviceClassification& device);
void to_json(nlohmann::json& j, const ModelDefinition& model);
void to_json(nlohmann::json& j, const DownloadProgress& progress);

}  // namespace nrx::llm
