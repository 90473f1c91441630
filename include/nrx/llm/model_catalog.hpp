#pragma once

#include <nrx/llm/prompt_format.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace nrx::llm {

// ============================================================================
// Model Definitions
// ============================================================================

struct ModelDefinition {
    std::string tier;           // "standard", "compact", "minimal"
    std::string name;           // e.g., "Qwen2.5 3B Instruct"
    std::string filename;       // On-device file name
    std::string download_url;
    uint64_t size_bytes = 0;    // Expected file size
    std::string size_label;     // e.g., "~2.1 GB"
    double min_ram_gb = 0.0;
    int context_size = 2048;    // Tokens
    int threads = 4;
    PromptDialect dialect = PromptDialect::CHATML;
    std::vector<std::string> stop_tokens;
};

/**
 * The downloadable models, strictly ordered by descending RAM
 * requirement.
 */
const std::vector<ModelDefinition>& model_catalog();

/**
 * First catalog entry whose RAM requirement fits the device, i.e. the
 * largest model the device can hold.
 *
 * @return nullptr when ram_gb is below every requirement
 */
const ModelDefinition* select_model_for_device(double ram_gb);

// nullptr for unknown tiers
const ModelDefinition* find_model_by_tier(const std::string& tier);

}  // namespace nrx::llm
