#pragma once

#include "provider.hpp"

namespace nrx::llm {

/**
 * Terminal fallback. Always available so resolution never ends empty;
 * generate() always fails with messages::INFERENCE_UNSUPPORTED.
 */
class UnsupportedProvider : public LLMProvider {
public:
    ProviderInfo info() const override;
    bool is_available() override { return true; }
    Result<void> initialize(ProgressCallback on_progress = nullptr) override;
    Result<std::string> generate(const std::string& system_prompt,
                                 const std::string& user_message) override;
    void cleanup() override {}
    ProviderStatus status() const override { return ProviderStatus::UNSUPPORTED; }
};

}  // namespace nrx::llm
