#pragma once

#include "inference_runtime.hpp"

#include <nrx/util/logger.hpp>

#include <memory>

namespace nrx::llm {

/**
 * InferenceRuntime backed by llama.cpp, linked in-process.
 *
 * Only present when the project is built with NRX_ENABLE_LLAMACPP;
 * otherwise load() reports the runtime as absent.
 */
class LlamaCppRuntime : public InferenceRuntime {
public:
    explicit LlamaCppRuntime(Logger& logger);

    std::string name() const override { return "llama.cpp"; }
    Result<std::unique_ptr<InferenceContext>> init(const RuntimeParams& params) override;

    /**
     * Probe for the runtime once at startup.
     * @return nullptr when llama.cpp was not compiled in
     */
    static std::unique_ptr<InferenceRuntime> load(Logger& logger);

private:
    Logger& logger_;
};

}  // namespace nrx::llm
