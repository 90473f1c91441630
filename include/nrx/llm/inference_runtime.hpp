#pragma once

#include <nrx/result.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nrx::llm {

// ============================================================================
// Embedded Inference Runtime
// ============================================================================

struct RuntimeParams {
    std::string model_path;
    int n_ctx = 2048;
    int n_threads = 4;
    int n_gpu_layers = 0;   // 0 = CPU only
};

struct CompletionParams {
    std::string prompt;
    int n_predict = 512;
    float temperature = 0.7f;
    float top_p = 0.9f;
    std::vector<std::string> stop;
};

struct CompletionOutput {
    std::optional<std::string> text;
    int tokens_evaluated = 0;
    int tokens_predicted = 0;
    std::string stop_reason;  // "eos", "max_tokens", "stop_sequence"
};

// Receives each generated piece; return false to stop early
using TokenCallback = std::function<bool(const std::string& piece)>;

/**
 * A loaded model plus its evaluation state. One completion at a time.
 */
class InferenceContext {
public:
    virtual ~InferenceContext() = default;

    // Drop the key-value cache so the next completion starts clean
    virtual Result<void> clear_cache(bool clear_data) = 0;

    virtual Result<CompletionOutput> completion(const CompletionParams& params,
                                                const TokenCallback& on_token) = 0;

    // Frees native resources; the context is unusable afterwards
    virtual Result<void> release() = 0;
};

class InferenceRuntime {
public:
    virtual ~InferenceRuntime() = default;

    virtual std::string name() const = 0;

    virtual Result<std::unique_ptr<InferenceContext>> init(const RuntimeParams& params) = 0;
};

}  // namespace nrx::llm
