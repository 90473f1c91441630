#include <nrx/llm/llamacpp_runtime.hpp>

#ifdef NRX_HAS_LLAMACPP

#include <llama.h>

#include <algorithm>
#include <mutex>

namespace nrx::llm {

namespace {

std::once_flag backend_init_flag;

class LlamaCppContext : public InferenceContext {
public:
    LlamaCppContext(llama_model* model, llama_context* context, int n_ctx, int n_batch)
        : model_(model), context_(context), n_ctx_(n_ctx), n_batch_(n_batch) {}

    ~LlamaCppContext() override {
        release();
    }

    LlamaCppContext(const LlamaCppContext&) = delete;
    LlamaCppContext& operator=(const LlamaCppContext&) = delete;

    Result<void> clear_cache(bool) override {
        std::lock_guard<std::mutex> lock(inference_mutex_);
        if (!context_) {
            return Error(ErrorCode::NOT_READY, "Context released");
        }
        llama_kv_cache_clear(context_);
        return {};
    }

    Result<CompletionOutput> completion(const CompletionParams& params,
                                        const TokenCallback& on_token) override;

    Result<void> release() override {
        std::lock_guard<std::mutex> lock(inference_mutex_);

        if (sampler_) {
            llama_sampler_free(sampler_);
            sampler_ = nullptr;
        }
        if (context_) {
            llama_free(context_);
            context_ = nullptr;
        }
        if (model_) {
            llama_free_model(model_);
            model_ = nullptr;
        }
        return {};
    }

private:
    llama_model* model_ = nullptr;
    llama_context* context_ = nullptr;
    llama_sampler* sampler_ = nullptr;
    int n_ctx_;
    int n_batch_;
    std::mutex inference_mutex_;

    std::vector<llama_token> tokenize(const std::string& text);
    std::string token_to_piece(llama_token token);
    void setup_sampler(const CompletionParams& params);
};

std::vector<llama_token> LlamaCppContext::tokenize(const std::string& text) {
    const auto* vocab = llama_model_get_vocab(model_);
    const bool add_bos = llama_vocab_get_add_bos(vocab);

    int n_tokens = static_cast<int>(text.size()) + (add_bos ? 1 : 0);
    std::vector<llama_token> tokens(n_tokens);

    n_tokens = llama_tokenize(vocab, text.c_str(), static_cast<int>(text.size()),
                              tokens.data(), static_cast<int>(tokens.size()),
                              add_bos, true);

    if (n_tokens < 0) {
        tokens.resize(-n_tokens);
        n_tokens = llama_tokenize(vocab, text.c_str(), static_cast<int>(text.size()),
                                  tokens.data(), static_cast<int>(tokens.size()),
                                  add_bos, true);
    }

    tokens.resize(std::max(n_tokens, 0));

    // Templates that spell out the BOS marker would otherwise get two
    const llama_token bos = llama_vocab_bos(vocab);
    if (add_bos && tokens.size() >= 2 && tokens[0] == bos && tokens[1] == bos) {
        tokens.erase(tokens.begin());
    }
    return tokens;
}

std::string LlamaCppContext::token_to_piece(llama_token token) {
    const auto* vocab = llama_model_get_vocab(model_);
    char buf[256];
    int n = llama_token_to_piece(vocab, token, buf, sizeof(buf), 0, true);
    if (n <= 0) {
        return "";
    }
    return std::string(buf, n);
}

void LlamaCppContext::setup_sampler(const CompletionParams& params) {
    if (sampler_) {
        llama_sampler_free(sampler_);
    }
    sampler_ = llama_sampler_chain_init(llama_sampler_chain_default_params());

    llama_sampler_chain_add(sampler_, llama_sampler_init_top_p(params.top_p, 1));
    llama_sampler_chain_add(sampler_, llama_sampler_init_temp(params.temperature));
    llama_sampler_chain_add(sampler_, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
}

Result<CompletionOutput> LlamaCppContext::completion(const CompletionParams& params,
                                                     const TokenCallback& on_token) {
    std::lock_guard<std::mutex> lock(inference_mutex_);

    if (!context_ || !model_) {
        return Error(ErrorCode::NOT_READY, "Context released");
    }

    CompletionOutput output;
    std::string text;

    std::vector<llama_token> tokens = tokenize(params.prompt);
    if (tokens.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Empty prompt");
    }

    if (tokens.size() >= static_cast<size_t>(n_ctx_)) {
        return Error(ErrorCode::INVALID_ARGUMENT,
            "Prompt exceeds context length: " + std::to_string(tokens.size()) +
            " > " + std::to_string(n_ctx_));
    }

    output.tokens_evaluated = static_cast<int>(tokens.size());

    // Process prompt in batches
    llama_batch batch = llama_batch_init(n_batch_, 0, 1);

    for (size_t i = 0; i < tokens.size(); i += n_batch_) {
        size_t n_tokens = std::min(static_cast<size_t>(n_batch_), tokens.size() - i);

        batch.n_tokens = 0;
        for (size_t j = 0; j < n_tokens; ++j) {
            batch.token[batch.n_tokens] = tokens[i + j];
            batch.pos[batch.n_tokens] = static_cast<llama_pos>(i + j);
            batch.n_seq_id[batch.n_tokens] = 1;
            batch.seq_id[batch.n_tokens][0] = 0;
            batch.logits[batch.n_tokens] = false;
            batch.n_tokens++;
        }

        if (i + n_tokens == tokens.size()) {
            batch.logits[batch.n_tokens - 1] = true;
        }

        if (llama_decode(context_, batch) != 0) {
            llama_batch_free(batch);
            return Error(ErrorCode::INTERNAL_ERROR, "Failed to decode prompt");
        }
    }

    setup_sampler(params);

    const auto* vocab = llama_model_get_vocab(model_);
    int n_cur = static_cast<int>(tokens.size());

    while (output.tokens_predicted < params.n_predict && n_cur < n_ctx_) {
        llama_token new_token = llama_sampler_sample(sampler_, context_, -1);

        if (llama_vocab_is_eog(vocab, new_token)) {
            output.stop_reason = "eos";
            break;
        }

        std::string piece = token_to_piece(new_token);
        text += piece;
        output.tokens_predicted++;

        bool should_stop = false;
        for (const auto& stop : params.stop) {
            if (text.size() >= stop.size() &&
                text.compare(text.size() - stop.size(), stop.size(), stop) == 0) {
                text.erase(text.size() - stop.size());
                output.stop_reason = "stop_sequence";
                should_stop = true;
                break;
            }
        }
        if (should_stop) break;

        if (on_token && !on_token(piece)) {
            output.stop_reason = "aborted";
            break;
        }

        batch.n_tokens = 0;
        batch.token[batch.n_tokens] = new_token;
        batch.pos[batch.n_tokens] = n_cur;
        batch.n_seq_id[batch.n_tokens] = 1;
        batch.seq_id[batch.n_tokens][0] = 0;
        batch.logits[batch.n_tokens] = true;
        batch.n_tokens++;
        n_cur++;

        if (llama_decode(context_, batch) != 0) {
            llama_batch_free(batch);
            return Error(ErrorCode::INTERNAL_ERROR, "Failed to decode token");
        }
    }

    llama_batch_free(batch);

    if (output.stop_reason.empty()) {
        output.stop_reason = "max_tokens";
    }
    output.text = std::move(text);
    return output;
}

}  // namespace

LlamaCppRuntime::LlamaCppRuntime(Logger& logger)
    : logger_(logger) {}

Result<std::unique_ptr<InferenceContext>> LlamaCppRuntime::init(const RuntimeParams& params) {
    std::call_once(backend_init_flag, []() {
        llama_backend_init();
    });

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = params.n_gpu_layers;

    llama_model* model = llama_load_model_from_file(params.model_path.c_str(), model_params);
    if (!model) {
        return Error(ErrorCode::IO_ERROR, "Failed to load model: " + params.model_path);
    }

    const int n_batch = std::min(params.n_ctx, 512);

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = params.n_ctx;
    ctx_params.n_batch = n_batch;
    ctx_params.n_threads = params.n_threads;
    ctx_params.n_threads_batch = params.n_threads;

    llama_context* context = llama_new_context_with_model(model, ctx_params);
    if (!context) {
        llama_free_model(model);
        return Error(ErrorCode::INTERNAL_ERROR, "Failed to create context");
    }

    logger_.debug("[LlamaCppRuntime] Loaded " + params.model_path +
                  " (" + std::to_string(llama_model_size(model)) + " bytes)");

    return std::unique_ptr<InferenceContext>(
        std::make_unique<LlamaCppContext>(model, context, params.n_ctx, n_batch));
}

std::unique_ptr<InferenceRuntime> LlamaCppRuntime::load(Logger& logger) {
    return std::make_unique<LlamaCppRuntime>(logger);
}

}  // namespace nrx::llm

#else  // !NRX_HAS_LLAMACPP

namespace nrx::llm {

LlamaCppRuntime::LlamaCppRuntime(Logger& logger)
    : logger_(logger) {}

Result<std::unique_ptr<InferenceContext>> LlamaCppRuntime::init(const RuntimeParams&) {
    return Error(ErrorCode::RUNTIME_UNAVAILABLE,
        "llama.cpp support not compiled. Rebuild with -DNRX_ENABLE_LLAMACPP=ON");
}

std::unique_ptr<InferenceRuntime> LlamaCppRuntime::load(Logger& logger) {
    logger.info("[LlamaCppRuntime] llama.cpp not compiled in, local models disabled");
    return nullptr;
}

}  // namespace nrx::llm

#endif  // NRX_HAS_LLAMACPP
