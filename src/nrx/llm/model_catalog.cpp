#include <nrx/llm/model_catalog.hpp>

#include <algorithm>

namespace nrx::llm {

const std::vector<ModelDefinition>& model_catalog() {
    static const std::vector<ModelDefinition> catalog = {
        {
            "standard",
            "Qwen2.5 3B Instruct",
            "qwen2.5-3b-instruct-q4_k_m.gguf",
            "https://huggingface.co/Qwen/Qwen2.5-3B-Instruct-GGUF/resolve/main/"
            "qwen2.5-3b-instruct-q4_k_m.gguf",
            2'104'932'768ULL,
            "~2.1 GB",
            6.0,
            4096,
            4,
            PromptDialect::CHATML,
            {"<|im_end|>", "<|im_start|>"},
        },
        {
            "compact",
            "Llama 3.2 1B Instruct",
            "llama-3.2-1b-instruct-q4_k_m.gguf",
            "https://huggingface.co/bartowski/Llama-3.2-1B-Instruct-GGUF/resolve/main/"
            "Llama-3.2-1B-Instruct-Q4_K_M.gguf",
            807'694'464ULL,
            "~808 MB",
            4.0,
            2048,
            4,
            PromptDialect::LLAMA3,
            {"<|eot_id|>", "<|end_of_text|>"},
        },
        {
            "minimal",
            "Qwen2.5 0.5B Instruct",
            "qwen2.5-0.5b-instruct-q4_k_m.gguf",
            "https://huggingface.co/Qwen/Qwen2.5-0.5B-Instruct-GGUF/resolve/main/"
            "qwen2.5-0.5b-instruct-q4_k_m.gguf",
            491'400'032ULL,
            "~491 MB",
            3.0,
            2048,
            2,
            PromptDialect::CHATML,
            {"<|im_end|>", "<|im_start|>"},
        },
    };
    return catalog;
}

const ModelDefinition* select_model_for_device(double ram_gb) {
    const auto& catalog = model_catalog();
    auto it = std::find_if(catalog.begin(), catalog.end(),
        [ram_gb](const ModelDefinition& m) { return m.min_ram_gb <= ram_gb; });
    return it == catalog.end() ? nullptr : &*it;
}

const ModelDefinition* find_model_by_tier(const std::string& tier) {
    const auto& catalog = model_catalog();
    auto it = std::find_if(catalog.begin(), catalog.end(),
        [&tier](const ModelDefinition& m) { return m.tier == tier; });
    return it == catalog.end() ? nullptr : &*it;
}

}  // namespace nrx::llm
