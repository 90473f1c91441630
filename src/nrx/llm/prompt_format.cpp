#include <nrx/llm/prompt_format.hpp>

#include <cmath>

namespace nrx::llm {

const char* dialect_name(PromptDialect dialect) {
    switch (dialect) {
        case PromptDialect::CHATML: return "chatml";
        case PromptDialect::LLAMA3: return "llama3";
    }
    return "chatml";
}

const PromptTemplate& prompt_template(PromptDialect dialect) {
    static const PromptTemplate chatml{
        "",
        "<|im_start|>system\n",
        "<|im_start|>user\n",
        "<|im_start|>assistant\n",
        "<|im_end|>\n",
    };

    static const PromptTemplate llama3{
        "<|begin_of_text|>",
        "<|start_header_id|>system<|end_header_id|>\n\n",
        "<|start_header_id|>user<|end_header_id|>\n\n",
        "<|start_header_id|>assistant<|end_header_id|>\n\n",
        "<|eot_id|>",
    };

    switch (dialect) {
        case PromptDialect::LLAMA3: return llama3;
        case PromptDialect::CHATML: break;
    }
    return chatml;
}

std::string format_prompt(PromptDialect dialect,
                          const std::string& system_prompt,
                          const std::string& user_message) {
    const PromptTemplate& tmpl = prompt_template(dialect);

    std::string prompt = tmpl.begin_text;
    if (!system_prompt.empty()) {
        prompt += tmpl.system_header;
        prompt += system_prompt;
        prompt += tmpl.end_of_turn;
    }
    prompt += tmpl.user_header;
    prompt += user_message;
    prompt += tmpl.end_of_turn;
    prompt += tmpl.assistant_header;
    return prompt;
}

size_t max_prompt_chars(int context_size) {
    int prompt_tokens = context_size - MAX_NEW_TOKENS;
    if (prompt_tokens <= 0) {
        return 0;
    }
    return static_cast<size_t>(std::floor(prompt_tokens * CHARS_PER_TOKEN));
}

std::string truncate_prompt(const std::string& prompt, int context_size) {
    size_t limit = max_prompt_chars(context_size);
    if (prompt.size() <= limit) {
        return prompt;
    }

    // Back up over UTF-8 continuation bytes (10xxxxxx)
    size_t cut = limit;
    while (cut > 0 &&
           (static_cast<unsigned char>(prompt[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return prompt.substr(0, cut);
}

}  // namespace nrx::llm
