#pragma once

#include <cstddef>
#include <string>

namespace nrx::llm {

// ============================================================================
// Prompt Dialects
// ============================================================================

enum class PromptDialect {
    CHATML,   // <|im_start|>role ... <|im_end|>
    LLAMA3    // <|begin_of_text|><|start_header_id|>role<|end_header_id|> ... <|eot_id|>
};

const char* dialect_name(PromptDialect dialect);

/**
 * Turn markers for one dialect. Formatting is driven entirely by this
 * table, so adding a dialect means adding a row.
 */
struct PromptTemplate {
    std::string begin_text;        // Emitted once before the first turn
    std::string system_header;
    std::string user_header;
    std::string assistant_header;  // Left open for the completion
    std::string end_of_turn;
};

const PromptTemplate& prompt_template(PromptDialect dialect);

/**
 * Build a single-turn prompt: optional system turn, user turn, then an
 * open assistant turn. The system turn is omitted when system_prompt is
 * empty.
 */
std::string format_prompt(PromptDialect dialect,
                          const std::string& system_prompt,
                          const std::string& user_message);

// ============================================================================
// Context Budget
// ============================================================================

constexpr double CHARS_PER_TOKEN = 3.5;
constexpr int MAX_NEW_TOKENS = 512;

// Largest prompt, in characters, that leaves MAX_NEW_TOKENS of room
size_t max_prompt_chars(int context_size);

/**
 * Cut the prompt from the end so it fits the context window minus the
 * generation reserve. Never splits a UTF-8 sequence.
 */
std::string truncate_prompt(const std::string& prompt, int context_size);

}  // namespace nrx::llm
