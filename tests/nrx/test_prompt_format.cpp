#include <gtest/gtest.h>
#include <nrx/llm/prompt_format.hpp>

using namespace nrx::llm;

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

// ============================================================================
// Formatting
// ============================================================================

TEST(PromptFormatTest, ChatmlLayout) {
    std::string prompt = format_prompt(PromptDialect::CHATML, "Be brief.", "Hi");
    EXPECT_EQ(prompt,
              "<|im_start|>system\nBe brief.<|im_end|>\n"
              "<|im_start|>user\nHi<|im_end|>\n"
              "<|im_start|>assistant\n");
}

TEST(PromptFormatTest, Llama3Layout) {
    std::string prompt = format_prompt(PromptDialect::LLAMA3, "Be brief.", "Hi");
    EXPECT_EQ(prompt,
              "<|begin_of_text|>"
              "<|start_header_id|>system<|end_header_id|>\n\nBe brief.<|eot_id|>"
              "<|start_header_id|>user<|end_header_id|>\n\nHi<|eot_id|>"
              "<|start_header_id|>assistant<|end_header_id|>\n\n");
}

TEST(PromptFormatTest, DialectsDifferAndLeaveAssistantTurnOpen) {
    std::string chatml = format_prompt(PromptDialect::CHATML, "sys", "user");
    std::string llama3 = format_prompt(PromptDialect::LLAMA3, "sys", "user");

    EXPECT_NE(chatml, llama3);
    EXPECT_TRUE(ends_with(chatml, prompt_template(PromptDialect::CHATML).assistant_header));
    EXPECT_TRUE(ends_with(llama3, prompt_template(PromptDialect::LLAMA3).assistant_header));
}

TEST(PromptFormatTest, EmptySystemPromptOmitsSystemTurn) {
    std::string prompt = format_prompt(PromptDialect::CHATML, "", "Hi");
    EXPECT_EQ(prompt.find("system"), std::string::npos);
    EXPECT_EQ(prompt, "<|im_start|>user\nHi<|im_end|>\n<|im_start|>assistant\n");
}

// ============================================================================
// Truncation
// ============================================================================

TEST(PromptTruncationTest, LimitFromContextSize) {
    EXPECT_EQ(max_prompt_chars(2048), 5376u);
    EXPECT_EQ(max_prompt_chars(4096), 12544u);
    EXPECT_EQ(max_prompt_chars(512), 0u);
}

TEST(PromptTruncationTest, ShortPromptUnchanged) {
    std::string prompt(1000, 'a');
    EXPECT_EQ(truncate_prompt(prompt, 2048), prompt);
}

TEST(PromptTruncationTest, KeepsPrefix) {
    std::string prompt = std::string(5376, 'a') + std::string(100, 'b');
    std::string cut = truncate_prompt(prompt, 2048);
    EXPECT_EQ(cut.size(), 5376u);
    EXPECT_EQ(cut, std::string(5376, 'a'));
}

TEST(PromptTruncationTest, NeverSplitsUtf8Sequence) {
    // 5375 ASCII bytes, then a 3-byte character straddling the limit
    std::string prompt = std::string(5375, 'a') + "\xE2\x82\xAC" + "tail";
    std::string cut = truncate_prompt(prompt, 2048);
    EXPECT_EQ(cut, std::string(5375, 'a'));
}
