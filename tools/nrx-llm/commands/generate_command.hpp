#pragma once

#include "command.hpp"

namespace nrx::cli {

/**
 * Run one prompt through the resolved backend, downloading the model
 * first when needed.
 */
class GenerateCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "generate"; }
    std::string description() const override {
        return "Generate a reply to a message";
    }

private:
    std::string system_prompt_ = "You are a helpful assistant.";
    std::string message_;
};

}  // namespace nrx::cli
