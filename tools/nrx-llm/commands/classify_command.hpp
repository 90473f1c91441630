#pragma once

#include "command.hpp"

namespace nrx::cli {

/**
 * Show how this device was classified and which backend was chosen.
 */
class ClassifyCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "classify"; }
    std::string description() const override {
        return "Show the device classification and resolved provider";
    }
};

}  // namespace nrx::cli
