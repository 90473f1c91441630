#pragma once

#include "command.hpp"

namespace nrx::cli {

/**
 * List the model catalog with the entry this device would use.
 */
class ModelsCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "models"; }
    std::string description() const override {
        return "List downloadable models";
    }
};

}  // namespace nrx::cli
