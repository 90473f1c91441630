#pragma once

#include "command.hpp"

namespace nrx::cli {

/**
 * Remove the downloaded model and reset the engine.
 */
class DeleteCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "delete"; }
    std::string description() const override {
        return "Delete the downloaded model";
    }

private:
    bool force_ = false;
};

}  // namespace nrx::cli
