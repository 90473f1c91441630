#pragma once

#include "command.hpp"

namespace nrx::cli {

/**
 * Download the model selected for this device.
 * Ctrl-C cancels and removes the partial file.
 */
class DownloadCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "download"; }
    std::string description() const override {
        return "Download the model for this device";
    }
};

}  // namespace nrx::cli
