#pragma once

#include "exit_codes.hpp"

#include <nrx/config.hpp>
#include <nrx/llm/provider_manager.hpp>
#include <nrx/result.hpp>
#include <nrx/util/logger.hpp>

#include <CLI/CLI.hpp>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace nrx::cli {

/**
 * Context passed to command execution.
 * Contains the engine and the settings it was built from.
 */
struct CommandContext {
    llm::ProviderManager* manager = nullptr;
    const EngineConfig* config = nullptr;
    Logger* logger = nullptr;
    bool json = false;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds.
     *
     * @param ctx Execution context with the provider manager
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Map an engine error to a process exit code.
 */
inline int exit_code_for(const Error& error) {
    switch (error.code()) {
        case ErrorCode::OK:
            return NRX_EXIT_SUCCESS;
        case ErrorCode::INVALID_ARGUMENT:
            return NRX_EXIT_USER_ERROR;
        case ErrorCode::NOT_FOUND:
        case ErrorCode::UNSUPPORTED:
        case ErrorCode::RUNTIME_UNAVAILABLE:
        case ErrorCode::NOT_APPLICABLE:
            return NRX_EXIT_NOT_FOUND;
        case ErrorCode::IO_ERROR:
        case ErrorCode::NETWORK_ERROR:
        case ErrorCode::OUT_OF_SPACE:
        case ErrorCode::CORRUPTION:
        case ErrorCode::CANCELLED:
            return NRX_EXIT_IO_ERROR;
        default:
            return NRX_EXIT_INTERNAL;
    }
}

/**
 * Human readable byte count, e.g. "1.9 GB".
 */
inline std::string format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 3) {
        value /= 1024.0;
        unit++;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << " " << units[unit];
    return ss.str();
}

}  // namespace nrx::cli
