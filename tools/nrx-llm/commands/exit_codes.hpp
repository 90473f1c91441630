#pragma once

namespace nrx::cli {

// Standard exit codes for CLI commands
// Named with NRX_ prefix to avoid conflict with system macros
constexpr int NRX_EXIT_SUCCESS = 0;
constexpr int NRX_EXIT_USER_ERROR = 1;     // Invalid arguments, usage errors
constexpr int NRX_EXIT_NOT_FOUND = 2;      // Unsupported device, nothing to act on
constexpr int NRX_EXIT_IO_ERROR = 3;       // File/network/storage errors
constexpr int NRX_EXIT_INTERNAL = 4;       // Internal/unexpected errors

}  // namespace nrx::cli
