#pragma once

#include "foundation_bridge.hpp"
#include "provider.hpp"

#include <nrx/util/logger.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace nrx::llm {

/**
 * Backend over the platform foundation model.
 *
 * Keeps one native session and remembers the last system prompt it was
 * configured with, so repeated calls with the same persona skip the
 * configure round trip.
 */
class FoundationProvider : public LLMProvider {
public:
    /**
     * @param bridge  Native bridge, or nullptr if the module failed to load
     * @param host_os OS name the process runs on (e.g. "ios")
     */
    FoundationProvider(FoundationBridge* bridge, std::string host_os, Logger& logger);
    ~FoundationProvider() override;

    FoundationProvider(const FoundationProvider&) = delete;
    FoundationProvider& operator=(const FoundationProvider&) = delete;

    ProviderInfo info() const override;
    bool is_available() override;
    Result<void> initialize(ProgressCallback on_progress = nullptr) override;
    Result<std::string> generate(const std::string& system_prompt,
                                 const std::string& user_message) override;
    void cleanup() override;
    ProviderStatus status() const override { return status_; }

private:
    FoundationBridge* bridge_;
    std::string host_os_;
    Logger& logger_;

    std::unique_ptr<FoundationSession> session_;
    std::optional<std::string> configured_prompt_;
    std::atomic<ProviderStatus> status_{ProviderStatus::UNINITIALIZED};
    std::mutex session_mutex_;

    Result<void> initialize_locked();
};

}  // namespace nrx::llm
