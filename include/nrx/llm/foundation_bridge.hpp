#pragma once

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace nrx::llm {

// ============================================================================
// Platform Foundation Model Bridge
// ============================================================================

// Status string the bridge reports when the model can be used
constexpr const char* FOUNDATION_AVAILABLE = "available";

/**
 * A stateful session on the platform-supplied model. Methods throw on
 * native failures.
 */
class FoundationSession {
public:
    virtual ~FoundationSession() = default;

    virtual void configure(const std::string& instructions) = 0;

    // The native side is loosely typed; the value is not always a string
    virtual nlohmann::json generate_text(const std::string& prompt) = 0;

    virtual void dispose() = 0;
};

/**
 * Entry point into the native module. A host without the module passes
 * no bridge at all rather than a bridge that always fails.
 */
class FoundationBridge {
public:
    virtual ~FoundationBridge() = default;

    // "available", "unavailable", or a platform-specific reason
    virtual std::string foundation_models_status() = 0;

    virtual std::unique_ptr<FoundationSession> create_session() = 0;
};

}  // namespace nrx::llm
