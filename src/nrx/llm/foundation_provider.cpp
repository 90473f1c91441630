#include <nrx/llm/foundation_provider.hpp>
#include <nrx/llm/device_classifier.hpp>
#include <nrx/llm/error_messages.hpp>

namespace nrx::llm {

namespace {

std::string coerce_to_string(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

}  // namespace

FoundationProvider::FoundationProvider(FoundationBridge* bridge, std::string host_os,
                                       Logger& logger)
    : bridge_(bridge), host_os_(std::move(host_os)), logger_(logger) {}

FoundationProvider::~FoundationProvider() {
    cleanup();
}

ProviderInfo FoundationProvider::info() const {
    ProviderInfo pinfo;
    pinfo.name = "apple-foundation";
    pinfo.is_local = true;
    pinfo.platform_model = true;
    return pinfo;
}

bool FoundationProvider::is_available() {
    if (host_os_ != FOUNDATION_HOST_OS || !bridge_) {
        return false;
    }

    try {
        return bridge_->foundation_models_status() == FOUNDATION_AVAILABLE;
    } catch (const std::exception& e) {
        // "Not supported on this device/OS" surfaces as an exception
        logger_.debug(std::string("[FoundationProvider] Availability check failed: ") + e.what());
        return false;
    } catch (...) {
        logger_.debug("[FoundationProvider] Availability check failed: unknown error");
        return false;
    }
}

Result<void> FoundationProvider::initialize(ProgressCallback) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return initialize_locked();
}

Result<void> FoundationProvider::initialize_locked() {
    if (session_) {
        return {};
    }

    if (!bridge_) {
        status_ = ProviderStatus::ERROR;
        return Error(ErrorCode::RUNTIME_UNAVAILABLE, messages::BRIDGE_UNAVAILABLE);
    }

    try {
        session_ = bridge_->create_session();
    } catch (const std::exception& e) {
        status_ = ProviderStatus::ERROR;
        return Error(ErrorCode::INTERNAL_ERROR,
            std::string("Failed to create foundation model session: ") + e.what());
    } catch (...) {
        status_ = ProviderStatus::ERROR;
        return Error(ErrorCode::INTERNAL_ERROR, "Failed to create foundation model session");
    }

    if (!session_) {
        status_ = ProviderStatus::ERROR;
        return Error(ErrorCode::INTERNAL_ERROR, "Failed to create foundation model session");
    }

    status_ = ProviderStatus::READY;
    logger_.info("[FoundationProvider] Session ready");
    return {};
}

Result<std::string> FoundationProvider::generate(const std::string& system_prompt,
                                                 const std::string& user_message) {
    std::lock_guard<std::mutex> lock(session_mutex_);

    auto init = initialize_locked();
    if (!init.ok()) {
        return init.error();
    }

    try {
        if (configured_prompt_ != system_prompt) {
            session_->configure(system_prompt);
            configured_prompt_ = system_prompt;
        }
        return coerce_to_string(session_->generate_text(user_message));
    } catch (const std::exception& e) {
        return Error(ErrorCode::INTERNAL_ERROR,
            std::string("Foundation model generation failed: ") + e.what());
    } catch (...) {
        return Error(ErrorCode::INTERNAL_ERROR, "Foundation model generation failed");
    }
}

void FoundationProvider::cleanup() {
    std::lock_guard<std::mutex> lock(session_mutex_);

    if (session_) {
        try {
            session_->dispose();
        } catch (const std::exception& e) {
            logger_.warning(std::string("[FoundationProvider] Error disposing session: ") + e.what());
        } catch (...) {
            logger_.warning("[FoundationProvider] Error disposing session: unknown error");
        }
        session_.reset();
    }
    configured_prompt_.reset();
    status_ = ProviderStatus::UNINITIALIZED;
}

}  // namespace nrx::llm
