#include <nrx/llm/unsupported_provider.hpp>
#include <nrx/llm/error_messages.hpp>

namespace nrx::llm {

ProviderInfo UnsupportedProvider::info() const {
    ProviderInfo pinfo;
    pinfo.name = "unsupported";
    pinfo.is_local = true;
    pinfo.platform_model = false;
    return pinfo;
}

Result<void> UnsupportedProvider::initialize(ProgressCallback) {
    return Ok();
}

Result<std::string> UnsupportedProvider::generate(const std::string&, const std::string&) {
    return Error(ErrorCode::UNSUPPORTED, messages::INFERENCE_UNSUPPORTED);
}

}  // namespace nrx::llm
