#include <nrx/llm/provider.hpp>

namespace nrx::llm {

const char* status_name(ProviderStatus status) {
    switch (status) {
        case ProviderStatus::UNINITIALIZED: return "uninitialized";
        case ProviderStatus::CHECKING: return "checking";
        case ProviderStatus::DOWNLOADING: return "downloading";
        case ProviderStatus::INITIALIZING: return "initializing";
        case ProviderStatus::READY: return "ready";
        case ProviderStatus::ERROR: return "error";
        case ProviderStatus::UNSUPPORTED: return "unsupported";
    }
    return "uninitialized";
}

}  // namespace nrx::llm
