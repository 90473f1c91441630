#include <nrx/llm/error_messages.hpp>

#include <iomanip>
#include <sstream>

namespace nrx::llm {

std::string ErrorMessages::unsupported_device(const DeviceClassification& device) {
    std::ostringstream ss;
    ss << "LLM Error: " << messages::INFERENCE_UNSUPPORTED << "\n"
       << "\n"
       << "  Device:       " << device.model << "\n"
       << "  Architecture: " << device.architecture << "\n"
       << "  RAM:          " << std::fixed << std::setprecision(1)
       << device.ram_gb << " GB\n"
       << "\n"
       << "On-device inference requires:\n";

    if (device.architecture != "arm64") {
        ss << "  - A 64-bit ARM processor (arm64 / aarch64)\n";
    }
    if (device.ram_gb < MINIMAL_MIN_RAM_GB) {
        ss << "  - At least " << std::setprecision(0) << MINIMAL_MIN_RAM_GB
           << " GB of RAM\n";
    }
    if (device.architecture == "arm64" && device.ram_gb >= MINIMAL_MIN_RAM_GB) {
        ss << "  - The llama.cpp runtime, which is missing from this build\n"
           << "    or disabled on this host (NRX_SANDBOXED)\n";
    }
    return ss.str();
}

std::string ErrorMessages::download_failed(const Error& error, const ModelDefinition& model) {
    std::ostringstream ss;
    ss << "LLM Error: Could not download " << model.name
       << " (" << model.size_label << ")\n"
       << "  " << error.message() << "\n"
       << "\n";

    switch (error.code()) {
        case ErrorCode::CANCELLED:
            ss << "The partial file was removed. Run the download again to restart it.\n";
            break;
        case ErrorCode::CORRUPTION:
            ss << "The downloaded file did not match the expected size and was deleted.\n"
               << "The model may have been re-uploaded; try again later.\n";
            break;
        case ErrorCode::OUT_OF_SPACE:
            ss << "Free up disk space or point NRX_MODELS_DIR at a larger volume.\n";
            break;
        default:
            ss << "Troubleshooting:\n"
               << "  - Check your network connection\n"
               << "  - Verify the URL is reachable: " << model.download_url << "\n";
            break;
    }
    return ss.str();
}

std::string ErrorMessages::setup_help() {
    std::ostringstream ss;
    ss << "nrx On-Device LLM Setup\n"
       << "=======================\n"
       << "\n"
       << "The engine picks a backend for this device automatically:\n"
       << "  1. The platform foundation model (iOS " << MIN_FOUNDATION_OS_VERSION
       << "+ on eligible hardware)\n"
       << "  2. A downloaded GGUF model run through llama.cpp\n"
       << "  3. Unsupported, when neither can run\n"
       << "\n"
       << "Models (largest that fits in RAM is chosen):\n";

    for (const auto& model : model_catalog()) {
        ss << "  " << std::left << std::setw(9) << model.tier
           << std::setw(24) << model.name
           << std::setw(10) << model.size_label
           << "needs " << std::fixed << std::setprecision(0) << model.min_ram_gb
           << " GB RAM\n";
    }

    ss << "\n"
       << "Environment:\n"
       << "  NRX_MODELS_DIR       Where model files are stored (default ~/.nrx/models)\n"
       << "  NRX_LOG_LEVEL        debug, info, warning or error\n"
       << "  NRX_SANDBOXED        Set to 1 to disable the embedded runtime\n"
       << "  NRX_DEVICE_RAM_GB    Override detected RAM\n"
       << "  NRX_DEVICE_ABIS      Override detected ABIs (comma separated)\n"
       << "  NRX_DEVICE_MODEL     Override the device model identifier\n"
       << "  NRX_HOST_OS          Override the OS name\n"
       << "  NRX_HOST_OS_VERSION  Override the OS version\n";
    return ss.str();
}

}  // namespace nrx::llm
