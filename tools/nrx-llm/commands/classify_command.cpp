#include "classify_command.hpp"

#include <nrx/llm/error_messages.hpp>
#include <nrx/llm/json.hpp>

namespace nrx::cli {

void ClassifyCommand::setup(CLI::App& app) {
    (void)app;
}

int ClassifyCommand::execute(CommandContext& ctx) {
    ctx.manager->resolve();

    auto device = ctx.manager->classification();
    if (!device) {
        std::cerr << "Error: device could not be classified\n";
        return NRX_EXIT_INTERNAL;
    }

    auto model = ctx.manager->model_config();
    bool downloaded = ctx.manager->is_model_downloaded();

    if (ctx.json) {
        nlohmann::json out;
        out["device"] = *device;
        out["provider"] = ctx.manager->provider_name();
        out["status"] = ctx.manager->get_status();
        out["model"] = model ? nlohmann::json(*model) : nlohmann::json(nullptr);
        out["model_downloaded"] = downloaded;
        std::cout << out.dump(2) << "\n";
        return NRX_EXIT_SUCCESS;
    }

    std::cout << "Device:        " << device->model << "\n"
              << "OS:            " << device->os_name << " " << device->os_version << "\n"
              << "Architecture:  " << device->architecture << "\n"
              << "RAM:           " << std::fixed << std::setprecision(1)
              << device->ram_gb << " GB\n"
              << "Foundation:    "
              << (device->foundation_eligible ? "eligible" : "not eligible") << "\n"
              << "Tier:          " << llm::tier_name(device->tier) << "\n"
              << "Provider:      " << ctx.manager->provider_name() << "\n";

    if (model) {
        std::cout << "Model:         " << model->name << " (" << model->size_label << ", "
                  << (downloaded ? "downloaded" : "not downloaded") << ")\n";
    }

    if (ctx.manager->get_status() == llm::ProviderStatus::UNSUPPORTED) {
        std::cout << "\n" << llm::ErrorMessages::unsupported_device(*device);
    }
    return NRX_EXIT_SUCCESS;
}

}  // namespace nrx::cli
