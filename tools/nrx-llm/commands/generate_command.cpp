#include "generate_command.hpp"

#include <nrx/llm/error_messages.hpp>

#include <nlohmann/json.hpp>

#include <cmath>

namespace nrx::cli {

void GenerateCommand::setup(CLI::App& app) {
    app.add_option("-s,--system", system_prompt_, "System prompt")
        ->type_name("<text>");

    app.add_option("message", message_, "User message")
        ->required()
        ->type_name("<text>");
}

int GenerateCommand::execute(CommandContext& ctx) {
    int last_reported = -1;
    auto init = ctx.manager->initialize([&last_reported](float progress) {
        int pct = static_cast<int>(std::lround(progress * 100.0f));
        if (pct != last_reported) {
            last_reported = pct;
            std::cerr << "\rPreparing model: " << pct << "%" << std::flush;
        }
    });
    if (last_reported >= 0) {
        std::cerr << "\n";
    }

    if (!init.ok()) {
        if (auto model = ctx.manager->model_config();
            model && ctx.manager->get_status() == llm::ProviderStatus::ERROR &&
            !ctx.manager->is_model_downloaded()) {
            std::cerr << llm::ErrorMessages::download_failed(init.error(), *model);
        } else {
            std::cerr << "Error: " << init.error().to_string() << "\n";
        }
        return exit_code_for(init.error());
    }

    if (ctx.manager->get_status() == llm::ProviderStatus::UNSUPPORTED) {
        if (auto device = ctx.manager->classification()) {
            std::cerr << llm::ErrorMessages::unsupported_device(*device);
        }
        return NRX_EXIT_NOT_FOUND;
    }

    auto reply = ctx.manager->generate(system_prompt_, message_);
    if (!reply.ok()) {
        std::cerr << "Error: " << reply.error().to_string() << "\n";
        return exit_code_for(reply.error());
    }

    if (ctx.json) {
        nlohmann::json out;
        out["provider"] = ctx.manager->provider_name();
        out["text"] = reply.value();
        std::cout << out.dump(2) << "\n";
    } else {
        std::cout << reply.value() << "\n";
    }
    return NRX_EXIT_SUCCESS;
}

}  // namespace nrx::cli
