#include "models_command.hpp"

#include <nrx/llm/json.hpp>
#include <nrx/llm/local_provider.hpp>

namespace nrx::cli {

namespace {

// Same size check the runtime uses before loading a file
bool model_present(const llm::ModelDefinition& model, CommandContext& ctx) {
    llm::LocalRuntimeProvider probe(model, *ctx.config, nullptr, nullptr, *ctx.logger);
    return probe.is_model_downloaded();
}

}  // namespace

void ModelsCommand::setup(CLI::App& app) {
    (void)app;
}

int ModelsCommand::execute(CommandContext& ctx) {
    ctx.manager->resolve();

    // Marks the model of the committed backend, which may be a fallback
    const auto committed = ctx.manager->model_config();
    auto is_selected = [&committed](const llm::ModelDefinition& model) {
        return committed && committed->tier == model.tier;
    };

    if (ctx.json) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& model : llm::model_catalog()) {
            nlohmann::json entry = model;
            entry["selected"] = is_selected(model);
            entry["downloaded"] = model_present(model, ctx);
            out.push_back(std::move(entry));
        }
        std::cout << out.dump(2) << "\n";
        return NRX_EXIT_SUCCESS;
    }

    std::cout << "  " << std::left
              << std::setw(10) << "TIER"
              << std::setw(26) << "NAME"
              << std::setw(10) << "SIZE"
              << std::setw(9) << "MIN RAM"
              << "STATUS\n";

    for (const auto& model : llm::model_catalog()) {
        std::ostringstream ram;
        ram << std::fixed << std::setprecision(0) << model.min_ram_gb << " GB";

        std::cout << (is_selected(model) ? "* " : "  ")
                  << std::setw(10) << model.tier
                  << std::setw(26) << model.name
                  << std::setw(10) << model.size_label
                  << std::setw(9) << ram.str()
                  << (model_present(model, ctx) ? "downloaded" : "-") << "\n";
    }

    std::cout << "\nModels directory: " << ctx.config->models_dir.string() << "\n";
    return NRX_EXIT_SUCCESS;
}

}  // namespace nrx::cli
