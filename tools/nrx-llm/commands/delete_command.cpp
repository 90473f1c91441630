#include "delete_command.hpp"

namespace nrx::cli {

void DeleteCommand::setup(CLI::App& app) {
    app.add_flag("-f,--force", force_, "Skip confirmation prompt");
}

int DeleteCommand::execute(CommandContext& ctx) {
    ctx.manager->resolve();

    auto model = ctx.manager->model_config();
    if (!model) {
        std::cerr << "Error: provider " << ctx.manager->provider_name()
                  << " has no downloaded model\n";
        return NRX_EXIT_NOT_FOUND;
    }

    uint64_t size = ctx.manager->model_size();
    if (size == 0) {
        std::cout << model->name << " is not downloaded.\n";
        return NRX_EXIT_SUCCESS;
    }

    // Confirm deletion unless --force
    if (!force_) {
        std::cout << "Delete " << model->name << " (" << format_bytes(size) << ")? [y/N] ";
        std::string response;
        std::getline(std::cin, response);
        if (response != "y" && response != "Y") {
            std::cout << "Cancelled.\n";
            return NRX_EXIT_SUCCESS;
        }
    }

    auto result = ctx.manager->delete_model();
    if (!result.ok()) {
        std::cerr << "Error: " << result.error().to_string() << "\n";
        return exit_code_for(result.error());
    }
    ctx.manager->reset();

    std::cout << "Deleted " << model->filename << "\n";
    return NRX_EXIT_SUCCESS;
}

}  // namespace nrx::cli
