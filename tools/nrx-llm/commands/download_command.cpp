#include "download_command.hpp"

#include <nrx/llm/error_messages.hpp>
#include <nrx/llm/json.hpp>

#include <csignal>

namespace nrx::cli {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) {
    g_interrupted = 1;
}

}  // namespace

void DownloadCommand::setup(CLI::App& app) {
    (void)app;
}

int DownloadCommand::execute(CommandContext& ctx) {
    ctx.manager->resolve();

    auto model = ctx.manager->model_config();
    if (!model) {
        if (ctx.manager->is_model_downloaded()) {
            std::cout << "Provider " << ctx.manager->provider_name()
                      << " uses a platform model; nothing to download.\n";
            return NRX_EXIT_SUCCESS;
        }
        if (auto device = ctx.manager->classification()) {
            std::cerr << llm::ErrorMessages::unsupported_device(*device);
        }
        return NRX_EXIT_NOT_FOUND;
    }

    if (ctx.manager->is_model_downloaded()) {
        std::cout << model->name << " is already downloaded ("
                  << format_bytes(ctx.manager->model_size()) << ").\n";
        return NRX_EXIT_SUCCESS;
    }

    g_interrupted = 0;
    auto previous = std::signal(SIGINT, on_interrupt);

    if (!ctx.json) {
        std::cout << "Downloading " << model->name << " (" << model->size_label << ")\n";
    }

    llm::ProviderManager* manager = ctx.manager;
    bool json = ctx.json;
    auto result = manager->download_model([manager, json](const llm::DownloadProgress& p) {
        if (g_interrupted) {
            manager->cancel_download();
            return;
        }
        if (json) {
            std::cout << nlohmann::json(p).dump() << "\n" << std::flush;
            return;
        }
        std::cout << "\r  " << std::setw(3) << p.percentage << "%  "
                  << format_bytes(p.bytes_downloaded) << " / " << format_bytes(p.total_bytes);
        if (p.estimated_seconds_remaining) {
            std::cout << "  ~" << *p.estimated_seconds_remaining << "s left   ";
        }
        std::cout << std::flush;
    });

    std::signal(SIGINT, previous);
    if (!ctx.json) {
        std::cout << "\n";
    }

    if (!result.ok()) {
        std::cerr << llm::ErrorMessages::download_failed(result.error(), *model);
        return exit_code_for(result.error());
    }

    if (!ctx.json) {
        std::cout << "Saved " << model->filename << " to "
                  << ctx.config->models_dir.string() << "\n";
    }
    return NRX_EXIT_SUCCESS;
}

}  // namespace nrx::cli
