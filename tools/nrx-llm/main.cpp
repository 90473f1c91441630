#include "commands/classify_command.hpp"
#include "commands/delete_command.hpp"
#include "commands/download_command.hpp"
#include "commands/generate_command.hpp"
#include "commands/models_command.hpp"

#include <nrx/nrx.hpp>
#include <nrx/llm/device_info.hpp>
#include <nrx/llm/downloader.hpp>
#include <nrx/llm/error_messages.hpp>
#include <nrx/llm/llamacpp_runtime.hpp>

#include <memory>
#include <vector>

namespace {

// OS name for the foundation backend; empty when it cannot be read
std::string detect_host_os(nrx::llm::DeviceInfoSource& info, nrx::Logger& logger) {
    try {
        return info.os_name();
    } catch (const std::exception& e) {
        logger.warning(std::string("Could not read host OS: ") + e.what());
        return "";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace nrx;

    CLI::App app{"On-device LLM engine", "nrx-llm"};
    app.require_subcommand(1);
    app.fallthrough();
    app.footer(llm::ErrorMessages::setup_help());

    bool json = false;
    bool verbose = false;
    app.add_flag("--json", json, "Print machine readable JSON");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    std::vector<std::unique_ptr<cli::Command>> commands;
    commands.push_back(std::make_unique<cli::ClassifyCommand>());
    commands.push_back(std::make_unique<cli::ModelsCommand>());
    commands.push_back(std::make_unique<cli::DownloadCommand>());
    commands.push_back(std::make_unique<cli::GenerateCommand>());
    commands.push_back(std::make_unique<cli::DeleteCommand>());

    for (auto& cmd : commands) {
        CLI::App* sub = app.add_subcommand(cmd->name(), cmd->description());
        cmd->setup(*sub);
    }

    CLI11_PARSE(app, argc, argv);

    auto config_result = EngineConfig::from_env();
    if (!config_result.ok()) {
        std::cerr << "Error: " << config_result.error().to_string() << "\n";
        return cli::NRX_EXIT_USER_ERROR;
    }
    EngineConfig config = std::move(config_result.value());

    ConsoleLogger logger;
    logger.set_min_level(verbose ? LogLevel::DEBUG : config.log_level);

    llm::HostDeviceInfo device_info(config.device);
    llm::DeviceClassifier classifier(&device_info, logger);

    // No foundation model bridge exists for this platform
    llm::FoundationBridge* bridge = nullptr;
    logger.debug("Foundation model bridge not present on this host");

    std::unique_ptr<llm::InferenceRuntime> runtime = llm::LlamaCppRuntime::load(logger);
    llm::CurlDownloader downloader(logger);

    llm::DefaultProviderFactory factory(config, detect_host_os(device_info, logger),
                                        bridge, runtime.get(), &downloader, logger);
    llm::ProviderManager manager(classifier, factory, logger);

    cli::CommandContext ctx;
    ctx.manager = &manager;
    ctx.config = &config;
    ctx.logger = &logger;
    ctx.json = json;

    for (auto& cmd : commands) {
        if (app.got_subcommand(cmd->name())) {
            return cmd->execute(ctx);
        }
    }
    return cli::NRX_EXIT_USER_ERROR;
}
