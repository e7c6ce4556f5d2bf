#include "chatrelay/cli/app.hpp"
#include "chatrelay/core/logger.hpp"

// Version string; typically injected by CMake via -DCHATRELAY_VERSION_STRING=...
#ifndef CHATRELAY_VERSION_STRING
#define CHATRELAY_VERSION_STRING "0.1.0-dev"
#endif

namespace chatrelay::cli {

App::App()
    : cli_("chatrelay", "Gemini chat completion relay")
{
    cli_.set_version_flag("--version", CHATRELAY_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", ctx_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("CHATRELAY_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", ctx_.log_level,
                    "Log level (trace, debug, info, warn, error, critical, off)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error",
                               "critical", "off"}));

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    int code = 0;
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::Error& e) {
        code = cli_.exit(e);
    }
    Logger::flush();
    return code;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() const -> const Config& {
    return ctx_.config;
}

void App::setup_commands() {
    register_request_command(cli_, ctx_);
    register_response_command(cli_, ctx_);
    register_stream_command(cli_, ctx_);
    register_config_command(cli_, ctx_);
    register_version_command(cli_);
}

} // namespace chatrelay::cli
