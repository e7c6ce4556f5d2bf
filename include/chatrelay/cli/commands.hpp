#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "chatrelay/core/config.hpp"

namespace chatrelay::cli {

/// State shared by the global options and every subcommand.
struct CommandContext {
    std::string config_path;
    std::string log_level;  // empty = keep the configured level
    Config config;
};

/// Loads the config file (if any), applies environment and command-line
/// overrides, validates the result and initializes the logger. Throws
/// CLI::RuntimeError on an invalid configuration.
void prepare(CommandContext& ctx);

/// Register the `request` subcommand.
/// Translates a neutral chat request into the provider request body.
void register_request_command(CLI::App& app, CommandContext& ctx);

/// Register the `response` subcommand.
/// Translates a buffered provider reply into a neutral response or error.
void register_response_command(CLI::App& app, CommandContext& ctx);

/// Register the `stream` subcommand.
/// Replays a buffered provider reply as event-stream frames.
void register_stream_command(CLI::App& app, CommandContext& ctx);

/// Register the `config` subcommand.
void register_config_command(CLI::App& app, CommandContext& ctx);

/// Register the `version` subcommand.
void register_version_command(CLI::App& app);

} // namespace chatrelay::cli
