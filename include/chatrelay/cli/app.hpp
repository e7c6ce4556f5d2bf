#pragma once

#include <CLI/CLI.hpp>

#include "chatrelay/cli/commands.hpp"
#include "chatrelay/core/config.hpp"

namespace chatrelay::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the
/// registered subcommands (request, response, stream, config, version).
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    void setup_commands();

    CLI::App cli_;
    CommandContext ctx_;
};

} // namespace chatrelay::cli
