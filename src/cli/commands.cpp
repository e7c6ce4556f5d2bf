#include "chatrelay/cli/commands.hpp"
#include "chatrelay/core/logger.hpp"

#include <csignal>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <nlohmann/json.hpp>

#include "chatrelay/core/cancellation.hpp"
#include "chatrelay/protocol/neutral.hpp"
#include "chatrelay/relay/chat_relay.hpp"
#include "chatrelay/relay/response_writer.hpp"
#include "chatrelay/relay/upstream_body.hpp"

#ifndef CHATRELAY_VERSION_STRING
#define CHATRELAY_VERSION_STRING "0.1.0-dev"
#endif

namespace chatrelay::cli {

using json = nlohmann::json;

namespace {

constexpr int kExitFailure = 1;

auto read_file(const std::string& path) -> Result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::TransportReadFailure, "Cannot open file", path));
    }
    std::string data((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::unexpected(make_error(
            ErrorCode::TransportReadFailure, "Failed to read file", path));
    }
    return data;
}

/// Reads `path` or fails the command with a logged error.
auto read_input(const std::string& path) -> std::string {
    auto data = read_file(path);
    if (!data) {
        LOG_ERROR("{}", data.error().what());
        throw CLI::RuntimeError(kExitFailure);
    }
    return std::move(*data);
}

void print_envelope(const relay::ErrorEnvelope& envelope) {
    std::cout << relay::encode_envelope(envelope) << "\n";
    std::cout.flush();
}

/// Options shared by the `response` and `stream` subcommands.
struct ReplyOptions {
    std::string file;
    std::string model = "gemini-pro";
    int prompt_tokens = 0;
    int status = 200;
    bool include_head = false;
};

void add_reply_options(CLI::App* sub, const std::shared_ptr<ReplyOptions>& opts) {
    sub->add_option("file", opts->file, "Provider response body (JSON)")
        ->required()
        ->check(CLI::ExistingFile);
    sub->add_option("-m,--model", opts->model, "Requested model name")
        ->capture_default_str();
    sub->add_option("--prompt-tokens", opts->prompt_tokens,
                    "Prompt token count computed by the caller")
        ->check(CLI::NonNegativeNumber);
    sub->add_option("--status", opts->status, "Upstream HTTP status")
        ->check(CLI::Range(100, 599))
        ->capture_default_str();
    sub->add_flag("--include-head", opts->include_head,
                  "Print status line and headers before the body");
}

} // anonymous namespace

void prepare(CommandContext& ctx) {
    // Early init so config loading can log.
    Logger::init("chatrelay", ctx.log_level.empty() ? "info" : ctx.log_level);

    ctx.config = ctx.config_path.empty()
        ? default_config()
        : load_config(std::filesystem::path(ctx.config_path));
    apply_env_overrides(ctx.config);
    if (!ctx.log_level.empty()) {
        ctx.config.log_level = ctx.log_level;
    }
    Logger::set_level(ctx.config.log_level);

    if (auto valid = validate_config(ctx.config); !valid) {
        LOG_ERROR("Invalid configuration: {}", valid.error().what());
        throw CLI::RuntimeError(kExitFailure);
    }
}

// ---------------------------------------------------------------------------
// request command
// ---------------------------------------------------------------------------

void register_request_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("request",
        "Translate a neutral chat request into a Gemini request body");

    auto file = std::make_shared<std::string>();
    sub->add_option("file", *file, "Neutral chat request (JSON)")
        ->required()
        ->check(CLI::ExistingFile);

    sub->callback([&ctx, file]() {
        prepare(ctx);

        auto request = protocol::neutral::decode_request(read_input(*file));
        if (!request) {
            LOG_ERROR("Invalid chat request: {}", request.error().what());
            throw CLI::RuntimeError(kExitFailure);
        }

        relay::ChatRelay relay(ctx.config);
        auto body = relay.encode_request(*request);
        if (!body) {
            LOG_ERROR("Failed to encode Gemini request: {}", body.error().what());
            throw CLI::RuntimeError(kExitFailure);
        }

        LOG_DEBUG("Translated request: model={} messages={}",
                  request->model, request->messages.size());
        std::cout << json::parse(*body).dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// response command
// ---------------------------------------------------------------------------

void register_response_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("response",
        "Translate a buffered Gemini reply into a neutral chat response");

    auto opts = std::make_shared<ReplyOptions>();
    add_reply_options(sub, opts);

    sub->callback([&ctx, opts]() {
        prepare(ctx);

        relay::ChatRelay relay(ctx.config);
        relay::StreamWriter writer(std::cout, opts->include_head);
        auto reply = relay::make_buffered_reply(opts->status, read_input(opts->file));

        auto usage = relay.relay_response(std::move(reply), opts->model,
                                          opts->prompt_tokens, writer);
        if (!usage) {
            print_envelope(usage.error());
            throw CLI::RuntimeError(kExitFailure);
        }

        std::cout << "\n";
        LOG_INFO("usage: prompt={} completion={} total={}",
                 usage->prompt_tokens, usage->completion_tokens, usage->total_tokens);
    });
}

// ---------------------------------------------------------------------------
// stream command
// ---------------------------------------------------------------------------

void register_stream_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("stream",
        "Replay a buffered Gemini reply as event-stream frames");

    auto opts = std::make_shared<ReplyOptions>();
    add_reply_options(sub, opts);

    auto timeout_ms = std::make_shared<int>(-1);
    sub->add_option("--timeout-ms", *timeout_ms,
                    "Stream deadline in milliseconds (0 disables; default: from config)");

    sub->callback([&ctx, opts, timeout_ms]() {
        prepare(ctx);
        if (*timeout_ms >= 0) {
            ctx.config.relay.stream_timeout_ms = *timeout_ms;
        }

        relay::ChatRelay relay(ctx.config);
        relay::StreamWriter writer(std::cout, opts->include_head);
        auto reply = relay::make_buffered_reply(opts->status, read_input(opts->file));

        boost::asio::io_context ioc;
        CancellationSource cancel;

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&cancel](auto ec, auto /*sig*/) {
            if (!ec) {
                LOG_INFO("Received shutdown signal, cancelling stream");
                cancel.cancel();
            }
        });

        std::optional<relay::RelayResult<protocol::neutral::Usage>> result;
        std::exception_ptr failure;
        boost::asio::co_spawn(
            ioc,
            relay.relay_stream(std::move(reply), opts->model, opts->prompt_tokens,
                               writer, cancel.token()),
            [&](std::exception_ptr ep, relay::RelayResult<protocol::neutral::Usage> r) {
                failure = ep;
                if (!ep) result = std::move(r);
                signals.cancel();
            });

        ioc.run();

        if (failure) {
            std::rethrow_exception(failure);
        }
        if (!result) {
            LOG_ERROR("Stream ended without a result");
            throw CLI::RuntimeError(kExitFailure);
        }
        if (!*result) {
            print_envelope(result->error());
            throw CLI::RuntimeError(kExitFailure);
        }

        const auto& usage = **result;
        LOG_INFO("usage: prompt={} completion={} total={}",
                 usage.prompt_tokens, usage.completion_tokens, usage.total_tokens);
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("config", "Show or validate configuration");

    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only,
                  "Validate configuration without printing");

    sub->callback([&ctx, validate_only]() {
        prepare(ctx);

        if (*validate_only) {
            // prepare() has already rejected an invalid configuration.
            std::cout << "Configuration is valid.\n";
            return;
        }

        json j = ctx.config;
        std::cout << j.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "chatrelay " << CHATRELAY_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace chatrelay::cli
