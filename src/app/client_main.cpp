#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <unistd.h>
#include "app/cli_parser.hpp"
#include "client/tool_client.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "market/symbol.hpp"
#include "routing/keyword_router.hpp"
#include "routing/result_renderer.hpp"

namespace {

using quotebridge::core::logging::LogLevel;
using quotebridge::core::logging::StreamLogger;

std::filesystem::path default_worker_path() {
    std::error_code ec;
    const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return "quotebridge_worker";
    }
    return self.parent_path() / "quotebridge_worker";
}

quotebridge::client::ProcessCommand build_worker_command(
    const quotebridge::app::cli::ClientOptions& options) {
    quotebridge::client::ProcessCommand command;
    command.program = options.worker_path.value_or(default_worker_path()).string();
    if (options.fallback_csv) {
        command.args.push_back("--fallback-csv");
        command.args.push_back(options.fallback_csv->string());
    }
    if (options.offline) {
        command.args.push_back("--offline");
    }
    command.args.push_back("--log-level");
    command.args.push_back(options.debug ? "debug" : "warn");
    return command;
}

// Routes, invokes and prints one prompt. Failures become a single warning line.
bool handle_prompt(const std::string& prompt,
                   const quotebridge::routing::KeywordRouter& router,
                   quotebridge::client::ToolClient& client, StreamLogger& ui,
                   StreamLogger& diag) {
    auto routed = router.route(prompt);
    if (quotebridge::core::errors::is_error(routed)) {
        ui.warn(quotebridge::core::errors::get_error(routed).message);
        return false;
    }
    const auto& call = quotebridge::core::errors::get_value(routed);
    diag.debug("Routed tool call: " + call.name);

    auto response = client.invoke(call);
    if (quotebridge::core::errors::is_error(response)) {
        const auto& err = quotebridge::core::errors::get_error(response);
        ui.warn(err.message);
        diag.debug("Invocation failed [" + err.code + "]");
        return false;
    }
    const auto& result = quotebridge::core::errors::get_value(response);
    diag.debug("Tool response payload: " + result.dump());
    ui.info(quotebridge::routing::render_result(call, result));
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    const bool colour = isatty(STDOUT_FILENO) != 0;
    StreamLogger ui(std::cout, "agent", LogLevel::INFO, colour);
    StreamLogger diag(std::cerr, "debug", LogLevel::WARN, colour);

    auto parsed = quotebridge::app::cli::parse_client_args(argc, argv);
    if (quotebridge::core::errors::is_error(parsed)) {
        const auto& err = quotebridge::core::errors::get_error(parsed);
        ui.error("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            ui.info("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = quotebridge::core::errors::get_value(parsed);
    if (options.debug) {
        diag.set_min_level(LogLevel::DEBUG);
        diag.debug("Debug mode enabled; verbose logs will be displayed.");
    }

    quotebridge::routing::KeywordRouter router;
    quotebridge::client::ToolClient client(build_worker_command(options), diag);
    quotebridge::client::ClientSession session(client);
    if (!session.ok()) {
        const auto& err = session.error();
        ui.error("Failed to start worker [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            ui.info("Hint: " + err.hint);
        }
        return 3;
    }

    if (options.query) {
        return handle_prompt(options.query.value(), router, client, ui, diag) ? 0 : 1;
    }

    ui.info("Keyword routing is enabled. Type 'exit' or 'quit' to leave the session.");
    std::string line;
    while (true) {
        std::cout << "What is your query? > " << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << '\n';
            ui.info("Goodbye.");
            break;
        }
        const std::string input = quotebridge::market::trim(line);
        diag.debug("User input: " + input);
        const std::string command_word = quotebridge::market::to_upper(input);
        if (command_word == "EXIT" || command_word == "QUIT") {
            ui.info("Goodbye.");
            break;
        }
        static_cast<void>(handle_prompt(input, router, client, ui, diag));
    }
    return 0;
}
