#include <iostream>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "app/command_dispatcher.hpp"
#include "core/errors/tool_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/namespace_guard.hpp"
#include "runtime/execution_actor.hpp"
#include "runtime/script_runtime.hpp"

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and environment into a validated config
    auto parsed = tclhub::app::cli::parse_and_validate(argc, argv);
    if (tclhub::core::errors::is_error(parsed)) {
        const auto& err = tclhub::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& config = tclhub::core::errors::get_value(parsed);
    tclhub::core::logging::Logger::get().set_min_level(config.log_level);
    LOG_INFO("tclhub: bootstrapping (tools=" + config.tools_root.string() +
             ", storage=" + config.storage_root.string() +
             ", privileged=" + (config.privileged ? "yes" : "no") + ")");

    // 2. Start the actor; the interpreter is created on its thread
    tclhub::runtime::ActorOptions options;
    options.tools_root = config.tools_root;
    options.storage_root = config.storage_root;
    options.queue_capacity = config.queue_capacity;

    const std::string runtime_name = config.runtime;
    auto spawned = tclhub::runtime::ExecutionActor::spawn(
        options, [runtime_name]() { return tclhub::runtime::create_runtime(runtime_name); });
    if (tclhub::core::errors::is_error(spawned)) {
        const auto& err = tclhub::core::errors::get_error(spawned);
        LOG_ERROR("Failed to start execution actor [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 3;
    }
    std::unique_ptr<tclhub::runtime::ExecutionActor> actor =
        tclhub::core::errors::take_value(spawned);

    // 3. Index filesystem tools before serving requests
    if (config.discover_on_start) {
        auto discovered = actor->discover_tools().get();
        if (tclhub::core::errors::is_error(discovered)) {
            const auto& err = tclhub::core::errors::get_error(discovered);
            LOG_WARN("Startup discovery failed [" + err.code + "]: " + err.message);
        } else {
            LOG_INFO(tclhub::core::errors::get_value(discovered));
        }
    }

    // 4. Serve one JSON request per stdin line
    tclhub::app::CommandDispatcher dispatcher(
        *actor, tclhub::policy::AccessPolicy{config.privileged});
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        std::cout << dispatcher.handle_line(line) << std::endl;
    }

    LOG_INFO("tclhub: input closed, shutting down");
    return 0;
}
