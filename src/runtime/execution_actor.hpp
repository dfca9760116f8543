#pragma once

#include <cstddef>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/tool_path.hpp"
#include "runtime/command_queue.hpp"
#include "runtime/script_runtime.hpp"
#include "storage/tool_store.hpp"
#include "tools/tool_discovery.hpp"

namespace tclhub::runtime {

struct ActorOptions {
    std::filesystem::path tools_root = "tools";
    std::filesystem::path storage_root;
    std::size_t queue_capacity = 100;
};

// Owns the interpreter, the custom and discovered tool maps and the store.
// Every public call enqueues one command and returns the future of its reply;
// the worker thread runs commands one at a time in dequeue order.
class ExecutionActor {
    // Only spawn() can build one.
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    using TextReply = core::errors::Result<std::string>;
    using ListReply = core::errors::Result<std::vector<std::string>>;
    using DefinitionsReply = core::errors::Result<std::vector<protocol::ToolDefinition>>;

    // The runtime is built on the worker thread. A factory error fails the spawn.
    static core::errors::Result<std::unique_ptr<ExecutionActor>> spawn(ActorOptions options,
                                                                       RuntimeFactory factory);

    ExecutionActor(ConstructionKey, ActorOptions options);

    // Drains queued commands, then joins the worker.
    ~ExecutionActor();

    ExecutionActor(const ExecutionActor&) = delete;
    ExecutionActor& operator=(const ExecutionActor&) = delete;

    std::future<TextReply> execute(std::string script);
    std::future<TextReply> add_tool(protocol::ToolPath path, std::string description,
                                    std::string script,
                                    std::vector<protocol::ParameterDefinition> parameters);
    std::future<TextReply> remove_tool(protocol::ToolPath path);
    std::future<ListReply> list_tools(std::optional<std::string> namespace_filter = std::nullopt,
                                      std::optional<std::string> name_filter = std::nullopt);
    std::future<TextReply> execute_custom_tool(protocol::ToolPath path, nlohmann::json params);
    std::future<DefinitionsReply> get_tool_definitions();
    std::future<TextReply> initialize_persistence();
    std::future<TextReply> exec_tool(std::string path, nlohmann::json params);
    std::future<TextReply> discover_tools();

    // Stops accepting commands. Later calls get a ready Internal error.
    void shutdown();

private:
    struct ExecuteCommand {
        std::string script;
        std::promise<TextReply> reply;
    };
    struct AddToolCommand {
        protocol::ToolDefinition tool;
        std::promise<TextReply> reply;
    };
    struct RemoveToolCommand {
        protocol::ToolPath path;
        std::promise<TextReply> reply;
    };
    struct ListToolsCommand {
        std::optional<std::string> namespace_filter;
        std::optional<std::string> name_filter;
        std::promise<ListReply> reply;
    };
    struct ExecuteCustomToolCommand {
        protocol::ToolPath path;
        nlohmann::json params;
        std::promise<TextReply> reply;
    };
    struct GetToolDefinitionsCommand {
        std::promise<DefinitionsReply> reply;
    };
    struct InitializePersistenceCommand {
        std::promise<TextReply> reply;
    };
    struct ExecToolCommand {
        std::string path;
        nlohmann::json params;
        std::promise<TextReply> reply;
    };
    struct DiscoverToolsCommand {
        std::promise<TextReply> reply;
    };

    using Command = std::variant<ExecuteCommand, AddToolCommand, RemoveToolCommand,
                                 ListToolsCommand, ExecuteCustomToolCommand,
                                 GetToolDefinitionsCommand, InitializePersistenceCommand,
                                 ExecToolCommand, DiscoverToolsCommand>;

    template <typename CommandT>
    auto submit(CommandT command) {
        auto reply = command.reply.get_future();
        Command message(std::move(command));
        if (!queue_.push(message)) {
            std::get<CommandT>(message).reply.set_value(shutdown_error());
        }
        return reply;
    }

    static core::errors::ToolError shutdown_error();

    void run(RuntimeFactory factory, std::promise<core::errors::Result<bool>> started);

    TextReply process(const ExecuteCommand& command);
    TextReply process(AddToolCommand& command);
    TextReply process(const RemoveToolCommand& command);
    ListReply process(const ListToolsCommand& command);
    TextReply process(const ExecuteCustomToolCommand& command);
    DefinitionsReply process(const GetToolDefinitionsCommand& command);
    TextReply process(const InitializePersistenceCommand& command);
    TextReply process(const ExecToolCommand& command);
    TextReply process(const DiscoverToolsCommand& command);

    TextReply evaluate(const std::string& script);
    TextReply run_with_bindings(const std::vector<protocol::ParameterDefinition>& parameters,
                                const nlohmann::json& params, const std::string& body,
                                bool expose_params_array);
    std::vector<std::string> collect_tool_paths(const std::optional<std::string>& namespace_filter,
                                                const std::optional<std::string>& name_filter) const;
    core::errors::Result<std::size_t> open_store();

    ActorOptions options_;
    CommandQueue<Command> queue_;
    std::thread worker_;

    // Touched only on the worker thread.
    std::unique_ptr<ScriptRuntime> runtime_;
    std::map<protocol::ToolPath, protocol::ToolDefinition> custom_tools_;
    std::map<protocol::ToolPath, protocol::DiscoveredTool> discovered_tools_;
    std::optional<storage::ToolStore> store_;
    tools::ToolDiscovery discovery_;
};

}  // namespace tclhub::runtime
