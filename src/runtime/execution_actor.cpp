#include "runtime/execution_actor.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "policy/namespace_guard.hpp"

namespace tclhub::runtime {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;
using protocol::ParameterDefinition;
using protocol::ToolDefinition;
using protocol::ToolPath;

namespace {

std::vector<ToolPath> builtin_system_tools() {
    return {ToolPath::bin("tcl_execute"),   ToolPath::sbin("tcl_tool_add"),
            ToolPath::sbin("tcl_tool_remove"), ToolPath::bin("tcl_tool_list"),
            ToolPath::bin("exec_tool"),     ToolPath::bin("discover_tools"),
            ToolPath::docs("molt_book")};
}

// Strings are double-quoted with inner quotes escaped; everything else uses
// its JSON text.
std::string to_tcl_literal(const json& value) {
    if (!value.is_string()) {
        return value.dump();
    }
    std::string literal = "\"";
    for (const char c : value.get<std::string>()) {
        if (c == '"') {
            literal += "\\\"";
        } else {
            literal += c;
        }
    }
    literal += "\"";
    return literal;
}

const json& as_object(const json& params) {
    static const json empty = json::object();
    return params.is_object() ? params : empty;
}

std::optional<std::string> string_param(const json& params, const std::string& key) {
    const auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

bool passes_filters(const ToolPath& path, const std::optional<std::string>& namespace_filter,
                    const std::optional<std::string>& name_filter) {
    if (namespace_filter.has_value() && !protocol::matches_namespace(path.ns, *namespace_filter)) {
        return false;
    }
    return !name_filter.has_value() || path.to_string().find(*name_filter) != std::string::npos;
}

ToolError not_found(const std::string& path) {
    return ToolError{ErrorCategory::NotFound, "Tool '" + path + "' not found", "tool_not_found"};
}

ToolError missing_parameter(const std::string& name) {
    return ToolError{ErrorCategory::MissingRequiredParameter,
                     "Missing required parameter: " + name, "missing_required_parameter"};
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string joined;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += items[i];
    }
    return joined;
}

}  // namespace

core::errors::Result<std::unique_ptr<ExecutionActor>> ExecutionActor::spawn(
    ActorOptions options, RuntimeFactory factory) {
    auto actor = std::make_unique<ExecutionActor>(ConstructionKey{}, std::move(options));

    std::promise<core::errors::Result<bool>> started;
    auto started_future = started.get_future();
    actor->worker_ =
        std::thread(&ExecutionActor::run, actor.get(), std::move(factory), std::move(started));

    auto start_result = started_future.get();
    if (core::errors::is_error(start_result)) {
        actor->queue_.close();
        actor->worker_.join();
        return core::errors::get_error(start_result);
    }
    return std::move(actor);
}

ExecutionActor::ExecutionActor(ConstructionKey, ActorOptions options)
    : options_(std::move(options)),
      queue_(options_.queue_capacity),
      discovery_(options_.tools_root) {}

ExecutionActor::~ExecutionActor() {
    shutdown();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ExecutionActor::shutdown() {
    queue_.close();
}

ToolError ExecutionActor::shutdown_error() {
    return ToolError{ErrorCategory::Internal, "Execution actor is shut down.", "actor_stopped"};
}

std::future<ExecutionActor::TextReply> ExecutionActor::execute(std::string script) {
    return submit(ExecuteCommand{std::move(script), {}});
}

std::future<ExecutionActor::TextReply> ExecutionActor::add_tool(
    ToolPath path, std::string description, std::string script,
    std::vector<ParameterDefinition> parameters) {
    ToolDefinition tool{std::move(path), std::move(description), std::move(script),
                        std::move(parameters)};
    return submit(AddToolCommand{std::move(tool), {}});
}

std::future<ExecutionActor::TextReply> ExecutionActor::remove_tool(ToolPath path) {
    return submit(RemoveToolCommand{std::move(path), {}});
}

std::future<ExecutionActor::ListReply> ExecutionActor::list_tools(
    std::optional<std::string> namespace_filter, std::optional<std::string> name_filter) {
    return submit(ListToolsCommand{std::move(namespace_filter), std::move(name_filter), {}});
}

std::future<ExecutionActor::TextReply> ExecutionActor::execute_custom_tool(ToolPath path,
                                                                           json params) {
    return submit(ExecuteCustomToolCommand{std::move(path), std::move(params), {}});
}

std::future<ExecutionActor::DefinitionsReply> ExecutionActor::get_tool_definitions() {
    return submit(GetToolDefinitionsCommand{});
}

std::future<ExecutionActor::TextReply> ExecutionActor::initialize_persistence() {
    return submit(InitializePersistenceCommand{});
}

std::future<ExecutionActor::TextReply> ExecutionActor::exec_tool(std::string path,
                                                                 json params) {
    return submit(ExecToolCommand{std::move(path), std::move(params), {}});
}

std::future<ExecutionActor::TextReply> ExecutionActor::discover_tools() {
    return submit(DiscoverToolsCommand{});
}

void ExecutionActor::run(RuntimeFactory factory,
                         std::promise<core::errors::Result<bool>> started) {
    auto created = factory ? factory()
                           : core::errors::Result<std::unique_ptr<ScriptRuntime>>(
                                 ToolError{ErrorCategory::Internal, "No runtime factory given.",
                                           "runtime_create_failed"});
    if (core::errors::is_error(created)) {
        LOG_ERROR("ExecutionActor: runtime creation failed: " +
                  core::errors::get_error(created).message);
        started.set_value(core::errors::get_error(created));
        return;
    }
    runtime_ = core::errors::take_value(created);

    LOG_INFO("ExecutionActor: started with runtime " + runtime_->name() + " " +
             runtime_->version() + " (safe=" + (runtime_->is_safe() ? "yes" : "no") +
             ", features=" + join(runtime_->features(), ",") + ")");
    started.set_value(true);

    while (auto command = queue_.pop()) {
        std::visit([this](auto& cmd) { cmd.reply.set_value(process(cmd)); }, *command);
    }

    // The interpreter is torn down on the thread that created it.
    runtime_.reset();
    LOG_INFO("ExecutionActor: stopped");
}

ExecutionActor::TextReply ExecutionActor::evaluate(const std::string& script) {
    return runtime_->eval(script);
}

ExecutionActor::TextReply ExecutionActor::process(const ExecuteCommand& command) {
    return evaluate(command.script);
}

ExecutionActor::TextReply ExecutionActor::process(AddToolCommand& command) {
    const policy::NamespaceGuard guard;
    auto allowed = guard.validate_mutation(command.tool.path, "add");
    if (core::errors::is_error(allowed)) {
        return core::errors::get_error(allowed);
    }

    // Stored tools are loaded first so a duplicate already on disk is caught.
    if (!store_.has_value()) {
        auto opened = open_store();
        if (core::errors::is_error(opened)) {
            LOG_WARN("ExecutionActor: persistence unavailable, keeping tools in memory: " +
                     core::errors::get_error(opened).message);
        }
    }

    const std::string path_text = command.tool.path.to_string();
    if (custom_tools_.find(command.tool.path) != custom_tools_.end()) {
        return ToolError{ErrorCategory::DuplicateTool, "Tool '" + path_text + "' already exists",
                         "duplicate_tool", "Remove the existing tool or pick another version."};
    }

    bool persisted = false;
    if (store_.has_value()) {
        auto saved = store_->save(command.tool);
        if (core::errors::is_error(saved)) {
            LOG_WARN("ExecutionActor: failed to persist " + path_text + ": " +
                     core::errors::get_error(saved).message);
        } else {
            persisted = true;
        }
    }

    auto key = command.tool.path;
    custom_tools_.insert_or_assign(std::move(key), std::move(command.tool));

    if (persisted) {
        return "Tool '" + path_text + "' added successfully and persisted";
    }
    return "Tool '" + path_text + "' added to memory (persistence unavailable)";
}

ExecutionActor::TextReply ExecutionActor::process(const RemoveToolCommand& command) {
    const policy::NamespaceGuard guard;
    auto allowed = guard.validate_mutation(command.path, "remove");
    if (core::errors::is_error(allowed)) {
        return core::errors::get_error(allowed);
    }

    const std::string path_text = command.path.to_string();
    const bool removed_from_memory = custom_tools_.erase(command.path) > 0;

    bool removed_from_store = false;
    if (store_.has_value()) {
        auto removed = store_->remove(command.path);
        if (core::errors::is_error(removed)) {
            LOG_WARN("ExecutionActor: failed to delete stored " + path_text + ": " +
                     core::errors::get_error(removed).message);
        } else {
            removed_from_store = core::errors::get_value(removed);
        }
    }

    if (!removed_from_memory && !removed_from_store) {
        return not_found(path_text);
    }
    return "Tool '" + path_text + "' removed successfully";
}

ExecutionActor::ListReply ExecutionActor::process(const ListToolsCommand& command) {
    return collect_tool_paths(command.namespace_filter, command.name_filter);
}

std::vector<std::string> ExecutionActor::collect_tool_paths(
    const std::optional<std::string>& namespace_filter,
    const std::optional<std::string>& name_filter) const {
    std::vector<std::string> paths;
    for (const auto& path : builtin_system_tools()) {
        if (passes_filters(path, namespace_filter, name_filter)) {
            paths.push_back(path.to_string());
        }
    }
    for (const auto& [path, tool] : custom_tools_) {
        if (passes_filters(path, namespace_filter, name_filter)) {
            paths.push_back(path.to_string());
        }
    }
    for (const auto& [path, tool] : discovered_tools_) {
        if (passes_filters(path, namespace_filter, name_filter)) {
            paths.push_back(path.to_string());
        }
    }

    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
    return paths;
}

ExecutionActor::TextReply ExecutionActor::process(const ExecuteCustomToolCommand& command) {
    const auto it = custom_tools_.find(command.path);
    if (it == custom_tools_.end()) {
        return not_found(command.path.to_string());
    }
    return run_with_bindings(it->second.parameters, command.params, it->second.script, false);
}

ExecutionActor::TextReply ExecutionActor::run_with_bindings(
    const std::vector<ParameterDefinition>& parameters, const json& params,
    const std::string& body, const bool expose_params_array) {
    const json& supplied = as_object(params);

    std::ostringstream script;
    for (const auto& parameter : parameters) {
        const auto value = supplied.find(parameter.name);
        if (value != supplied.end()) {
            script << "set " << parameter.name << " " << to_tcl_literal(*value) << "\n";
        } else if (parameter.required) {
            return missing_parameter(parameter.name);
        }
    }

    if (expose_params_array) {
        script << "array set params {}\n";
        for (const auto& item : supplied.items()) {
            script << "set params(" << item.key() << ") " << to_tcl_literal(item.value())
                   << "\n";
        }
    }

    script << body;
    return evaluate(script.str());
}

ExecutionActor::DefinitionsReply ExecutionActor::process(const GetToolDefinitionsCommand&) {
    std::vector<ToolDefinition> definitions;
    definitions.reserve(custom_tools_.size() + discovered_tools_.size());
    for (const auto& [path, tool] : custom_tools_) {
        definitions.push_back(tool);
    }
    for (const auto& [path, discovered] : discovered_tools_) {
        definitions.push_back(ToolDefinition{discovered.path, discovered.description,
                                             "# Tool loaded from: " + discovered.file_path.string(),
                                             discovered.parameters});
    }
    return definitions;
}

ExecutionActor::TextReply ExecutionActor::process(const InitializePersistenceCommand&) {
    if (store_.has_value()) {
        return std::string("Persistence already initialized");
    }
    auto loaded = open_store();
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    return "Persistence initialized. Loaded " +
           std::to_string(core::errors::get_value(loaded)) + " tools from storage.";
}

core::errors::Result<std::size_t> ExecutionActor::open_store() {
    auto opened = storage::ToolStore::open(options_.storage_root);
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }
    auto& store = std::get<storage::ToolStore>(opened);

    auto stored = store.list();
    if (core::errors::is_error(stored)) {
        return core::errors::get_error(stored);
    }

    const auto& tools = core::errors::get_value(stored);
    for (const auto& tool : tools) {
        if (protocol::is_user_namespace(tool.path.ns)) {
            custom_tools_.insert_or_assign(tool.path, tool);
        }
    }
    store_.emplace(std::move(store));
    LOG_INFO("ExecutionActor: persistence ready at " + store_->root().string() + ", loaded " +
             std::to_string(tools.size()) + " tools");
    return tools.size();
}

ExecutionActor::TextReply ExecutionActor::process(const ExecToolCommand& command) {
    auto parsed = ToolPath::parse(command.path);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const auto& path = core::errors::get_value(parsed);

    const auto custom = custom_tools_.find(path);
    if (custom != custom_tools_.end()) {
        return run_with_bindings(custom->second.parameters, command.params,
                                 custom->second.script, true);
    }

    const auto discovered = discovered_tools_.find(path);
    if (discovered != discovered_tools_.end()) {
        std::ifstream in(discovered->second.file_path);
        if (!in.is_open()) {
            return ToolError{ErrorCategory::DiscoveryIO,
                             "Unable to read tool script " +
                                 discovered->second.file_path.string(),
                             "tool_script_unreadable",
                             "Run discover_tools again if the file moved."};
        }
        std::ostringstream body;
        body << in.rdbuf();
        return run_with_bindings(discovered->second.parameters, command.params, body.str(),
                                 false);
    }

    const json& params = as_object(command.params);
    if (path == ToolPath::bin("tcl_execute")) {
        const auto script = string_param(params, "script");
        if (!script.has_value()) {
            return missing_parameter("script");
        }
        return evaluate(script.value());
    }
    if (path == ToolPath::bin("tcl_tool_list")) {
        return join(collect_tool_paths(string_param(params, "namespace"),
                                       string_param(params, "filter")),
                    "\n");
    }
    return not_found(command.path);
}

ExecutionActor::TextReply ExecutionActor::process(const DiscoverToolsCommand&) {
    auto found = discovery_.discover_tools();
    if (core::errors::is_error(found)) {
        LOG_WARN("ExecutionActor: discovery failed: " + core::errors::get_error(found).message);
        return core::errors::get_error(found);
    }

    auto& tools = std::get<std::vector<protocol::DiscoveredTool>>(found);
    const std::size_t count = tools.size();
    for (auto& tool : tools) {
        auto key = tool.path;
        discovered_tools_.insert_or_assign(std::move(key), std::move(tool));
    }
    return "Discovered " + std::to_string(count) + " tools from filesystem";
}

}  // namespace tclhub::runtime
