#include "app/command_dispatcher.hpp"

#include <optional>
#include <utility>
#include "core/logging/logger.hpp"

namespace tclhub::app {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;
using protocol::ParameterDefinition;
using protocol::ToolPath;

namespace {

ToolError invalid_request(const std::string& message) {
    return ToolError{ErrorCategory::Input, message, "invalid_request",
                     "Send one JSON object per line with an \"op\" field."};
}

template <typename T>
core::errors::Result<json> to_json_result(core::errors::Result<T> reply) {
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    return json(core::errors::take_value(reply));
}

std::optional<std::string> optional_string(const json& request, const std::string& key) {
    const auto it = request.find(key);
    if (it == request.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

core::errors::Result<std::string> required_string(const json& request, const std::string& key) {
    const auto it = request.find(key);
    if (it == request.end() || !it->is_string()) {
        return invalid_request("Field '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

// "path" carries the canonical form, "tool" the encoded name.
core::errors::Result<ToolPath> request_path(const json& request) {
    if (const auto path = optional_string(request, "path")) {
        return ToolPath::parse(path.value());
    }
    if (const auto tool = optional_string(request, "tool")) {
        return ToolPath::from_encoded_name(tool.value());
    }
    return invalid_request("Request needs a 'path' or 'tool' field");
}

core::errors::Result<std::vector<ParameterDefinition>> parameters_from_json(const json& request) {
    std::vector<ParameterDefinition> parameters;
    const auto it = request.find("parameters");
    if (it == request.end() || it->is_null()) {
        return parameters;
    }
    if (!it->is_array()) {
        return invalid_request("Field 'parameters' must be an array");
    }

    for (const auto& item : *it) {
        if (!item.is_object() || !item.contains("name") || !item.at("name").is_string()) {
            return invalid_request("Each parameter needs a string 'name'");
        }
        try {
            ParameterDefinition parameter;
            parameter.name = item.at("name").get<std::string>();
            parameter.description = item.value("description", "");
            parameter.required = item.value("required", false);
            parameter.type_name = item.value("type_name", item.value("type", "string"));
            parameters.push_back(std::move(parameter));
        } catch (const json::exception& e) {
            return invalid_request("Invalid parameter '" + item.at("name").get<std::string>() +
                                   "': " + e.what());
        }
    }
    return parameters;
}

json params_field(const json& request) {
    const auto it = request.find("params");
    if (it == request.end()) {
        return json::object();
    }
    return *it;
}

// Tcl results may hold bytes that are not UTF-8, such as NUL encoded as C0 80.
std::string serialize(const json& response) {
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string schema_type(const std::string& type_name) {
    if (type_name == "number" || type_name == "integer" || type_name == "boolean" ||
        type_name == "array" || type_name == "object") {
        return type_name;
    }
    return "string";
}

}  // namespace

json input_schema(const std::vector<ParameterDefinition>& parameters) {
    json properties = json::object();
    json required = json::array();
    for (const auto& parameter : parameters) {
        properties[parameter.name] = json{{"type", schema_type(parameter.type_name)},
                                          {"description", parameter.description}};
        if (parameter.required) {
            required.push_back(parameter.name);
        }
    }
    return json{{"type", "object"}, {"properties", properties}, {"required", required}};
}

json error_envelope(const json& id, const ToolError& error) {
    return json{{"id", id},
                {"ok", false},
                {"error",
                 {{"category", core::errors::category_name(error.category)},
                  {"code", error.code},
                  {"message", error.message},
                  {"hint", error.hint}}}};
}

CommandDispatcher::CommandDispatcher(runtime::ExecutionActor& actor,
                                     policy::AccessPolicy access_policy)
    : actor_(actor), guard_(access_policy) {}

std::string CommandDispatcher::handle_line(const std::string& line) {
    const json request = json::parse(line, nullptr, false);
    if (request.is_discarded()) {
        const auto error = invalid_request("Request is not valid JSON");
        LOG_WARN("CommandDispatcher: rejected request [" + error.code + "]: " + error.message);
        return serialize(error_envelope(nullptr, error));
    }
    return serialize(handle(request));
}

json CommandDispatcher::handle(const json& request) {
    if (!request.is_object()) {
        return error_envelope(nullptr, invalid_request("Request must be a JSON object"));
    }

    const json id = request.contains("id") ? request.at("id") : json(nullptr);
    const auto op = optional_string(request, "op");
    if (!op.has_value()) {
        return error_envelope(id, invalid_request("Request has no 'op' field"));
    }

    auto result = dispatch(op.value(), request);
    if (core::errors::is_error(result)) {
        const auto& error = core::errors::get_error(result);
        LOG_WARN("CommandDispatcher: " + op.value() + " failed [" + error.code + "]: " +
                 error.message);
        return error_envelope(id, error);
    }
    return json{{"id", id}, {"ok", true}, {"result", core::errors::take_value(result)}};
}

core::errors::Result<json> CommandDispatcher::dispatch(const std::string& op,
                                                       const json& request) {
    if (op == "execute") {
        auto script = required_string(request, "script");
        if (core::errors::is_error(script)) {
            return core::errors::get_error(script);
        }
        return to_json_result(actor_.execute(core::errors::take_value(script)).get());
    }

    if (op == "add_tool") {
        return handle_add_tool(request);
    }

    if (op == "remove_tool") {
        auto allowed = guard_.validate_privileged(op);
        if (core::errors::is_error(allowed)) {
            return core::errors::get_error(allowed);
        }
        auto path = request_path(request);
        if (core::errors::is_error(path)) {
            return core::errors::get_error(path);
        }
        return to_json_result(actor_.remove_tool(core::errors::take_value(path)).get());
    }

    if (op == "list_tools") {
        return to_json_result(actor_
                                  .list_tools(optional_string(request, "namespace"),
                                              optional_string(request, "filter"))
                                  .get());
    }

    if (op == "execute_custom_tool" || op == "exec_tool") {
        auto path = request_path(request);
        if (core::errors::is_error(path)) {
            return core::errors::get_error(path);
        }
        auto resolved = core::errors::take_value(path);
        if (std::holds_alternative<protocol::SbinNamespace>(resolved.ns)) {
            auto allowed = guard_.validate_privileged(op + " " + resolved.to_string());
            if (core::errors::is_error(allowed)) {
                return core::errors::get_error(allowed);
            }
        }
        if (op == "exec_tool") {
            return to_json_result(
                actor_.exec_tool(resolved.to_string(), params_field(request)).get());
        }
        return to_json_result(
            actor_.execute_custom_tool(std::move(resolved), params_field(request)).get());
    }

    if (op == "get_tool_definitions") {
        return handle_get_tool_definitions();
    }

    if (op == "initialize_persistence") {
        return to_json_result(actor_.initialize_persistence().get());
    }

    if (op == "discover_tools") {
        auto allowed = guard_.validate_privileged(op);
        if (core::errors::is_error(allowed)) {
            return core::errors::get_error(allowed);
        }
        return to_json_result(actor_.discover_tools().get());
    }

    return ToolError{ErrorCategory::Input, "Unknown op: " + op, "unknown_op",
                     "Use execute, add_tool, remove_tool, list_tools, execute_custom_tool, "
                     "get_tool_definitions, initialize_persistence, exec_tool or "
                     "discover_tools."};
}

core::errors::Result<json> CommandDispatcher::handle_add_tool(const json& request) {
    auto allowed = guard_.validate_privileged("add_tool");
    if (core::errors::is_error(allowed)) {
        return core::errors::get_error(allowed);
    }

    auto path = request_path(request);
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }
    auto script = required_string(request, "script");
    if (core::errors::is_error(script)) {
        return core::errors::get_error(script);
    }
    auto parameters = parameters_from_json(request);
    if (core::errors::is_error(parameters)) {
        return core::errors::get_error(parameters);
    }

    return to_json_result(actor_
                              .add_tool(core::errors::take_value(path),
                                        optional_string(request, "description").value_or(""),
                                        core::errors::take_value(script),
                                        core::errors::take_value(parameters))
                              .get());
}

core::errors::Result<json> CommandDispatcher::handle_get_tool_definitions() {
    auto reply = actor_.get_tool_definitions().get();
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }

    json definitions = json::array();
    for (const auto& tool : core::errors::get_value(reply)) {
        definitions.push_back(json{{"path", tool.path.to_string()},
                                   {"encoded_name", tool.path.to_encoded_name()},
                                   {"description", tool.description},
                                   {"input_schema", input_schema(tool.parameters)}});
    }
    return definitions;
}

}  // namespace tclhub::app
