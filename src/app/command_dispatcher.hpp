#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "policy/namespace_guard.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/tool_path.hpp"
#include "runtime/execution_actor.hpp"

namespace tclhub::app {

// Line protocol in front of the actor.
//   request:  {"id": any, "op": "<op>", ...fields}
//   response: {"id", "ok": true, "result"} or
//             {"id", "ok": false, "error": {"category", "code", "message", "hint"}}
class CommandDispatcher {
public:
    CommandDispatcher(runtime::ExecutionActor& actor, policy::AccessPolicy access_policy);

    // Always produces exactly one response line.
    std::string handle_line(const std::string& line);
    nlohmann::json handle(const nlohmann::json& request);

private:
    core::errors::Result<nlohmann::json> dispatch(const std::string& op,
                                                  const nlohmann::json& request);
    core::errors::Result<nlohmann::json> handle_add_tool(const nlohmann::json& request);
    core::errors::Result<nlohmann::json> handle_get_tool_definitions();

    runtime::ExecutionActor& actor_;
    policy::NamespaceGuard guard_;
};

// {"type": "object", "properties": {...}, "required": [...]}
nlohmann::json input_schema(const std::vector<protocol::ParameterDefinition>& parameters);

nlohmann::json error_envelope(const nlohmann::json& id, const core::errors::ToolError& error);

}  // namespace tclhub::app
