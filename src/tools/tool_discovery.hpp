#pragma once

#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/tool_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/tool_path.hpp"

namespace tclhub::tools {

// Tags read from the leading comment block of a script:
//   # @description <text>
//   # @version <text>
//   # @param <name>:<type>[:required] <description>
struct ScriptHeader {
    std::string description;
    std::optional<std::string> version;
    std::vector<protocol::ParameterDefinition> parameters;
};

// Stops at the first line that is not a comment.
ScriptHeader parse_script_header(std::istream& in);

// Scans <root>/{bin,sbin,docs}/*.tcl and <root>/users/<user>/<package>/*.tcl.
class ToolDiscovery {
public:
    explicit ToolDiscovery(std::filesystem::path tools_root = "tools");

    // Replaces this scanner's working set. The first I/O failure aborts the scan.
    core::errors::Result<std::vector<protocol::DiscoveredTool>> discover_tools();

    const std::filesystem::path& tools_root() const { return tools_root_; }

private:
    core::errors::Result<std::size_t> scan_directory(const std::filesystem::path& dir,
                                                     const protocol::Namespace& ns);
    core::errors::Result<std::size_t> scan_user_directories(
        const std::filesystem::path& users_dir);
    core::errors::Result<ScriptHeader> read_tool_metadata(
        const std::filesystem::path& file) const;
    void record(protocol::DiscoveredTool tool);

    std::filesystem::path tools_root_;
    std::map<protocol::ToolPath, protocol::DiscoveredTool> discovered_tools_;
};

}  // namespace tclhub::tools
