#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "tool_path.hpp"

namespace tclhub::protocol {

    // One declared input of a tool. type_name is only a label for schema generation.
    struct ParameterDefinition {
        std::string name;
        std::string description;
        bool required = false;
        std::string type_name = "string";
    };

    // A user-authored tool as the engine keeps it in memory.
    struct ToolDefinition {
        ToolPath path;
        std::string description;
        std::string script;
        std::vector<ParameterDefinition> parameters;
    };

    // Bookkeeping stored next to a definition on disk.
    struct ToolMetadata {
        std::string id;
        std::int64_t created_at_ms = 0;
        std::int64_t updated_at_ms = 0;
        std::string checksum;
        std::uint32_t file_version = 1;
    };

    struct PersistedTool {
        ToolMetadata metadata;
        ToolDefinition tool;
    };

    // Found on disk by discovery. The script body is read when the tool runs.
    struct DiscoveredTool {
        ToolPath path;
        std::string description;
        std::filesystem::path file_path;
        std::vector<ParameterDefinition> parameters;
    };

    inline bool operator==(const ParameterDefinition& a, const ParameterDefinition& b) {
        return a.name == b.name && a.description == b.description &&
               a.required == b.required && a.type_name == b.type_name;
    }

} // namespace tclhub::protocol
