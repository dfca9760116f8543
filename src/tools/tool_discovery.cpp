#include "tools/tool_discovery.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace tclhub::tools {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using protocol::DiscoveredTool;
using protocol::ParameterDefinition;
using protocol::ToolPath;

namespace {

constexpr const char* kScriptExtension = ".tcl";

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return text.substr(begin, end - begin);
}

bool strip_prefix(const std::string& text, const std::string& prefix, std::string& rest) {
    if (text.rfind(prefix, 0) != 0) {
        return false;
    }
    rest = text.substr(prefix.size());
    return true;
}

std::vector<std::string> split(const std::string& text, const char separator) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        const auto pos = text.find(separator, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

// name:type[:required] description
std::optional<ParameterDefinition> parse_param(const std::string& text) {
    std::string definition = text;
    std::string description;
    const auto space = text.find(' ');
    if (space != std::string::npos) {
        definition = text.substr(0, space);
        description = trim(text.substr(space + 1));
    }

    const auto fields = split(definition, ':');
    if (fields.size() < 2 || fields[0].empty()) {
        return std::nullopt;
    }

    ParameterDefinition parameter;
    parameter.name = fields[0];
    parameter.type_name = fields[1];
    parameter.required = fields.size() > 2 && fields[2] == "required";
    parameter.description = description;
    return parameter;
}

ToolError discovery_error(const std::string& message) {
    return ToolError{ErrorCategory::DiscoveryIO, message, "discovery_io"};
}

// Sorted so a scan visits files in a stable order.
core::errors::Result<std::vector<std::filesystem::directory_entry>> list_directory(
    const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return discovery_error("Unable to read directory " + dir.string() + ": " + ec.message());
    }

    std::vector<std::filesystem::directory_entry> entries;
    for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return discovery_error("Unable to read directory " + dir.string() + ": " +
                                   ec.message());
        }
        entries.push_back(*it);
    }
    if (ec) {
        return discovery_error("Unable to read directory " + dir.string() + ": " + ec.message());
    }

    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.path() < b.path(); });
    return entries;
}

bool is_script_file(const std::filesystem::directory_entry& entry) {
    std::error_code ec;
    return entry.is_regular_file(ec) && !ec && entry.path().extension() == kScriptExtension;
}

bool is_existing_directory(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec) && !ec;
}

}  // namespace

ScriptHeader parse_script_header(std::istream& in) {
    ScriptHeader header;
    std::string line;
    while (std::getline(in, line)) {
        const std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed.front() != '#') {
            break;
        }

        const auto first_text = trimmed.find_first_not_of('#');
        const std::string comment =
            first_text == std::string::npos ? std::string() : trim(trimmed.substr(first_text));

        std::string rest;
        if (strip_prefix(comment, "@description ", rest)) {
            header.description = trim(rest);
        } else if (strip_prefix(comment, "@version ", rest)) {
            header.version = trim(rest);
        } else if (strip_prefix(comment, "@param ", rest)) {
            if (auto parameter = parse_param(trim(rest))) {
                header.parameters.push_back(std::move(parameter.value()));
            }
        }
    }
    return header;
}

ToolDiscovery::ToolDiscovery(std::filesystem::path tools_root)
    : tools_root_(std::move(tools_root)) {}

core::errors::Result<std::vector<DiscoveredTool>> ToolDiscovery::discover_tools() {
    discovered_tools_.clear();

    const std::vector<std::pair<std::string, protocol::Namespace>> system_dirs = {
        {"bin", protocol::BinNamespace{}},
        {"sbin", protocol::SbinNamespace{}},
        {"docs", protocol::DocsNamespace{}}};
    for (const auto& [subdir, ns] : system_dirs) {
        auto scanned = scan_directory(tools_root_ / subdir, ns);
        if (core::errors::is_error(scanned)) {
            return core::errors::get_error(scanned);
        }
    }

    auto scanned = scan_user_directories(tools_root_ / "users");
    if (core::errors::is_error(scanned)) {
        return core::errors::get_error(scanned);
    }

    std::vector<DiscoveredTool> tools;
    tools.reserve(discovered_tools_.size());
    for (const auto& [path, tool] : discovered_tools_) {
        tools.push_back(tool);
    }
    LOG_INFO("ToolDiscovery: found " + std::to_string(tools.size()) + " tools under " +
             tools_root_.string());
    return tools;
}

core::errors::Result<std::size_t> ToolDiscovery::scan_directory(
    const std::filesystem::path& dir, const protocol::Namespace& ns) {
    if (!is_existing_directory(dir)) {
        return std::size_t{0};
    }

    auto entries = list_directory(dir);
    if (core::errors::is_error(entries)) {
        return core::errors::get_error(entries);
    }

    std::size_t count = 0;
    for (const auto& entry : core::errors::get_value(entries)) {
        if (!is_script_file(entry)) {
            continue;
        }
        auto metadata = read_tool_metadata(entry.path());
        if (core::errors::is_error(metadata)) {
            return core::errors::get_error(metadata);
        }

        const std::string tool_name = entry.path().stem().string();
        ToolPath candidate;
        if (std::holds_alternative<protocol::BinNamespace>(ns)) {
            candidate = ToolPath::bin(tool_name);
        } else if (std::holds_alternative<protocol::SbinNamespace>(ns)) {
            candidate = ToolPath::sbin(tool_name);
        } else {
            candidate = ToolPath::docs(tool_name);
        }
        auto path = candidate.validate();
        if (core::errors::is_error(path)) {
            LOG_WARN("ToolDiscovery: skipping " + entry.path().string() + ": " +
                     core::errors::get_error(path).message);
            continue;
        }

        auto& header = std::get<ScriptHeader>(metadata);
        record(DiscoveredTool{core::errors::take_value(path), std::move(header.description),
                              entry.path(), std::move(header.parameters)});
        ++count;
    }
    return count;
}

core::errors::Result<std::size_t> ToolDiscovery::scan_user_directories(
    const std::filesystem::path& users_dir) {
    if (!is_existing_directory(users_dir)) {
        return std::size_t{0};
    }

    auto user_entries = list_directory(users_dir);
    if (core::errors::is_error(user_entries)) {
        return core::errors::get_error(user_entries);
    }

    std::size_t count = 0;
    for (const auto& user_entry : core::errors::get_value(user_entries)) {
        if (!is_existing_directory(user_entry.path())) {
            continue;
        }
        const std::string user_name = user_entry.path().filename().string();

        auto package_entries = list_directory(user_entry.path());
        if (core::errors::is_error(package_entries)) {
            return core::errors::get_error(package_entries);
        }

        for (const auto& package_entry : core::errors::get_value(package_entries)) {
            if (!is_existing_directory(package_entry.path())) {
                continue;
            }
            const std::string package_name = package_entry.path().filename().string();

            auto tool_entries = list_directory(package_entry.path());
            if (core::errors::is_error(tool_entries)) {
                return core::errors::get_error(tool_entries);
            }

            for (const auto& tool_entry : core::errors::get_value(tool_entries)) {
                if (!is_script_file(tool_entry)) {
                    continue;
                }
                auto metadata = read_tool_metadata(tool_entry.path());
                if (core::errors::is_error(metadata)) {
                    return core::errors::get_error(metadata);
                }

                auto& header = std::get<ScriptHeader>(metadata);
                auto path = ToolPath::user(user_name, package_name,
                                           tool_entry.path().stem().string(),
                                           header.version.value_or(protocol::kLatestVersion))
                                .validate();
                if (core::errors::is_error(path)) {
                    LOG_WARN("ToolDiscovery: skipping " + tool_entry.path().string() + ": " +
                             core::errors::get_error(path).message);
                    continue;
                }

                record(DiscoveredTool{core::errors::take_value(path),
                                      std::move(header.description), tool_entry.path(),
                                      std::move(header.parameters)});
                ++count;
            }
        }
    }
    return count;
}

core::errors::Result<ScriptHeader> ToolDiscovery::read_tool_metadata(
    const std::filesystem::path& file) const {
    std::ifstream in(file);
    if (!in.is_open()) {
        return discovery_error("Unable to open tool script " + file.string());
    }

    ScriptHeader header = parse_script_header(in);
    if (in.bad()) {
        return discovery_error("I/O error while reading tool script " + file.string());
    }
    if (header.description.empty()) {
        header.description = "Tool from " + file.string();
    }
    return header;
}

void ToolDiscovery::record(DiscoveredTool tool) {
    auto key = tool.path;
    discovered_tools_.insert_or_assign(std::move(key), std::move(tool));
}

}  // namespace tclhub::tools
