#include "protocol/tool_path.hpp"

#include <cctype>
#include <utility>
#include <vector>

namespace tclhub::protocol {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

constexpr const char* kBinPrefix = "bin___";
constexpr const char* kSbinPrefix = "sbin___";
constexpr const char* kDocsPrefix = "docs___";
constexpr const char* kUserPrefix = "user_";

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

// Left-to-right, non-overlapping split.
std::vector<std::string> split(const std::string& text, const std::string& separator) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        const auto pos = text.find(separator, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + separator.size();
    }
}

std::pair<std::string, std::string> split_name_version(const std::string& segment) {
    const auto colon = segment.find(':');
    if (colon == std::string::npos) {
        return {segment, kLatestVersion};
    }
    return {segment.substr(0, colon), segment.substr(colon + 1)};
}

std::string replace_all(std::string value, const char from, const char to) {
    for (auto& c : value) {
        if (c == from) {
            c = to;
        }
    }
    return value;
}

bool has_forbidden_chars(const std::string& segment) {
    for (const char c : segment) {
        if (c == '/' || c == ':' || std::isspace(static_cast<unsigned char>(c)) != 0) {
            return true;
        }
    }
    return false;
}

ToolError path_error(const std::string& message) {
    return ToolError{ErrorCategory::PathFormat, message, "path_format",
                     "Use /bin/<name>, /sbin/<name>, /docs/<name> or "
                     "/<user>/<package>/<name>[:<version>]."};
}

std::optional<std::string> check_plain_segment(const std::string& what,
                                               const std::string& segment) {
    if (segment.empty()) {
        return what + " cannot be empty";
    }
    if (has_forbidden_chars(segment)) {
        return what + " '" + segment + "' contains '/', ':' or whitespace";
    }
    if (segment == "." || segment == "..") {
        return what + " cannot be '" + segment + "'";
    }
    return std::nullopt;
}

// User-side segments are joined with "__" in the encoded form.
std::optional<std::string> check_user_segment(const std::string& what,
                                              const std::string& segment) {
    if (auto problem = check_plain_segment(what, segment)) {
        return problem;
    }
    if (segment.find("__") != std::string::npos) {
        return what + " '" + segment + "' contains '__'";
    }
    if (segment.front() == '_' || segment.back() == '_') {
        return what + " '" + segment + "' starts or ends with '_'";
    }
    return std::nullopt;
}

std::optional<std::string> check_version(const std::string& version) {
    if (version == kLatestVersion) {
        return std::nullopt;
    }
    if (auto problem = check_plain_segment("version", version)) {
        return problem;
    }
    if (version.find('_') != std::string::npos) {
        return "version '" + version + "' contains '_'";
    }
    if (version.find("..") != std::string::npos || version.front() == '.' ||
        version.back() == '.') {
        return "version '" + version + "' has a misplaced '.'";
    }
    return std::nullopt;
}

}  // namespace

std::string namespace_keyword(const Namespace& ns) {
    if (std::holds_alternative<BinNamespace>(ns)) {
        return "bin";
    }
    if (std::holds_alternative<SbinNamespace>(ns)) {
        return "sbin";
    }
    if (std::holds_alternative<DocsNamespace>(ns)) {
        return "docs";
    }
    return std::get<UserNamespace>(ns).id;
}

bool matches_namespace(const Namespace& ns, const std::string& filter) {
    return namespace_keyword(ns) == filter;
}

bool is_user_namespace(const Namespace& ns) {
    return std::holds_alternative<UserNamespace>(ns);
}

ToolPath ToolPath::bin(std::string name) {
    return ToolPath{BinNamespace{}, std::nullopt, std::move(name), kLatestVersion};
}

ToolPath ToolPath::sbin(std::string name) {
    return ToolPath{SbinNamespace{}, std::nullopt, std::move(name), kLatestVersion};
}

ToolPath ToolPath::docs(std::string name) {
    return ToolPath{DocsNamespace{}, std::nullopt, std::move(name), kLatestVersion};
}

ToolPath ToolPath::user(std::string user, std::string package, std::string name,
                        std::string version) {
    return ToolPath{UserNamespace{std::move(user)}, std::move(package), std::move(name),
                    std::move(version)};
}

core::errors::Result<ToolPath> ToolPath::parse(const std::string& text) {
    if (text.empty() || text.front() != '/') {
        return path_error("Tool path must start with '/': " + text);
    }

    const auto parts = split(text.substr(1), "/");
    if (parts.size() == 2) {
        // A version on a system path is accepted and dropped.
        const auto name = split_name_version(parts[1]).first;
        if (parts[0] == "bin") {
            return ToolPath::bin(name).validate();
        }
        if (parts[0] == "sbin") {
            return ToolPath::sbin(name).validate();
        }
        if (parts[0] == "docs") {
            return ToolPath::docs(name).validate();
        }
        return path_error("Invalid tool path format: " + text);
    }
    if (parts.size() == 3) {
        auto name_version = split_name_version(parts[2]);
        return ToolPath::user(parts[0], parts[1], std::move(name_version.first),
                              std::move(name_version.second))
            .validate();
    }
    return path_error("Invalid tool path format: " + text);
}

core::errors::Result<ToolPath> ToolPath::from_encoded_name(const std::string& encoded) {
    if (starts_with(encoded, kBinPrefix)) {
        return ToolPath::bin(encoded.substr(std::string(kBinPrefix).size())).validate();
    }
    if (starts_with(encoded, kSbinPrefix)) {
        return ToolPath::sbin(encoded.substr(std::string(kSbinPrefix).size())).validate();
    }
    if (starts_with(encoded, kDocsPrefix)) {
        return ToolPath::docs(encoded.substr(std::string(kDocsPrefix).size())).validate();
    }
    if (!starts_with(encoded, kUserPrefix)) {
        return path_error("Unknown tool name format: " + encoded);
    }

    // <user>__<package>___<name>[__v<version>]
    const auto parts = split(encoded.substr(std::string(kUserPrefix).size()), "__");
    if (parts.size() == 2) {
        return path_error("User tool names must include a package: " + encoded);
    }
    if (parts.size() != 3 && parts.size() != 4) {
        return path_error("Invalid encoded tool name: " + encoded);
    }
    if (parts[2].empty() || parts[2].front() != '_') {
        return path_error("Invalid encoded tool name: " + encoded);
    }

    std::string version = kLatestVersion;
    if (parts.size() == 4) {
        if (parts[3].size() < 2 || parts[3].front() != 'v') {
            return path_error("Invalid encoded version in tool name: " + encoded);
        }
        version = replace_all(parts[3].substr(1), '_', '.');
    }
    return ToolPath::user(parts[0], parts[1], parts[2].substr(1), std::move(version))
        .validate();
}

std::string ToolPath::to_string() const {
    if (std::holds_alternative<BinNamespace>(ns)) {
        return "/bin/" + name;
    }
    if (std::holds_alternative<SbinNamespace>(ns)) {
        return "/sbin/" + name;
    }
    if (std::holds_alternative<DocsNamespace>(ns)) {
        return "/docs/" + name;
    }

    const auto& user = std::get<UserNamespace>(ns).id;
    if (!package.has_value()) {
        return "/" + user + "/" + name;
    }
    std::string text = "/" + user + "/" + package.value() + "/" + name;
    if (version != kLatestVersion) {
        text += ":" + version;
    }
    return text;
}

std::string ToolPath::to_encoded_name() const {
    if (std::holds_alternative<BinNamespace>(ns)) {
        return kBinPrefix + name;
    }
    if (std::holds_alternative<SbinNamespace>(ns)) {
        return kSbinPrefix + name;
    }
    if (std::holds_alternative<DocsNamespace>(ns)) {
        return kDocsPrefix + name;
    }

    const auto& user = std::get<UserNamespace>(ns).id;
    if (!package.has_value()) {
        return kUserPrefix + user + "___" + name;
    }
    std::string encoded = kUserPrefix + user + "__" + package.value() + "___" + name;
    if (version != kLatestVersion) {
        encoded += "__v" + replace_all(version, '.', '_');
    }
    return encoded;
}

bool ToolPath::is_system() const {
    return !is_user_namespace(ns);
}

core::errors::Result<ToolPath> ToolPath::validate() const {
    if (is_system()) {
        if (auto problem = check_plain_segment("name", name)) {
            return path_error("Invalid system tool path: " + problem.value());
        }
        if (package.has_value() || version != kLatestVersion) {
            return path_error("System tool paths carry no package or version: " +
                              to_string());
        }
        return *this;
    }

    if (!package.has_value()) {
        return path_error("User tool paths must include a package: " + to_string());
    }
    const std::vector<std::pair<std::string, std::string>> segments = {
        {"user", std::get<UserNamespace>(ns).id}, {"package", package.value()}, {"name", name}};
    for (const auto& [what, segment] : segments) {
        if (auto problem = check_user_segment(what, segment)) {
            return path_error("Invalid user tool path: " + problem.value());
        }
    }
    if (auto problem = check_version(version)) {
        return path_error("Invalid user tool path: " + problem.value());
    }
    return *this;
}

bool operator==(const ToolPath& a, const ToolPath& b) {
    return a.ns == b.ns && a.package == b.package && a.name == b.name &&
           a.version == b.version;
}

bool operator!=(const ToolPath& a, const ToolPath& b) {
    return !(a == b);
}

bool operator<(const ToolPath& a, const ToolPath& b) {
    if (!(a.ns == b.ns)) {
        return a.ns < b.ns;
    }
    if (a.package != b.package) {
        return a.package < b.package;
    }
    if (a.name != b.name) {
        return a.name < b.name;
    }
    return a.version < b.version;
}

}  // namespace tclhub::protocol
