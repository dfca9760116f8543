#include "storage/tool_store.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/tool_id.hpp"
#include "core/logging/logger.hpp"
#include "policy/namespace_guard.hpp"

namespace tclhub::storage {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;
using protocol::ParameterDefinition;
using protocol::PersistedTool;
using protocol::ToolDefinition;
using protocol::ToolMetadata;
using protocol::ToolPath;

namespace {

constexpr const char* kIndexFileName = "index.json";

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

ToolError persistence_error(const std::string& message, const std::string& code) {
    return ToolError{ErrorCategory::PersistenceFault, message, code};
}

json path_to_json(const ToolPath& path) {
    json payload;
    if (const auto* user = std::get_if<protocol::UserNamespace>(&path.ns)) {
        payload["namespace"] = "user";
        payload["user"] = user->id;
    } else {
        payload["namespace"] = protocol::namespace_keyword(path.ns);
    }
    payload["package"] = path.package.has_value() ? json(path.package.value()) : json(nullptr);
    payload["name"] = path.name;
    payload["version"] = path.version;
    return payload;
}

core::errors::Result<ToolPath> path_from_json(const json& payload) {
    const auto kind = payload.at("namespace").get<std::string>();
    ToolPath path;
    if (kind == "bin") {
        path = ToolPath::bin(payload.at("name").get<std::string>());
    } else if (kind == "sbin") {
        path = ToolPath::sbin(payload.at("name").get<std::string>());
    } else if (kind == "docs") {
        path = ToolPath::docs(payload.at("name").get<std::string>());
    } else if (kind == "user") {
        const auto& package = payload.at("package");
        if (package.is_null()) {
            return persistence_error("Stored user path has no package", "persistence_corrupt");
        }
        path = ToolPath::user(payload.at("user").get<std::string>(), package.get<std::string>(),
                              payload.at("name").get<std::string>(),
                              payload.at("version").get<std::string>());
    } else {
        return persistence_error("Unknown stored namespace: " + kind, "persistence_corrupt");
    }
    return path.validate();
}

json tool_to_json(const ToolDefinition& tool) {
    json parameters = json::array();
    for (const auto& parameter : tool.parameters) {
        parameters.push_back(json{{"name", parameter.name},
                                  {"description", parameter.description},
                                  {"required", parameter.required},
                                  {"type_name", parameter.type_name}});
    }

    json payload;
    payload["path"] = path_to_json(tool.path);
    payload["description"] = tool.description;
    payload["script"] = tool.script;
    payload["parameters"] = parameters;
    return payload;
}

core::errors::Result<ToolDefinition> tool_from_json(const json& payload) {
    auto path = path_from_json(payload.at("path"));
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }

    ToolDefinition tool;
    tool.path = core::errors::take_value(path);
    tool.description = payload.at("description").get<std::string>();
    tool.script = payload.at("script").get<std::string>();
    for (const auto& item : payload.at("parameters")) {
        ParameterDefinition parameter;
        parameter.name = item.at("name").get<std::string>();
        parameter.description = item.value("description", "");
        parameter.required = item.value("required", false);
        parameter.type_name = item.value("type_name", "string");
        tool.parameters.push_back(std::move(parameter));
    }
    return tool;
}

json metadata_to_json(const ToolMetadata& metadata) {
    json payload;
    payload["id"] = metadata.id;
    payload["created_at_ms"] = metadata.created_at_ms;
    payload["updated_at_ms"] = metadata.updated_at_ms;
    payload["checksum"] = metadata.checksum;
    payload["file_version"] = metadata.file_version;
    return payload;
}

ToolMetadata metadata_from_json(const json& payload) {
    ToolMetadata metadata;
    metadata.id = payload.at("id").get<std::string>();
    metadata.created_at_ms = payload.at("created_at_ms").get<std::int64_t>();
    metadata.updated_at_ms = payload.at("updated_at_ms").get<std::int64_t>();
    metadata.checksum = payload.at("checksum").get<std::string>();
    metadata.file_version = payload.value("file_version", 1u);
    return metadata;
}

core::errors::Result<std::string> read_text(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        return persistence_error("Failed to open file: " + file.string(), "persistence_read_failed");
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return persistence_error("I/O error while reading file: " + file.string(),
                                 "persistence_read_failed");
    }
    return buffer.str();
}

core::errors::Result<std::filesystem::path> write_text(const std::filesystem::path& file,
                                                       const std::string& text) {
    std::ofstream out(file, std::ios::trunc);
    if (!out.is_open()) {
        return persistence_error("Unable to open file for writing: " + file.string(),
                                 "persistence_write_failed");
    }
    out << text;
    out.flush();
    if (!out.good()) {
        return persistence_error("Unable to write file: " + file.string(),
                                 "persistence_write_failed");
    }
    return file;
}

std::filesystem::path relative_tool_file(const ToolPath& path) {
    std::filesystem::path relative;
    if (const auto* user = std::get_if<protocol::UserNamespace>(&path.ns)) {
        relative = std::filesystem::path("users") / user->id;
        if (path.package.has_value()) {
            relative /= path.package.value();
        }
    } else {
        relative = std::filesystem::path("system") / protocol::namespace_keyword(path.ns);
    }

    const std::string file_name = path.version == protocol::kLatestVersion
                                      ? path.name + ".json"
                                      : path.name + "_" + path.version + ".json";
    return relative / file_name;
}

}  // namespace

std::string compute_checksum(const std::string& content) {
    std::uint64_t hash = 14695981039346656037ULL;
    for (const unsigned char c : content) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }

    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(hash));
    return std::string(buffer);
}

ToolStore::ToolStore(std::filesystem::path root, std::map<std::string, IndexEntry> entries,
                     const std::int64_t last_updated_ms)
    : root_(std::move(root)),
      index_path_(root_ / kIndexFileName),
      entries_(std::move(entries)),
      last_updated_ms_(last_updated_ms) {}

core::errors::Result<ToolStore> ToolStore::open(const std::filesystem::path& root) {
    if (root.empty()) {
        return ToolError{ErrorCategory::Input, "Storage root cannot be empty.",
                         "invalid_storage_root"};
    }

    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        return persistence_error("Unable to create storage directory: " + root.string(),
                                 "store_open_failed");
    }
    const auto canonical_root = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        return persistence_error("Unable to resolve storage directory: " + root.string(),
                                 "store_open_failed");
    }

    std::map<std::string, IndexEntry> entries;
    std::int64_t last_updated_ms = 0;
    const auto index_path = canonical_root / kIndexFileName;
    if (std::filesystem::exists(index_path, ec) && !ec) {
        auto text = read_text(index_path);
        if (core::errors::is_error(text)) {
            LOG_WARN("ToolStore: " + core::errors::get_error(text).message +
                     ", starting with an empty index");
        } else {
            try {
                const auto index = json::parse(core::errors::get_value(text));
                last_updated_ms = index.value("last_updated_ms", std::int64_t{0});
                for (const auto& element : index.at("tools").items()) {
                    const std::string key = element.key();
                    const json& item = element.value();
                    auto path = path_from_json(item.at("path"));
                    if (core::errors::is_error(path)) {
                        LOG_WARN("ToolStore: skipping index entry " + key + ": " +
                                 core::errors::get_error(path).message);
                        continue;
                    }
                    IndexEntry entry;
                    entry.path = core::errors::take_value(path);
                    entry.file = std::filesystem::path(item.at("file").get<std::string>());
                    entry.checksum = item.at("checksum").get<std::string>();
                    entry.updated_at_ms = item.value("updated_at_ms", std::int64_t{0});
                    entries.emplace(entry.path.to_string(), std::move(entry));
                }
            } catch (const json::exception& e) {
                LOG_WARN("ToolStore: failed to parse index file, creating new one: " +
                         std::string(e.what()));
                entries.clear();
                last_updated_ms = 0;
            }
        }
    }

    LOG_INFO("ToolStore: opened " + canonical_root.string() + " with " +
             std::to_string(entries.size()) + " indexed tools");
    return ToolStore(canonical_root, std::move(entries), last_updated_ms);
}

std::filesystem::path ToolStore::tool_file_path(const ToolPath& path) const {
    return root_ / relative_tool_file(path);
}

std::optional<std::filesystem::path> ToolStore::resolve_entry_file(
    const IndexEntry& entry) const {
    const policy::NamespaceGuard guard;
    auto resolved = guard.validate_store_file(root_, entry.file);
    if (core::errors::is_error(resolved)) {
        LOG_WARN("ToolStore: ignoring index location for " + entry.path.to_string() + ": " +
                 core::errors::get_error(resolved).message);
        return std::nullopt;
    }
    return core::errors::get_value(resolved);
}

core::errors::Result<bool> ToolStore::save_index() const {
    json tools = json::object();
    for (const auto& [key, entry] : entries_) {
        tools[key] = json{{"path", path_to_json(entry.path)},
                          {"file", entry.file.generic_string()},
                          {"checksum", entry.checksum},
                          {"updated_at_ms", entry.updated_at_ms}};
    }

    json index;
    index["tools"] = tools;
    index["last_updated_ms"] = last_updated_ms_;

    auto written = write_text(index_path_, index.dump(2));
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    return true;
}

core::errors::Result<PersistedTool> ToolStore::read_document(
    const std::filesystem::path& file) const {
    auto text = read_text(file);
    if (core::errors::is_error(text)) {
        return core::errors::get_error(text);
    }

    try {
        const auto document = json::parse(core::errors::get_value(text));
        auto tool = tool_from_json(document.at("tool"));
        if (core::errors::is_error(tool)) {
            return core::errors::get_error(tool);
        }
        PersistedTool persisted;
        persisted.metadata = metadata_from_json(document.at("metadata"));
        persisted.tool = core::errors::take_value(tool);
        return persisted;
    } catch (const json::exception& e) {
        return persistence_error("Malformed tool document " + file.string() + ": " + e.what(),
                                 "persistence_corrupt");
    }
}

core::errors::Result<std::filesystem::path> ToolStore::save(const ToolDefinition& tool) {
    auto validated = tool.path.validate();
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }

    const auto relative = relative_tool_file(tool.path);
    const auto file = root_ / relative;
    std::error_code ec;
    std::filesystem::create_directories(file.parent_path(), ec);
    if (ec) {
        return persistence_error("Unable to create directory: " + file.parent_path().string(),
                                 "persistence_write_failed");
    }

    const auto now = now_unix_ms();
    PersistedTool persisted;
    persisted.tool = tool;
    persisted.metadata.id = core::config::generate_tool_id();
    persisted.metadata.created_at_ms = now;
    persisted.metadata.updated_at_ms = now;
    persisted.metadata.checksum = compute_checksum(tool.script);
    persisted.metadata.file_version = 1;

    // A re-save keeps the identity of the previous document.
    const std::string key = tool.path.to_string();
    if (entries_.count(key) != 0) {
        auto previous = load_document(tool.path);
        if (!core::errors::is_error(previous) && core::errors::get_value(previous).has_value()) {
            const auto& previous_metadata = core::errors::get_value(previous)->metadata;
            persisted.metadata.id = previous_metadata.id;
            persisted.metadata.created_at_ms = previous_metadata.created_at_ms;
            persisted.metadata.file_version = previous_metadata.file_version + 1;
        }
    }

    json document;
    document["metadata"] = metadata_to_json(persisted.metadata);
    document["tool"] = tool_to_json(persisted.tool);
    auto written = write_text(file, document.dump(2));
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    IndexEntry entry;
    entry.path = tool.path;
    entry.file = relative;
    entry.checksum = persisted.metadata.checksum;
    entry.updated_at_ms = now;
    entries_[key] = std::move(entry);
    last_updated_ms_ = now;

    auto index_saved = save_index();
    if (core::errors::is_error(index_saved)) {
        return core::errors::get_error(index_saved);
    }

    LOG_INFO("ToolStore: saved tool to " + file.string());
    return file;
}

core::errors::Result<std::optional<PersistedTool>> ToolStore::load_document(
    const ToolPath& path) const {
    const auto it = entries_.find(path.to_string());
    if (it != entries_.end()) {
        const auto file = resolve_entry_file(it->second);
        std::error_code ec;
        if (file.has_value() && std::filesystem::exists(file.value(), ec) && !ec) {
            auto persisted = read_document(file.value());
            if (core::errors::is_error(persisted)) {
                return core::errors::get_error(persisted);
            }
            if (core::errors::get_value(persisted).metadata.checksum != it->second.checksum) {
                LOG_WARN("ToolStore: checksum mismatch for tool " + path.to_string() +
                         ", file may be stale or corrupted");
            }
            return std::optional<PersistedTool>(core::errors::take_value(persisted));
        }
    }

    // Fallback: the deterministic location.
    const auto derived = tool_file_path(path);
    std::error_code ec;
    if (std::filesystem::exists(derived, ec) && !ec) {
        auto persisted = read_document(derived);
        if (core::errors::is_error(persisted)) {
            return core::errors::get_error(persisted);
        }
        return std::optional<PersistedTool>(core::errors::take_value(persisted));
    }

    return std::optional<PersistedTool>();
}

core::errors::Result<std::optional<ToolDefinition>> ToolStore::load(const ToolPath& path) const {
    auto persisted = load_document(path);
    if (core::errors::is_error(persisted)) {
        return core::errors::get_error(persisted);
    }
    const auto& document = core::errors::get_value(persisted);
    if (!document.has_value()) {
        return std::optional<ToolDefinition>();
    }
    return std::optional<ToolDefinition>(document->tool);
}

core::errors::Result<std::vector<ToolDefinition>> ToolStore::list(
    const std::optional<std::string>& namespace_filter) const {
    std::vector<ToolDefinition> tools;
    for (const auto& [key, entry] : entries_) {
        if (namespace_filter.has_value() &&
            !protocol::matches_namespace(entry.path.ns, namespace_filter.value())) {
            continue;
        }

        auto loaded = load(entry.path);
        if (core::errors::is_error(loaded)) {
            LOG_WARN("ToolStore: skipping " + key + ": " + core::errors::get_error(loaded).message);
            continue;
        }
        if (!core::errors::get_value(loaded).has_value()) {
            LOG_WARN("ToolStore: skipping " + key + ": file is missing");
            continue;
        }
        tools.push_back(core::errors::get_value(loaded).value());
    }
    return tools;
}

core::errors::Result<bool> ToolStore::remove(const ToolPath& path) {
    const std::string key = path.to_string();
    const auto it = entries_.find(key);
    const bool indexed = it != entries_.end();

    std::optional<std::filesystem::path> file;
    if (indexed) {
        file = resolve_entry_file(it->second);
    } else {
        file = tool_file_path(path);
    }

    bool removed_file = false;
    std::error_code ec;
    if (file.has_value() && std::filesystem::exists(file.value(), ec) && !ec) {
        std::filesystem::remove(file.value(), ec);
        if (ec) {
            return persistence_error("Unable to delete tool file: " + file->string(),
                                     "persistence_delete_failed");
        }
        removed_file = true;
        LOG_INFO("ToolStore: deleted tool file " + file->string());
        remove_empty_parents(file.value());
    }

    // The entry goes only once its document is gone, so a failed delete leaves both in place.
    if (indexed) {
        entries_.erase(it);
        last_updated_ms_ = now_unix_ms();
        auto index_saved = save_index();
        if (core::errors::is_error(index_saved)) {
            return core::errors::get_error(index_saved);
        }
    }

    return indexed || removed_file;
}

void ToolStore::remove_empty_parents(const std::filesystem::path& file) const {
    std::filesystem::path dir = file.parent_path();
    while (dir != root_ && policy::NamespaceGuard::is_within_root(root_, dir)) {
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec) || ec) {
            return;
        }
        if (!std::filesystem::is_empty(dir, ec) || ec) {
            return;
        }
        std::filesystem::remove(dir, ec);
        if (ec) {
            LOG_WARN("ToolStore: unable to remove empty directory " + dir.string());
            return;
        }
        LOG_DEBUG("ToolStore: removed empty directory " + dir.string());
        dir = dir.parent_path();
    }
}

}  // namespace tclhub::storage
