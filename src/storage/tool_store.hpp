#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/tool_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/tool_path.hpp"

namespace tclhub::storage {

// 64-bit FNV-1a of the script, as 16 lowercase hex digits.
std::string compute_checksum(const std::string& content);

// File-backed mirror of tool definitions:
//   <root>/index.json
//   <root>/system/{bin,sbin,docs}/<name>[_<version>].json
//   <root>/users/<user>/<package>/<name>[_<version>].json
// The index is a lookup cache; the per-tool documents are authoritative.
class ToolStore {
public:
    struct IndexEntry {
        protocol::ToolPath path;
        std::filesystem::path file;  // relative to the root
        std::string checksum;
        std::int64_t updated_at_ms = 0;
    };

    // Creates the root if needed. A corrupt index is replaced by an empty one.
    static core::errors::Result<ToolStore> open(const std::filesystem::path& root);

    core::errors::Result<std::filesystem::path> save(const protocol::ToolDefinition& tool);

    // nullopt when the tool is in neither the index nor its derived location.
    core::errors::Result<std::optional<protocol::ToolDefinition>> load(
        const protocol::ToolPath& path) const;

    // Entries that fail to load are skipped.
    core::errors::Result<std::vector<protocol::ToolDefinition>> list(
        const std::optional<std::string>& namespace_filter = std::nullopt) const;

    // true when an index entry or a file was actually removed.
    core::errors::Result<bool> remove(const protocol::ToolPath& path);

    core::errors::Result<std::optional<protocol::PersistedTool>> load_document(
        const protocol::ToolPath& path) const;

    std::filesystem::path tool_file_path(const protocol::ToolPath& path) const;

    const std::filesystem::path& root() const { return root_; }
    const std::filesystem::path& index_path() const { return index_path_; }
    std::size_t size() const { return entries_.size(); }
    std::int64_t last_updated_ms() const { return last_updated_ms_; }

private:
    ToolStore(std::filesystem::path root, std::map<std::string, IndexEntry> entries,
              std::int64_t last_updated_ms);

    core::errors::Result<bool> save_index() const;
    core::errors::Result<protocol::PersistedTool> read_document(
        const std::filesystem::path& file) const;
    std::optional<std::filesystem::path> resolve_entry_file(const IndexEntry& entry) const;
    void remove_empty_parents(const std::filesystem::path& file) const;

    std::filesystem::path root_;
    std::filesystem::path index_path_;
    std::map<std::string, IndexEntry> entries_;
    std::int64_t last_updated_ms_ = 0;
};

}  // namespace tclhub::storage
