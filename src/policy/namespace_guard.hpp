#pragma once

#include <filesystem>
#include <string>
#include "core/errors/tool_errors.hpp"
#include "protocol/tool_path.hpp"

namespace tclhub::policy {

struct AccessPolicy {
    bool privileged = false;
};

class NamespaceGuard {
public:
    explicit NamespaceGuard(AccessPolicy access_policy = {});

    // Only user paths may be added, changed or removed. Also applies segment rules.
    core::errors::Result<protocol::ToolPath> validate_mutation(
        const protocol::ToolPath& path, const std::string& action) const;

    // Tool management and /sbin access need a privileged caller.
    core::errors::Result<std::string> validate_privileged(
        const std::string& operation) const;

    // Index entries name files relative to the store; they must resolve inside it.
    core::errors::Result<std::filesystem::path> validate_store_file(
        const std::filesystem::path& store_root,
        const std::filesystem::path& indexed_file) const;

    // Component-wise prefix test, so "/store2" is not inside "/store".
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

    bool privileged() const { return access_policy_.privileged; }

private:
    AccessPolicy access_policy_;
};

}  // namespace tclhub::policy
