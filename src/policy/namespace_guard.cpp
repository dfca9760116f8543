#include "policy/namespace_guard.hpp"

#include <system_error>
#include <utility>

namespace tclhub::policy {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using protocol::ToolPath;

NamespaceGuard::NamespaceGuard(AccessPolicy access_policy)
    : access_policy_(std::move(access_policy)) {}

bool NamespaceGuard::is_within_root(const std::filesystem::path& root,
                                    const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

core::errors::Result<ToolPath> NamespaceGuard::validate_mutation(
    const ToolPath& path, const std::string& action) const {
    if (path.is_system()) {
        return ToolError{ErrorCategory::NamespaceViolation,
                         "Cannot " + action + " system tool '" + path.to_string() +
                             "': only user namespace tools can be changed",
                         "namespace_violation",
                         "Use a path of the form /<user>/<package>/<name>."};
    }
    return path.validate();
}

core::errors::Result<std::string> NamespaceGuard::validate_privileged(
    const std::string& operation) const {
    if (!access_policy_.privileged) {
        return ToolError{ErrorCategory::NamespaceViolation,
                         "Operation '" + operation + "' requires privileged mode",
                         "privileged_required",
                         "Restart the server with --privileged."};
    }
    return operation;
}

core::errors::Result<std::filesystem::path> NamespaceGuard::validate_store_file(
    const std::filesystem::path& store_root,
    const std::filesystem::path& indexed_file) const {
    std::error_code ec;
    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(store_root, ec);
    if (ec) {
        return ToolError{ErrorCategory::PersistenceFault,
                         "Unable to resolve storage root: " + store_root.string(),
                         "store_root_unresolved"};
    }

    std::filesystem::path candidate = indexed_file;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return ToolError{ErrorCategory::PersistenceFault,
                         "Unable to resolve indexed tool file: " + indexed_file.string(),
                         "store_file_unresolved"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return ToolError{ErrorCategory::PersistenceFault,
                         "Indexed tool file lies outside the storage root: " +
                             canonical_candidate.string(),
                         "store_file_outside_root",
                         "Remove the entry from index.json or save the tool again."};
    }

    return canonical_candidate;
}

}  // namespace tclhub::policy
