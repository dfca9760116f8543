#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include "core/errors/tool_errors.hpp"

namespace tclhub::protocol {

struct BinNamespace {};
struct SbinNamespace {};
struct DocsNamespace {};
struct UserNamespace {
    std::string id;
};

inline bool operator==(const BinNamespace&, const BinNamespace&) { return true; }
inline bool operator==(const SbinNamespace&, const SbinNamespace&) { return true; }
inline bool operator==(const DocsNamespace&, const DocsNamespace&) { return true; }
inline bool operator==(const UserNamespace& a, const UserNamespace& b) { return a.id == b.id; }
inline bool operator<(const BinNamespace&, const BinNamespace&) { return false; }
inline bool operator<(const SbinNamespace&, const SbinNamespace&) { return false; }
inline bool operator<(const DocsNamespace&, const DocsNamespace&) { return false; }
inline bool operator<(const UserNamespace& a, const UserNamespace& b) { return a.id < b.id; }

// Bin: read-only system tools. Sbin: privileged system tools.
// Docs: read-only documentation. User: caller-owned, the only mutable one.
using Namespace = std::variant<BinNamespace, SbinNamespace, DocsNamespace, UserNamespace>;

// "bin", "sbin", "docs" or the user id.
std::string namespace_keyword(const Namespace& ns);

// Exact match of a listing filter against a namespace.
bool matches_namespace(const Namespace& ns, const std::string& filter);

bool is_user_namespace(const Namespace& ns);

inline constexpr const char* kLatestVersion = "latest";

struct ToolPath {
    Namespace ns;
    std::optional<std::string> package;
    std::string name;
    std::string version = kLatestVersion;

    static ToolPath bin(std::string name);
    static ToolPath sbin(std::string name);
    static ToolPath docs(std::string name);
    static ToolPath user(std::string user, std::string package, std::string name,
                         std::string version = kLatestVersion);

    // "/bin/tcl_execute", "/alice/utils/reverse_string:1.0", ...
    static core::errors::Result<ToolPath> parse(const std::string& text);

    // Inverse of to_encoded_name().
    static core::errors::Result<ToolPath> from_encoded_name(const std::string& encoded);

    std::string to_string() const;

    // Form safe for transports that forbid '/' and ':'.
    std::string to_encoded_name() const;

    bool is_system() const;

    // Segment rules that keep the encoded form reversible. Returns the path on success.
    core::errors::Result<ToolPath> validate() const;
};

bool operator==(const ToolPath& a, const ToolPath& b);
bool operator!=(const ToolPath& a, const ToolPath& b);
bool operator<(const ToolPath& a, const ToolPath& b);

}  // namespace tclhub::protocol

namespace std {

template <>
struct hash<tclhub::protocol::ToolPath> {
    std::size_t operator()(const tclhub::protocol::ToolPath& path) const noexcept {
        std::size_t seed = path.ns.index();
        auto mix = [&seed](const std::string& value) {
            seed ^= std::hash<std::string>{}(value) + 0x9e3779b97f4a7c15ULL + (seed << 6) +
                    (seed >> 2);
        };
        if (const auto* user = std::get_if<tclhub::protocol::UserNamespace>(&path.ns)) {
            mix(user->id);
        }
        mix(path.package.value_or(""));
        mix(path.name);
        mix(path.version);
        return seed;
    }
};

}  // namespace std
