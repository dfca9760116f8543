#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/tool_id.hpp"
#include "core/errors/tool_errors.hpp"
#include "policy/namespace_guard.hpp"
#include "protocol/tool_path.hpp"

namespace {

using tclhub::core::errors::ErrorCategory;
using tclhub::core::errors::get_error;
using tclhub::core::errors::get_value;
using tclhub::core::errors::is_error;
using tclhub::policy::AccessPolicy;
using tclhub::policy::NamespaceGuard;
using tclhub::protocol::ToolPath;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_namespace_guard_" + tclhub::core::config::generate_short_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

TEST(NamespaceGuardTest, RejectsMutationOfSystemPaths) {
    NamespaceGuard guard;
    for (const auto& path : {ToolPath::bin("tcl_execute"), ToolPath::sbin("tcl_tool_add"),
                             ToolPath::docs("molt_book")}) {
        auto result = guard.validate_mutation(path, "add");
        ASSERT_TRUE(is_error(result)) << path.to_string();
        EXPECT_EQ(get_error(result).category, ErrorCategory::NamespaceViolation);
        EXPECT_EQ(get_error(result).code, "namespace_violation");
    }
}

TEST(NamespaceGuardTest, AllowsValidUserPath) {
    NamespaceGuard guard;
    const auto path = ToolPath::user("bob", "math", "add", "1.0");
    auto result = guard.validate_mutation(path, "add");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), path);
}

TEST(NamespaceGuardTest, RejectsUserPathWithBadSegments) {
    NamespaceGuard guard;
    auto result = guard.validate_mutation(ToolPath::user("bob", "ma__th", "add"), "add");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::PathFormat);
}

TEST(NamespaceGuardTest, PrivilegedOperationsNeedPrivilegedPolicy) {
    NamespaceGuard unprivileged;
    auto rejected = unprivileged.validate_privileged("add_tool");
    ASSERT_TRUE(is_error(rejected));
    EXPECT_EQ(get_error(rejected).category, ErrorCategory::NamespaceViolation);
    EXPECT_EQ(get_error(rejected).code, "privileged_required");
    EXPECT_FALSE(get_error(rejected).hint.empty());

    NamespaceGuard privileged(AccessPolicy{true});
    auto accepted = privileged.validate_privileged("add_tool");
    ASSERT_FALSE(is_error(accepted));
    EXPECT_EQ(get_value(accepted), "add_tool");
    EXPECT_TRUE(privileged.privileged());
}

TEST(NamespaceGuardTest, AcceptsStoreFileInsideRoot) {
    TempWorkspace workspace;
    write_file(workspace.root() / "users/bob/math/add.json", "{}");

    NamespaceGuard guard;
    auto result = guard.validate_store_file(workspace.root(), "users/bob/math/add.json");
    ASSERT_FALSE(is_error(result));

    const auto resolved = get_value(result);
    EXPECT_TRUE(resolved.is_absolute());
    EXPECT_EQ(resolved.filename().string(), "add.json");
}

TEST(NamespaceGuardTest, RejectsStoreFileOutsideRoot) {
    TempWorkspace workspace;

    NamespaceGuard guard;
    auto escaped = guard.validate_store_file(workspace.root(), "../outside.json");
    ASSERT_TRUE(is_error(escaped));
    EXPECT_EQ(get_error(escaped).code, "store_file_outside_root");
    EXPECT_EQ(get_error(escaped).category, ErrorCategory::PersistenceFault);

    auto absolute =
        guard.validate_store_file(workspace.root(), workspace.root().parent_path() / "x.json");
    ASSERT_TRUE(is_error(absolute));
    EXPECT_EQ(get_error(absolute).code, "store_file_outside_root");
}

TEST(NamespaceGuardTest, WithinRootComparesWholeComponents) {
    EXPECT_TRUE(NamespaceGuard::is_within_root("/data/store", "/data/store/users/bob"));
    EXPECT_TRUE(NamespaceGuard::is_within_root("/data/store", "/data/store"));
    EXPECT_FALSE(NamespaceGuard::is_within_root("/data/store", "/data/store2/users"));
    EXPECT_FALSE(NamespaceGuard::is_within_root("/data/store", "/data"));
}

}  // namespace
