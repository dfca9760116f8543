#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/engine_config.hpp"
#include "core/errors/tool_errors.hpp"

namespace {

using tclhub::app::cli::parse_and_validate;
using tclhub::core::config::EngineConfig;
using tclhub::core::config::EnvLookup;
using tclhub::core::errors::ErrorCategory;
using tclhub::core::errors::get_error;
using tclhub::core::errors::get_value;
using tclhub::core::errors::is_error;
using tclhub::core::logging::LogLevel;

EnvLookup fake_env(std::map<std::string, std::string> values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        const auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

tclhub::core::errors::Result<EngineConfig> parse_tokens(
    const std::vector<std::string>& tokens,
    const EnvLookup& env = fake_env({{"HOME", "/home/tester"}})) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("tclhub");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data(), env);
}

TEST(EngineConfigTest, DefaultsWithoutFlags) {
    auto result = parse_tokens({});
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.runtime, "tcl");
    EXPECT_EQ(config.tools_root, std::filesystem::path("tools"));
    EXPECT_EQ(config.storage_root,
              std::filesystem::path("/home/tester/.local/share/tclhub/tools.storage"));
    EXPECT_FALSE(config.privileged);
    EXPECT_EQ(config.queue_capacity, 100u);
    EXPECT_EQ(config.log_level, LogLevel::INFO);
    EXPECT_TRUE(config.discover_on_start);
}

TEST(EngineConfigTest, XdgDataHomeWinsOverHome) {
    auto result = parse_tokens({}, fake_env({{"HOME", "/home/tester"},
                                             {"XDG_DATA_HOME", "/data"}}));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).storage_root,
              std::filesystem::path("/data/tclhub/tools.storage"));
}

TEST(EngineConfigTest, ParsesAllFlags) {
    auto result = parse_tokens({"--runtime", "TCL", "--tools-dir", "/srv/tools", "--storage-dir",
                                "/srv/store", "--privileged", "--queue-capacity", "8",
                                "--log-level", "debug", "--no-discover"});
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.runtime, "tcl");
    EXPECT_EQ(config.tools_root, std::filesystem::path("/srv/tools"));
    EXPECT_EQ(config.storage_root, std::filesystem::path("/srv/store"));
    EXPECT_TRUE(config.privileged);
    EXPECT_EQ(config.queue_capacity, 8u);
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
    EXPECT_FALSE(config.discover_on_start);
}

TEST(EngineConfigTest, FlagsOverrideEnvironment) {
    const auto env = fake_env({{"TCLHUB_TOOLS_DIR", "/env/tools"},
                               {"TCLHUB_STORAGE_DIR", "/env/store"},
                               {"TCLHUB_LOG_LEVEL", "warn"}});

    auto from_env = parse_tokens({}, env);
    ASSERT_FALSE(is_error(from_env));
    EXPECT_EQ(get_value(from_env).tools_root, std::filesystem::path("/env/tools"));
    EXPECT_EQ(get_value(from_env).storage_root, std::filesystem::path("/env/store"));
    EXPECT_EQ(get_value(from_env).log_level, LogLevel::WARN);

    auto from_flags = parse_tokens({"--tools-dir", "/flag/tools", "--log-level", "error"}, env);
    ASSERT_FALSE(is_error(from_flags));
    EXPECT_EQ(get_value(from_flags).tools_root, std::filesystem::path("/flag/tools"));
    EXPECT_EQ(get_value(from_flags).log_level, LogLevel::ERROR);
}

TEST(EngineConfigTest, EmptyEnvironmentValueCountsAsUnset) {
    auto result = parse_tokens({}, fake_env({{"TCLHUB_TOOLS_DIR", ""}, {"HOME", "/h"}}));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).tools_root, std::filesystem::path("tools"));
}

TEST(EngineConfigTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"--tools-dir"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(EngineConfigTest, FailsWhenArgumentUnknown) {
    auto result = parse_tokens({"--verbose"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(EngineConfigTest, FailsWhenRuntimeUnknown) {
    auto result = parse_tokens({"--runtime", "jim"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_runtime");
}

TEST(EngineConfigTest, FailsWhenQueueCapacityNotNumeric) {
    auto result = parse_tokens({"--queue-capacity", "12abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(EngineConfigTest, FailsWhenQueueCapacityOutOfBounds) {
    auto zero = parse_tokens({"--queue-capacity", "0"});
    ASSERT_TRUE(is_error(zero));
    EXPECT_EQ(get_error(zero).code, "bounds_error");

    auto huge = parse_tokens({"--queue-capacity", "10001"});
    ASSERT_TRUE(is_error(huge));
    EXPECT_EQ(get_error(huge).code, "bounds_error");
}

TEST(EngineConfigTest, FailsWhenLogLevelInvalid) {
    auto result = parse_tokens({}, fake_env({{"TCLHUB_LOG_LEVEL", "loud"}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_log_level");
}

}  // namespace
