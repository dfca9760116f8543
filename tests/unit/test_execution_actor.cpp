#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/tool_id.hpp"
#include "core/errors/tool_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/tool_path.hpp"
#include "runtime/execution_actor.hpp"
#include "runtime/script_runtime.hpp"
#include "storage/tool_store.hpp"

namespace {

using tclhub::core::errors::ErrorCategory;
using tclhub::core::errors::get_error;
using tclhub::core::errors::get_value;
using tclhub::core::errors::is_error;
using tclhub::core::errors::Result;
using tclhub::core::errors::take_value;
using tclhub::core::errors::ToolError;
using tclhub::protocol::ParameterDefinition;
using tclhub::protocol::ToolPath;
using tclhub::runtime::ActorOptions;
using tclhub::runtime::ExecutionActor;
using tclhub::runtime::RuntimeFactory;
using tclhub::runtime::ScriptRuntime;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_execution_actor_" + tclhub::core::config::generate_short_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path tools() const { return root_ / "tools"; }
    std::filesystem::path storage() const { return root_ / "storage"; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

// Shared with the test so it can inspect what the actor evaluated.
struct FakeState {
    std::mutex mutex;
    std::vector<std::string> scripts;
    std::thread::id created_on;
    std::thread::id evaluated_on;

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return scripts;
    }
};

// Echoes each script back; a script containing FAIL is an interpreter fault.
class FakeRuntime : public ScriptRuntime {
public:
    explicit FakeRuntime(std::shared_ptr<FakeState> state) : state_(std::move(state)) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->created_on = std::this_thread::get_id();
    }

    Result<std::string> eval(const std::string& script) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->scripts.push_back(script);
        state_->evaluated_on = std::this_thread::get_id();
        if (script.find("FAIL") != std::string::npos) {
            return ToolError{ErrorCategory::InterpreterFault, "TCL execution error: FAIL",
                             "interpreter_fault"};
        }
        return script;
    }

    Result<bool> set_var(const std::string&, const std::string&) override { return true; }
    Result<std::string> get_var(const std::string& name) const override {
        return ToolError{ErrorCategory::InterpreterFault, "no variable " + name,
                         "interpreter_fault"};
    }
    bool has_command(const std::string&) const override { return false; }
    std::string name() const override { return "Fake"; }
    std::string version() const override { return "0"; }
    std::vector<std::string> features() const override { return {"recording"}; }
    bool is_safe() const override { return true; }

private:
    std::shared_ptr<FakeState> state_;
};

RuntimeFactory fake_factory(const std::shared_ptr<FakeState>& state) {
    return [state]() -> Result<std::unique_ptr<ScriptRuntime>> {
        return std::unique_ptr<ScriptRuntime>(std::make_unique<FakeRuntime>(state));
    };
}

std::unique_ptr<ExecutionActor> spawn_actor(const TempWorkspace& workspace,
                                            const RuntimeFactory& factory) {
    ActorOptions options;
    options.tools_root = workspace.tools();
    options.storage_root = workspace.storage();
    options.queue_capacity = 4;
    auto spawned = ExecutionActor::spawn(options, factory);
    EXPECT_FALSE(is_error(spawned));
    return take_value(spawned);
}

std::vector<ParameterDefinition> required_params(const std::vector<std::string>& names) {
    std::vector<ParameterDefinition> parameters;
    for (const auto& name : names) {
        parameters.push_back(ParameterDefinition{name, name + " value", true, "number"});
    }
    return parameters;
}

TEST(ExecutionActorTest, ExecuteReturnsRuntimeResult) {
    TempWorkspace workspace;
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));

    auto result = actor->execute("puts hi").get();
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "puts hi");

    auto failed = actor->execute("FAIL now").get();
    ASSERT_TRUE(is_error(failed));
    EXPECT_EQ(get_error(failed).category, ErrorCategory::InterpreterFault);
    EXPECT_EQ(get_error(failed).message, "TCL execution error: FAIL");
}

TEST(ExecutionActorTest, RuntimeLivesOnTheWorkerThread) {
    TempWorkspace workspace;
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));
    ASSERT_FALSE(is_error(actor->execute("set x 1").get()));

    std::lock_guard<std::mutex> lock(state->mutex);
    EXPECT_EQ(state->created_on, state->evaluated_on);
    EXPECT_NE(state->created_on, std::this_thread::get_id());
}

TEST(ExecutionActorTest, CommandsRunInSubmissionOrder) {
    TempWorkspace workspace;
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));

    std::vector<std::future<ExecutionActor::TextReply>> replies;
    for (int i = 0; i < 20; ++i) {
        replies.push_back(actor->execute("step " + std::to_string(i)));
    }
    for (auto& reply : replies) {
        ASSERT_FALSE(is_error(reply.get()));
    }

    const auto scripts = state->snapshot();
    ASSERT_EQ(scripts.size(), 20u);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(scripts[i], "step " + std::to_string(i));
    }
}

TEST(ExecutionActorTest, SpawnFailsWhenRuntimeCannotBeCreated) {
    TempWorkspace workspace;
    ActorOptions options;
    options.storage_root = workspace.storage();
    RuntimeFactory broken = []() -> Result<std::unique_ptr<ScriptRuntime>> {
        return ToolError{ErrorCategory::Input, "no such runtime", "invalid_runtime"};
    };

    auto spawned = ExecutionActor::spawn(options, broken);
    ASSERT_TRUE(is_error(spawned));
    EXPECT_EQ(get_error(spawned).code, "invalid_runtime");
}

TEST(ExecutionActorTest, CallsAfterShutdownFailImmediately) {
    TempWorkspace workspace;
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));
    actor->shutdown();

    auto result = actor->execute("set x 1").get();
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Internal);
    EXPECT_TRUE(state->snapshot().empty());
}

TEST(ExecutionActorTest, AddToolRejectsSystemNamespaces) {
    TempWorkspace workspace;
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));

    for (const auto& path : {ToolPath::bin("mine"), ToolPath::sbin("mine"),
                             ToolPath::docs("mine")}) {
        auto result = actor->add_tool(path, "d", "puts x", {}).get();
        ASSERT_TRUE(is_error(result)) << path.to_string();
        EXPECT_EQ(get_error(result).category, ErrorCategory::NamespaceViolation);
    }

    auto listed = actor->list_tools(std::nullopt, std::string("mine")).get();
    ASSERT_FALSE(is_error(listed));
    EXPECT_TRUE(get_value(listed).empty());
    EXPECT_FALSE(std::filesystem::exists(workspace.storage()));
}

TEST(ExecutionActorTest, AddToolRejectsInvalidSegments) {
    TempWorkspace workspace;
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));

    auto result = actor->add_tool(ToolPath::user("bob", "math", "add", "1_0"), "", "x", {}).get();
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::PathFormat);
}

TEST(ExecutionActorTest, AddToolPersistsAndRejectsDuplicates) {
    TempWorkspace workspace;
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));
    const auto path = ToolPath::user("bob", "math", "add", "1.0");

    auto added = actor->add_tool(path, "Add", "expr {$a + $b}", required_params({"a", "b"})).get();
    ASSERT_FALSE(is_error(added)) << get_error(added).message;
    EXPECT_EQ(get_value(added), "Tool '/bob/math/add:1.0' added successfully and persisted");
    EXPECT_TRUE(std::filesystem::exists(workspace.storage() / "users" / "bob" / "math" /
                                        "add_1.0.json"));

    auto duplicate = actor->add_tool(path, "Add", "expr 0", {}).get();
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).category, ErrorCategory::DuplicateTool);
}

TEST(ExecutionActorTest, AddToolFallsBackToMemoryWhenStoreUnavailable) {
    TempWorkspace workspace;
    write_file(workspace.root() / "blocker", "not a directory");

    ActorOptions options;
    options.tools_root = workspace.tools();
    options.storage_root = workspace.root() / "blocker" / "store";
    auto state = std::make_shared<FakeState>();
    auto spawned = ExecutionActor::spawn(options, fake_factory(state));
    ASSERT_FALSE(is_error(spawned));
    auto actor = take_value(spawned);

    const auto path = ToolPath::user("bob", "math", "add");
    auto added = actor->add_tool(path, "Add", "expr 1", {}).get();
    ASSERT_FALSE(is_error(added));
    EXPECT_EQ(get_value(added), "Tool '/bob/math/add' added to memory (persistence unavailable)");

    auto executed = actor->execute_custom_tool(path, json::object()).get();
    ASSERT_FALSE(is_error(executed));
    EXPECT_EQ(get_value(executed), "expr 1");
}

TEST(ExecutionActorTest, RemoveToolIsIdempotentAndGuarded) {
    TempWorkspace workspace;
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));
    const auto path = ToolPath::user("bob", "math", "add");
    ASSERT_FALSE(is_error(actor->add_tool(path, "", "expr 1", {}).get()));

    auto system = actor->remove_tool(ToolPath::bin("tcl_execute")).get();
    ASSERT_TRUE(is_error(system));
    EXPECT_EQ(get_error(system).category, ErrorCategory::NamespaceViolation);

    auto removed = actor->remove_tool(path).get();
    ASSERT_FALSE(is_error(removed));
    EXPECT_EQ(get_value(removed), "Tool '/bob/math/add' removed successfully");
    EXPECT_FALSE(std::filesystem::exists(workspace.storage() / "users"));

    auto again = actor->remove_tool(path).get();
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).category, ErrorCategory::NotFound);
}

TEST(ExecutionActorTest, ListToolsMergesAndFilters) {
    TempWorkspace workspace;
    write_file(workspace.tools() / "bin" / "hello_world.tcl", "puts hello\n");
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));
    ASSERT_FALSE(is_error(actor->discover_tools().get()));
    ASSERT_FALSE(is_error(actor->add_tool(ToolPath::user("bob", "math", "add"), "", "x", {}).get()));

    auto all = actor->list_tools().get();
    ASSERT_FALSE(is_error(all));
    const std::vector<std::string> expected = {
        "/bin/discover_tools", "/bin/exec_tool",     "/bin/hello_world",
        "/bin/tcl_execute",    "/bin/tcl_tool_list", "/bob/math/add",
        "/docs/molt_book",     "/sbin/tcl_tool_add", "/sbin/tcl_tool_remove"};
    EXPECT_EQ(get_value(all), expected);

    auto bob = actor->list_tools(std::string("bob")).get();
    ASSERT_FALSE(is_error(bob));
    EXPECT_EQ(get_value(bob), std::vector<std::string>{"/bob/math/add"});

    auto docs = actor->list_tools(std::string("docs")).get();
    ASSERT_FALSE(is_error(docs));
    EXPECT_EQ(get_value(docs), std::vector<std::string>{"/docs/molt_book"});

    auto filtered = actor->list_tools(std::string("bin"), std::string("tool")).get();
    ASSERT_FALSE(is_error(filtered));
    EXPECT_EQ(get_value(filtered),
              (std::vector<std::string>{"/bin/discover_tools", "/bin/exec_tool",
                                        "/bin/tcl_tool_list"}));
}

TEST(ExecutionActorTest, MissingRequiredParameterSkipsEvaluation) {
    TempWorkspace workspace;
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));
    const auto path = ToolPath::user("alice", "greet", "hello");
    ASSERT_FALSE(is_error(
        actor->add_tool(path, "", "puts \"Hello, $name\"", required_params({"name"})).get()));

    auto result = actor->execute_custom_tool(path, json{{"other", 1}}).get();
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::MissingRequiredParameter);
    EXPECT_NE(get_error(result).message.find("Missing required parameter: name"),
              std::string::npos);

    auto not_object = actor->execute_custom_tool(path, json::array({"x"})).get();
    ASSERT_TRUE(is_error(not_object));
    EXPECT_EQ(get_error(not_object).category, ErrorCategory::MissingRequiredParameter);

    EXPECT_TRUE(state->snapshot().empty());
}

TEST(ExecutionActorTest, BindsDeclaredParametersBeforeTheBody) {
    TempWorkspace workspace;
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));
    const auto path = ToolPath::user("alice", "text", "show");

    std::vector<ParameterDefinition> parameters = {
        ParameterDefinition{"count", "", true, "number"},
        ParameterDefinition{"label", "", false, "string"},
        ParameterDefinition{"flag", "", false, "boolean"},
        ParameterDefinition{"unused", "", false, "string"}};
    ASSERT_FALSE(is_error(actor->add_tool(path, "", "BODY", parameters).get()));

    auto result = actor->execute_custom_tool(
        path, json{{"count", 3}, {"label", "say \"hi\""}, {"flag", true}, {"extra", 9}}).get();
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result),
              "set count 3\n"
              "set label \"say \\\"hi\\\"\"\n"
              "set flag true\n"
              "BODY");
}

TEST(ExecutionActorTest, ExecuteCustomToolIgnoresDiscoveredTools) {
    TempWorkspace workspace;
    write_file(workspace.tools() / "bin" / "hello_world.tcl", "puts hello\n");
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));
    ASSERT_FALSE(is_error(actor->discover_tools().get()));

    auto result = actor->execute_custom_tool(ToolPath::bin("hello_world"), json::object()).get();
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::NotFound);
}

TEST(ExecutionActorTest, ToolDefinitionsIncludeDiscoveredPlaceholders) {
    TempWorkspace workspace;
    const auto script_file = workspace.tools() / "bin" / "hello_world.tcl";
    write_file(script_file, "# @description Hello\n# @param name:string Who\nputs hello\n");
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));
    ASSERT_FALSE(is_error(actor->discover_tools().get()));
    ASSERT_FALSE(is_error(
        actor->add_tool(ToolPath::user("bob", "math", "add"), "Add", "expr 1", {}).get()));

    auto definitions = actor->get_tool_definitions().get();
    ASSERT_FALSE(is_error(definitions));
    const auto& tools = get_value(definitions);
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].path, ToolPath::user("bob", "math", "add"));
    EXPECT_EQ(tools[0].script, "expr 1");
    EXPECT_EQ(tools[1].path, ToolPath::bin("hello_world"));
    EXPECT_EQ(tools[1].description, "Hello");
    EXPECT_EQ(tools[1].script, "# Tool loaded from: " + script_file.string());
    ASSERT_EQ(tools[1].parameters.size(), 1u);
}

TEST(ExecutionActorTest, InitializePersistenceIsIdempotent) {
    TempWorkspace workspace;
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));

    auto first = actor->initialize_persistence().get();
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(get_value(first), "Persistence initialized. Loaded 0 tools from storage.");

    auto second = actor->initialize_persistence().get();
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second), "Persistence already initialized");
}

TEST(ExecutionActorTest, InitializePersistenceLoadsStoredTools) {
    TempWorkspace workspace;
    {
        auto opened = tclhub::storage::ToolStore::open(workspace.storage());
        ASSERT_FALSE(is_error(opened));
        auto store = take_value(opened);
        tclhub::protocol::ToolDefinition stored{ToolPath::user("carol", "util", "now"), "Now",
                                                "clock seconds", {}};
        ASSERT_FALSE(is_error(store.save(stored)));
    }

    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));
    auto loaded = actor->initialize_persistence().get();
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded), "Persistence initialized. Loaded 1 tools from storage.");

    auto executed =
        actor->execute_custom_tool(ToolPath::user("carol", "util", "now"), json::object()).get();
    ASSERT_FALSE(is_error(executed));
    EXPECT_EQ(get_value(executed), "clock seconds");
}

TEST(ExecutionActorTest, FirstAddToolLoadsStoredTools) {
    TempWorkspace workspace;
    {
        auto opened = tclhub::storage::ToolStore::open(workspace.storage());
        ASSERT_FALSE(is_error(opened));
        auto store = take_value(opened);
        tclhub::protocol::ToolDefinition stored{ToolPath::user("bob", "math", "sub"), "Sub",
                                                "expr {$a - $b}", {}};
        ASSERT_FALSE(is_error(store.save(stored)));
    }

    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));
    ASSERT_FALSE(is_error(
        actor->add_tool(ToolPath::user("bob", "math", "add"), "Add", "expr 1", {}).get()));

    auto listed = actor->list_tools(std::string("bob")).get();
    ASSERT_FALSE(is_error(listed));
    EXPECT_EQ(get_value(listed),
              (std::vector<std::string>{"/bob/math/add", "/bob/math/sub"}));

    auto duplicate =
        actor->add_tool(ToolPath::user("bob", "math", "sub"), "Sub", "expr 0", {}).get();
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).category, ErrorCategory::DuplicateTool);
}

TEST(ExecutionActorTest, ExecToolExposesAllParamsToCustomTools) {
    TempWorkspace workspace;
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));
    ASSERT_FALSE(is_error(actor->add_tool(ToolPath::user("bob", "math", "add"), "", "BODY",
                                          required_params({"a"}))
                              .get()));

    auto result = actor->exec_tool("/bob/math/add", json{{"a", 2}, {"z", "zed"}}).get();
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result),
              "set a 2\n"
              "array set params {}\n"
              "set params(a) 2\n"
              "set params(z) \"zed\"\n"
              "BODY");

    auto missing = actor->exec_tool("/bob/math/add", json{{"z", 1}}).get();
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).category, ErrorCategory::MissingRequiredParameter);
}

TEST(ExecutionActorTest, ExecToolReadsDiscoveredScriptFresh) {
    TempWorkspace workspace;
    const auto script_file = workspace.tools() / "users" / "alice" / "text" / "shout.tcl";
    write_file(script_file, "# @param word:string:required Word\nstring toupper $word\n");
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));
    ASSERT_FALSE(is_error(actor->discover_tools().get()));

    write_file(script_file, "# @param word:string:required Word\nstring tolower $word\n");
    auto result = actor->exec_tool("/alice/text/shout", json{{"word", "Hey"}}).get();
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result),
              "set word \"Hey\"\n"
              "# @param word:string:required Word\nstring tolower $word\n");

    std::filesystem::remove(script_file);
    auto gone = actor->exec_tool("/alice/text/shout", json{{"word", "Hey"}}).get();
    ASSERT_TRUE(is_error(gone));
    EXPECT_EQ(get_error(gone).category, ErrorCategory::DiscoveryIO);
}

TEST(ExecutionActorTest, ExecToolHandlesBuiltins) {
    TempWorkspace workspace;
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));

    auto executed = actor->exec_tool("/bin/tcl_execute", json{{"script", "expr 7"}}).get();
    ASSERT_FALSE(is_error(executed));
    EXPECT_EQ(get_value(executed), "expr 7");

    auto no_script = actor->exec_tool("/bin/tcl_execute", json::object()).get();
    ASSERT_TRUE(is_error(no_script));
    EXPECT_EQ(get_error(no_script).category, ErrorCategory::MissingRequiredParameter);

    auto listed = actor->exec_tool("/bin/tcl_tool_list", json{{"namespace", "sbin"}}).get();
    ASSERT_FALSE(is_error(listed));
    EXPECT_EQ(get_value(listed), "/sbin/tcl_tool_add\n/sbin/tcl_tool_remove");

    auto unknown = actor->exec_tool("/bin/nope", json::object()).get();
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).category, ErrorCategory::NotFound);

    auto malformed = actor->exec_tool("bin/nope", json::object()).get();
    ASSERT_TRUE(is_error(malformed));
    EXPECT_EQ(get_error(malformed).category, ErrorCategory::PathFormat);
}

TEST(ExecutionActorTest, DiscoveryMergeIsAdditive) {
    TempWorkspace workspace;
    write_file(workspace.tools() / "bin" / "one.tcl", "puts 1\n");
    write_file(workspace.tools() / "bin" / "two.tcl", "puts 2\n");
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));

    auto first = actor->discover_tools().get();
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(get_value(first), "Discovered 2 tools from filesystem");

    std::filesystem::remove(workspace.tools() / "bin" / "two.tcl");
    auto second = actor->discover_tools().get();
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second), "Discovered 1 tools from filesystem");

    auto listed = actor->list_tools(std::string("bin"), std::string("/bin/t")).get();
    ASSERT_FALSE(is_error(listed));
    const auto& paths = get_value(listed);
    EXPECT_NE(std::find(paths.begin(), paths.end(), "/bin/two"), paths.end());
}

TEST(ExecutionActorTest, ConcurrentAddsAreAllKept) {
    TempWorkspace workspace;
    auto state = std::make_shared<FakeState>();
    auto actor = spawn_actor(workspace, fake_factory(state));

    constexpr int kTools = 16;
    std::vector<std::thread> callers;
    std::vector<int> failures(kTools, 0);
    for (int i = 0; i < kTools; ++i) {
        callers.emplace_back([&actor, &failures, i]() {
            auto result = actor->add_tool(ToolPath::user("user" + std::to_string(i), "pkg", "tool"),
                                          "", "expr " + std::to_string(i), {})
                              .get();
            failures[i] = is_error(result) ? 1 : 0;
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    EXPECT_EQ(std::count(failures.begin(), failures.end(), 1), 0);
    auto definitions = actor->get_tool_definitions().get();
    ASSERT_FALSE(is_error(definitions));
    EXPECT_EQ(get_value(definitions).size(), static_cast<std::size_t>(kTools));
}

TEST(ExecutionActorTest, EndToEndWithTcl) {
    TempWorkspace workspace;
    ActorOptions options;
    options.tools_root = workspace.tools();
    options.storage_root = workspace.storage();
    auto spawned = ExecutionActor::spawn(
        options, []() { return tclhub::runtime::create_runtime("tcl"); });
    ASSERT_FALSE(is_error(spawned)) << get_error(spawned).message;
    auto actor = take_value(spawned);

    auto initialized = actor->initialize_persistence().get();
    ASSERT_FALSE(is_error(initialized));
    EXPECT_EQ(get_value(initialized), "Persistence initialized. Loaded 0 tools from storage.");

    const auto path = ToolPath::user("bob", "math", "add", "1.0");
    auto added =
        actor->add_tool(path, "Add two numbers", "expr {$a + $b}", required_params({"a", "b"}))
            .get();
    ASSERT_FALSE(is_error(added)) << get_error(added).message;

    auto sum = actor->execute_custom_tool(path, json{{"a", 2}, {"b", 3}}).get();
    ASSERT_FALSE(is_error(sum)) << get_error(sum).message;
    EXPECT_EQ(get_value(sum), "5");

    auto listed = actor->list_tools(std::string("bob")).get();
    ASSERT_FALSE(is_error(listed));
    EXPECT_EQ(get_value(listed), std::vector<std::string>{"/bob/math/add:1.0"});

    auto removed = actor->remove_tool(path).get();
    ASSERT_FALSE(is_error(removed));

    auto after = actor->execute_custom_tool(path, json{{"a", 2}, {"b", 3}}).get();
    ASSERT_TRUE(is_error(after));
    EXPECT_EQ(get_error(after).category, ErrorCategory::NotFound);
}

}  // namespace
