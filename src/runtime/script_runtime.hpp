#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/tool_errors.hpp"

namespace tclhub::runtime {

// The interpreter capabilities the engine consumes. An instance is owned by one
// thread for its whole life.
class ScriptRuntime {
public:
    virtual ~ScriptRuntime() = default;

    virtual core::errors::Result<std::string> eval(const std::string& script) = 0;
    virtual core::errors::Result<bool> set_var(const std::string& name,
                                               const std::string& value) = 0;
    virtual core::errors::Result<std::string> get_var(const std::string& name) const = 0;
    virtual bool has_command(const std::string& command) const = 0;

    virtual std::string name() const = 0;
    virtual std::string version() const = 0;
    virtual std::vector<std::string> features() const = 0;
    virtual bool is_safe() const = 0;
};

using RuntimeFactory = std::function<core::errors::Result<std::unique_ptr<ScriptRuntime>>()>;

// "tcl" is the only runtime built in. "molt" is known but not available.
core::errors::Result<std::unique_ptr<ScriptRuntime>> create_runtime(
    const std::string& runtime_name);

}  // namespace tclhub::runtime
