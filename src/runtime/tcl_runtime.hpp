#pragma once

#include <memory>
#include <string>
#include <vector>
#include "runtime/script_runtime.hpp"

struct Tcl_Interp;

namespace tclhub::runtime {

// Full Tcl 8.6 through libtcl. Not a safe interpreter: scripts can reach the
// filesystem and exec.
class TclRuntime : public ScriptRuntime {
    // Only create() can build one.
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    static core::errors::Result<std::unique_ptr<ScriptRuntime>> create();

    TclRuntime(ConstructionKey, Tcl_Interp* interp);

    ~TclRuntime() override;
    TclRuntime(const TclRuntime&) = delete;
    TclRuntime& operator=(const TclRuntime&) = delete;

    core::errors::Result<std::string> eval(const std::string& script) override;
    core::errors::Result<bool> set_var(const std::string& name,
                                       const std::string& value) override;
    core::errors::Result<std::string> get_var(const std::string& name) const override;
    bool has_command(const std::string& command) const override;

    std::string name() const override;
    std::string version() const override;
    std::vector<std::string> features() const override;
    bool is_safe() const override { return false; }

private:
    core::errors::ToolError fault() const;

    Tcl_Interp* interp_;
};

}  // namespace tclhub::runtime
