#include "runtime/tcl_runtime.hpp"

#include <tcl.h>

#include <mutex>
#include "core/logging/logger.hpp"

namespace tclhub::runtime {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

std::once_flag g_tcl_library_init;

}  // namespace

core::errors::Result<std::unique_ptr<ScriptRuntime>> TclRuntime::create() {
    std::call_once(g_tcl_library_init, []() { Tcl_FindExecutable(nullptr); });

    Tcl_Interp* interp = Tcl_CreateInterp();
    if (interp == nullptr) {
        return ToolError{ErrorCategory::Internal, "Unable to create a Tcl interpreter.",
                         "runtime_create_failed"};
    }

    // Builtins work without init.tcl, so a missing library is not fatal.
    if (Tcl_Init(interp) != TCL_OK) {
        LOG_WARN(std::string("TclRuntime: Tcl_Init failed: ") + Tcl_GetStringResult(interp));
        Tcl_ResetResult(interp);
    }

    return std::unique_ptr<ScriptRuntime>(
        std::make_unique<TclRuntime>(ConstructionKey{}, interp));
}

TclRuntime::TclRuntime(ConstructionKey, Tcl_Interp* interp) : interp_(interp) {}

TclRuntime::~TclRuntime() {
    if (interp_ != nullptr) {
        Tcl_DeleteInterp(interp_);
    }
}

core::errors::Result<std::string> TclRuntime::eval(const std::string& script) {
    const int code = Tcl_EvalEx(interp_, script.c_str(), static_cast<int>(script.size()),
                                TCL_EVAL_GLOBAL);
    if (code != TCL_OK && code != TCL_RETURN) {
        return fault();
    }
    return std::string(Tcl_GetStringResult(interp_));
}

core::errors::Result<bool> TclRuntime::set_var(const std::string& name,
                                               const std::string& value) {
    if (Tcl_SetVar(interp_, name.c_str(), value.c_str(),
                   TCL_GLOBAL_ONLY | TCL_LEAVE_ERR_MSG) == nullptr) {
        return fault();
    }
    return true;
}

core::errors::Result<std::string> TclRuntime::get_var(const std::string& name) const {
    const char* value = Tcl_GetVar(interp_, name.c_str(), TCL_GLOBAL_ONLY | TCL_LEAVE_ERR_MSG);
    if (value == nullptr) {
        return fault();
    }
    return std::string(value);
}

bool TclRuntime::has_command(const std::string& command) const {
    Tcl_CmdInfo info;
    return Tcl_GetCommandInfo(interp_, command.c_str(), &info) != 0;
}

std::string TclRuntime::name() const {
    return "TCL (Official)";
}

std::string TclRuntime::version() const {
    return TCL_PATCH_LEVEL;
}

std::vector<std::string> TclRuntime::features() const {
    return {"full_tcl_8_6", "file_operations", "networking", "regex",
            "threading",    "packages",        "extensions", "native_performance"};
}

ToolError TclRuntime::fault() const {
    return ToolError{ErrorCategory::InterpreterFault,
                     std::string("TCL execution error: ") + Tcl_GetStringResult(interp_),
                     "interpreter_fault"};
}

core::errors::Result<std::unique_ptr<ScriptRuntime>> create_runtime(
    const std::string& runtime_name) {
    if (runtime_name == "tcl") {
        return TclRuntime::create();
    }
    if (runtime_name == "molt") {
        return ToolError{ErrorCategory::Input,
                         "Runtime 'molt' is not available in this build.",
                         "runtime_unavailable", "Use --runtime tcl."};
    }
    return ToolError{ErrorCategory::Input, "Unknown runtime: " + runtime_name,
                     "invalid_runtime", "Use --runtime tcl."};
}

}  // namespace tclhub::runtime
