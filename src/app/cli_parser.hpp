#pragma once
#include "core/config/engine_config.hpp"
#include "core/errors/tool_errors.hpp"

namespace tclhub::app::cli {
    // Flags win over environment variables, which win over defaults.
    core::errors::Result<core::config::EngineConfig> parse_and_validate(
        int argc, char* argv[],
        const core::config::EnvLookup& env = core::config::process_env);
}
