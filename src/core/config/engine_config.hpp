#pragma once
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "core/logging/logger.hpp"

namespace tclhub::core::config {

    // Returns the value of an environment variable, or nullopt when unset.
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    inline std::optional<std::string> process_env(const std::string& name) {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    }

    // $XDG_DATA_HOME/tclhub/tools.storage, else ~/.local/share/tclhub/tools.storage
    inline std::filesystem::path default_storage_root(const EnvLookup& env = process_env) {
        const auto xdg = env("XDG_DATA_HOME");
        if (xdg.has_value() && !xdg->empty()) {
            return std::filesystem::path(xdg.value()) / "tclhub" / "tools.storage";
        }
        const auto home = env("HOME");
        if (home.has_value() && !home->empty()) {
            return std::filesystem::path(home.value()) / ".local" / "share" / "tclhub" /
                   "tools.storage";
        }
        return std::filesystem::path(".tclhub") / "tools.storage";
    }

    // Validated settings for one server process
    struct EngineConfig {
        std::string runtime = "tcl";
        std::filesystem::path tools_root = "tools";
        std::filesystem::path storage_root;
        bool privileged = false;
        std::size_t queue_capacity = 100;
        logging::LogLevel log_level = logging::LogLevel::INFO;
        bool discover_on_start = true;
    };

} // namespace tclhub::core::config
