#include "cli_parser.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace tclhub::app::cli {

    using namespace tclhub::core::errors;
    using tclhub::core::config::EngineConfig;
    using tclhub::core::config::EnvLookup;
    using tclhub::core::logging::LogLevel;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> runtime;
        std::optional<std::string> tools_dir;
        std::optional<std::string> storage_dir;
        std::optional<std::string> queue_capacity;
        std::optional<std::string> log_level;
        bool privileged = false;
        bool no_discover = false;
    };

    namespace {

        std::string lowercase(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](const unsigned char c) {
                               return static_cast<char>(std::tolower(c));
                           });
            return value;
        }

        std::optional<LogLevel> parse_log_level(const std::string& text) {
            const std::string lowered = lowercase(text);
            if (lowered == "debug") return LogLevel::DEBUG;
            if (lowered == "info") return LogLevel::INFO;
            if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
            if (lowered == "error") return LogLevel::ERROR;
            return std::nullopt;
        }

        // A flag value first, then the environment.
        std::optional<std::string> pick(const std::optional<std::string>& flag,
                                        const EnvLookup& env, const std::string& env_name) {
            if (flag.has_value()) {
                return flag;
            }
            auto from_env = env(env_name);
            if (from_env.has_value() && from_env->empty()) {
                return std::nullopt;
            }
            return from_env;
        }

    }  // namespace

    Result<EngineConfig> parse_and_validate(int argc, char* argv[], const EnvLookup& env) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Skip program name
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--runtime") {
                if (i + 1 < args.size()) raw.runtime = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --runtime", "missing_value"};
            } else if (args[i] == "--tools-dir") {
                if (i + 1 < args.size()) raw.tools_dir = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --tools-dir", "missing_value"};
            } else if (args[i] == "--storage-dir") {
                if (i + 1 < args.size()) raw.storage_dir = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --storage-dir", "missing_value"};
            } else if (args[i] == "--queue-capacity") {
                if (i + 1 < args.size()) raw.queue_capacity = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --queue-capacity", "missing_value"};
            } else if (args[i] == "--log-level") {
                if (i + 1 < args.size()) raw.log_level = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --log-level", "missing_value"};
            } else if (args[i] == "--privileged") {
                raw.privileged = true;
            } else if (args[i] == "--no-discover") {
                raw.no_discover = true;
            } else {
                return ToolError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument",
                                 "Supported: --runtime, --tools-dir, --storage-dir, --queue-capacity, "
                                 "--log-level, --privileged, --no-discover"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        EngineConfig config;
        config.privileged = raw.privileged;
        config.discover_on_start = !raw.no_discover;

        if (auto runtime = pick(raw.runtime, env, "TCLHUB_RUNTIME")) {
            const std::string lowered = lowercase(runtime.value());
            if (lowered != "tcl" && lowered != "molt") {
                return ToolError{ErrorCategory::Input, "Invalid runtime type '" + runtime.value() + "'",
                                 "invalid_runtime", "Valid options: tcl"};
            }
            config.runtime = lowered;
        }

        if (auto tools_dir = pick(raw.tools_dir, env, "TCLHUB_TOOLS_DIR")) {
            config.tools_root = std::filesystem::path(tools_dir.value());
        }

        if (auto storage_dir = pick(raw.storage_dir, env, "TCLHUB_STORAGE_DIR")) {
            config.storage_root = std::filesystem::path(storage_dir.value());
        } else {
            config.storage_root = core::config::default_storage_root(env);
        }

        // Exception-free integer parsing
        if (raw.queue_capacity) {
            std::size_t capacity = 0;
            const char* begin = raw.queue_capacity->data();
            const char* end = raw.queue_capacity->data() + raw.queue_capacity->size();
            auto [ptr, ec] = std::from_chars(begin, end, capacity);
            if (ec != std::errc() || ptr != end) {
                return ToolError{ErrorCategory::Input, "Invalid number for --queue-capacity", "invalid_integer", "Provide a positive integer."};
            }
            if (capacity == 0 || capacity > 10000) {
                return ToolError{ErrorCategory::Input, "--queue-capacity out of bounds", "bounds_error", "Must be between 1 and 10000."};
            }
            config.queue_capacity = capacity;
        }

        if (auto level_text = pick(raw.log_level, env, "TCLHUB_LOG_LEVEL")) {
            auto level = parse_log_level(level_text.value());
            if (!level.has_value()) {
                return ToolError{ErrorCategory::Input, "Invalid log level '" + level_text.value() + "'",
                                 "invalid_log_level", "Use debug, info, warn or error."};
            }
            config.log_level = level.value();
        }

        return config;
    }

} // namespace tclhub::app::cli
