#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "utils/logging.hpp"

namespace runbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("RUNBOX_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".runbox" / "config.json";
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::logic_error&) {
        utils::LogWarn("config", "ignoring non-integer value", {{"value", value}});
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyInt(int& target, const nlohmann::json& source, const char* key) {
    if (!source.contains(key) || !source[key].is_number_integer()) {
        return;
    }
    const auto& value = source[key];
    const bool in_range = value.is_number_unsigned()
        ? value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : value.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
              value.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        utils::LogWarn("config", "ignoring out-of-range value", {{"key", key}, {"value", value.dump()}});
        return;
    }
    target = static_cast<int>(value.get<std::int64_t>());
}

void ApplyStringList(std::vector<std::string>& target, const nlohmann::json& source, const char* key) {
    if (!source.contains(key) || !source[key].is_array()) {
        return;
    }
    target.clear();
    for (const auto& item : source[key]) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        }
    }
}

// Merges entries into target; existing keys not named in source are kept.
void ApplyStringMap(std::unordered_map<std::string, std::string>& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    for (const auto& [key, value] : source.items()) {
        if (value.is_string()) {
            target[key] = value.get<std::string>();
        }
    }
}

}  // namespace

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("executor") && data["executor"].is_object()) {
        const auto& executor = data["executor"];
        ApplyString(config.executor.type, executor, "type");
        ApplyString(config.executor.root_dir, executor, "rootDir");
        if (executor.contains("onSlurm") && executor["onSlurm"].is_boolean()) {
            config.executor.on_slurm = executor["onSlurm"].get<bool>();
        }
        ApplyInt(config.executor.default_time_limit_s, executor, "defaultTimeLimitS");
        ApplyInt(config.executor.default_memory_limit_mb, executor, "defaultMemoryLimitMb");
        ApplyInt(config.executor.kill_grace_ms, executor, "killGraceMs");
    }

    if (data.contains("podman") && data["podman"].is_object()) {
        const auto& podman = data["podman"];
        ApplyString(config.podman.command, podman, "command");
        if (podman.contains("images")) {
            ApplyStringMap(config.podman.images, podman["images"]);
        }
        ApplyStringList(config.podman.extra_args, podman, "extraArgs");
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ApplyString(config.sandbox.command, sandbox, "command");
        ApplyStringList(config.sandbox.extra_args, sandbox, "extraArgs");
    }

    if (data.contains("interpreters")) {
        ApplyStringMap(config.interpreters, data["interpreters"]);
    }

    if (data.contains("runner") && data["runner"].is_object()) {
        ApplyInt(config.runner.max_workers, data["runner"], "maxWorkers");
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(config.logging.level, data["logging"], "level");
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto executor_type = GetEnvFallback("RUNBOX_EXECUTOR__TYPE", "RUNBOX_EXECUTOR_TYPE");
    if (!executor_type.empty()) {
        config.executor.type = executor_type;
    }

    const auto root_dir = GetEnvFallback("RUNBOX_EXECUTOR__ROOT_DIR", "RUNBOX_EXECUTOR_ROOT_DIR");
    if (!root_dir.empty()) {
        config.executor.root_dir = root_dir;
    }

    const auto on_slurm = GetEnvFallback("RUNBOX_EXECUTOR__ON_SLURM", "RUNBOX_EXECUTOR_ON_SLURM");
    if (!on_slurm.empty()) {
        config.executor.on_slurm = ParseBool(on_slurm);
    }

    const auto time_limit = GetEnvFallback(
        "RUNBOX_EXECUTOR__DEFAULT_TIME_LIMIT_S",
        "RUNBOX_EXECUTOR_DEFAULT_TIME_LIMIT_S");
    if (!time_limit.empty()) {
        config.executor.default_time_limit_s = ParseInt(time_limit, config.executor.default_time_limit_s);
    }

    const auto memory_limit = GetEnvFallback(
        "RUNBOX_EXECUTOR__DEFAULT_MEMORY_LIMIT_MB",
        "RUNBOX_EXECUTOR_DEFAULT_MEMORY_LIMIT_MB");
    if (!memory_limit.empty()) {
        config.executor.default_memory_limit_mb = ParseInt(memory_limit, config.executor.default_memory_limit_mb);
    }

    const auto podman_command = GetEnvFallback("RUNBOX_PODMAN__COMMAND", "RUNBOX_PODMAN_COMMAND");
    if (!podman_command.empty()) {
        config.podman.command = podman_command;
    }

    const auto sandbox_command = GetEnvFallback("RUNBOX_SANDBOX__COMMAND", "RUNBOX_SANDBOX_COMMAND");
    if (!sandbox_command.empty()) {
        config.sandbox.command = sandbox_command;
    }

    const auto sandbox_args = GetEnvFallback("RUNBOX_SANDBOX__EXTRA_ARGS", "RUNBOX_SANDBOX_EXTRA_ARGS");
    if (!sandbox_args.empty()) {
        config.sandbox.extra_args = SplitCsv(sandbox_args);
    }

    const auto max_workers = GetEnvFallback("RUNBOX_RUNNER__MAX_WORKERS", "RUNBOX_RUNNER_MAX_WORKERS");
    if (!max_workers.empty()) {
        config.runner.max_workers = ParseInt(max_workers, config.runner.max_workers);
    }

    const auto log_level = GetEnvFallback("RUNBOX_LOGGING__LEVEL", "RUNBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            utils::LogWarn("config", "keeping defaults, cannot access config",
                           {{"path", path.string()}, {"error", ec.message()}});
        }
        return config;
    }
    try {
        std::ifstream input(path);
        nlohmann::json data;
        input >> data;
        ApplyConfigFromJson(config, data);
    } catch (const nlohmann::json::exception& ex) {
        utils::LogWarn("config", "keeping defaults, failed to parse config",
                       {{"path", path.string()}, {"error", ex.what()}});
    }
    return config;
}

Config LoadConfig() {
    auto config = LoadConfigFromFile(GetConfigPath());
    ApplyEnvOverrides(config);
    return config;
}

std::filesystem::path ResolveRootDir(const Config& config) {
    if (config.executor.on_slurm) {
        return "/tmp";
    }
    return config.executor.root_dir;
}

nlohmann::json ConfigToJson(const Config& config) {
    return {
        {"executor", {
            {"type", config.executor.type},
            {"rootDir", config.executor.root_dir},
            {"onSlurm", config.executor.on_slurm},
            {"defaultTimeLimitS", config.executor.default_time_limit_s},
            {"defaultMemoryLimitMb", config.executor.default_memory_limit_mb},
            {"killGraceMs", config.executor.kill_grace_ms}
        }},
        {"podman", {
            {"command", config.podman.command},
            {"images", config.podman.images},
            {"extraArgs", config.podman.extra_args}
        }},
        {"sandbox", {
            {"command", config.sandbox.command},
            {"extraArgs", config.sandbox.extra_args}
        }},
        {"interpreters", config.interpreters},
        {"runner", {{"maxWorkers", config.runner.max_workers}}},
        {"logging", {{"level", config.logging.level}}}
    };
}

}  // namespace runbox::config
