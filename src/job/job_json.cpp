#include "job/job_json.hpp"

#include <cstdint>
#include <limits>
#include <utility>

namespace runbox::job {
namespace {

const nlohmann::json& Require(const nlohmann::json& data, const char* key, const std::string& where) {
    if (!data.is_object() || !data.contains(key)) {
        throw ConfigError(where + ": missing '" + key + "'");
    }
    return data[key];
}

std::string RequireString(const nlohmann::json& data, const char* key, const std::string& where) {
    const auto& value = Require(data, key, where);
    if (!value.is_string()) {
        throw ConfigError(where + ": '" + key + "' must be a string");
    }
    return value.get<std::string>();
}

// Absent or null gives 0. Values that do not fit an int are rejected.
int OptionalInt(const nlohmann::json& data, const char* key, const std::string& where) {
    if (!data.contains(key) || data[key].is_null()) {
        return 0;
    }
    const auto& value = data[key];
    constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    bool in_range = false;
    if (value.is_number_unsigned()) {
        in_range = value.get<std::uint64_t>() <= kMax;
    } else if (value.is_number_integer()) {
        const auto number = value.get<std::int64_t>();
        in_range = number >= 0 && static_cast<std::uint64_t>(number) <= kMax;
    }
    if (!in_range) {
        throw ConfigError(where + ": '" + key + "' must be an integer between 0 and " +
                          std::to_string(kMax));
    }
    return static_cast<int>(value.get<std::int64_t>());
}

std::string OptionalString(const nlohmann::json& data, const char* key, const std::string& where) {
    if (!data.contains(key) || data[key].is_null()) {
        return {};
    }
    if (!data[key].is_string()) {
        throw ConfigError(where + ": '" + key + "' must be a string");
    }
    return data[key].get<std::string>();
}

}  // namespace

File ParseFile(const nlohmann::json& data) {
    File file{};
    file.file_name = RequireString(data, "file_name", "file");
    file.content = RequireString(data, "content", "file " + file.file_name);
    return file;
}

ComputeContext ParseComputeContext(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw ConfigError("environment must be an object");
    }
    ComputeContext context{};
    context.language = RequireString(data, "language", "environment");
    context.version = OptionalString(data, "version", "environment");
    context.time_limit_secs = OptionalInt(data, "time_limit_secs", "environment");
    context.memory_limit_mb = OptionalInt(data, "memory_limit_mb", "environment");
    if (data.contains("extra_options") && !data["extra_options"].is_null()) {
        if (!data["extra_options"].is_object()) {
            throw ConfigError("environment: 'extra_options' must be an object");
        }
        for (const auto& [key, value] : data["extra_options"].items()) {
            context.extra_options[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }
    // older requests carry the version only inside extra_options
    if (context.version.empty()) {
        const auto it = context.extra_options.find("version");
        if (it != context.extra_options.end()) {
            context.version = it->second;
        }
    }
    return context;
}

Program ParseProgram(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw ConfigError("program must be an object");
    }
    auto entrypoint = RequireString(data, "entrypoint", "program");
    const auto& files_json = Require(data, "files", "program");
    if (!files_json.is_array()) {
        throw ConfigError("program: 'files' must be an array");
    }
    std::vector<File> files;
    files.reserve(files_json.size());
    for (const auto& item : files_json) {
        files.push_back(ParseFile(item));
    }
    auto tracking = data;
    tracking.erase("entrypoint");
    tracking.erase("files");
    return Program(std::move(entrypoint), std::move(files), std::move(tracking));
}

BatchRequest ParseBatchRequest(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw ConfigError("request must be an object");
    }
    BatchRequest request{};
    request.submission_id = RequireString(data, "submission_id", "request");
    request.environment = ParseComputeContext(Require(data, "environment", "request"));
    const auto& programs = Require(data, "programs", "request");
    if (!programs.is_array()) {
        throw ConfigError("request: 'programs' must be an array");
    }
    request.programs.reserve(programs.size());
    for (std::size_t i = 0; i < programs.size(); ++i) {
        try {
            request.programs.push_back(ParseProgram(programs[i]));
        } catch (const ConfigError& ex) {
            throw ConfigError("programs[" + std::to_string(i) + "]: " + ex.what());
        }
    }
    return request;
}

BatchRequest ParseBatchRequest(const std::string& text) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        throw ConfigError(std::string("request is not valid JSON: ") + ex.what());
    }
    return ParseBatchRequest(data);
}

nlohmann::json ComputeContextToJson(const ComputeContext& context) {
    nlohmann::json json = {
        {"language", context.language},
        {"time_limit_secs", context.time_limit_secs},
        {"memory_limit_mb", context.memory_limit_mb},
        {"extra_options", context.extra_options}
    };
    if (!context.version.empty()) {
        json["version"] = context.version;
    }
    return json;
}

}  // namespace runbox::job
