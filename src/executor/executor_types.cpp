#include "executor/executor_types.hpp"

#include <algorithm>
#include <cctype>

namespace runbox::executor {
namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

}  // namespace

const char* ToString(Status status) {
    switch (status) {
        case Status::kOk: return "OK";
        case Status::kMemoryLimitExceeded: return "MLE";
        case Status::kTimeLimitExceeded: return "TLE";
        case Status::kRuntimeError: return "RTE";
        case Status::kWrongAnswer: return "WA";
    }
    return "OK";
}

std::optional<Status> StatusFromString(const std::string& value) {
    for (const auto status : {Status::kOk,
                              Status::kMemoryLimitExceeded,
                              Status::kTimeLimitExceeded,
                              Status::kRuntimeError,
                              Status::kWrongAnswer}) {
        if (value == ToString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

const char* ToString(ExecutorType type) {
    switch (type) {
        case ExecutorType::kPodman: return "podman";
        case ExecutorType::kUnsafe: return "unsafe";
        case ExecutorType::kSandbox: return "sandbox";
    }
    return "unsafe";
}

std::optional<ExecutorType> ExecutorTypeFromString(const std::string& value) {
    const auto lowered = ToLower(value);
    if (lowered == "podman") {
        return ExecutorType::kPodman;
    }
    if (lowered == "unsafe") {
        return ExecutorType::kUnsafe;
    }
    if (lowered == "sandbox") {
        return ExecutorType::kSandbox;
    }
    return std::nullopt;
}

nlohmann::json ProgramResult::ToJson() const {
    nlohmann::json json = tracking_fields.is_object() ? tracking_fields : nlohmann::json::object();
    json["status"] = ToString(status);
    json["stdout"] = std_out;
    json["stderr"] = std_err;
    return json;
}

}  // namespace runbox::executor
