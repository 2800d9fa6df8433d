#pragma once

#include <atomic>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace runbox::executor {

enum class Status {
    kOk,
    kMemoryLimitExceeded,
    kTimeLimitExceeded,
    kRuntimeError,
    // Assigned by output comparison downstream, never by the executor.
    kWrongAnswer
};

// Wire names: OK, MLE, TLE, RTE, WA.
const char* ToString(Status status);
std::optional<Status> StatusFromString(const std::string& value);

enum class ExecutorType {
    kPodman,
    kUnsafe,
    kSandbox
};

const char* ToString(ExecutorType type);
std::optional<ExecutorType> ExecutorTypeFromString(const std::string& value);

// Backend or filesystem failure; never a status of the program itself.
class ExecutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised inside a run whose enclosing group was cancelled.
class CancelledError : public std::runtime_error {
public:
    CancelledError() : std::runtime_error("Execution cancelled") {}
};

class CancellationToken {
public:
    void Cancel() { cancelled_.store(true); }
    bool IsCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

struct RawResult {
    int exit_code = -1;
    std::string std_out;
    std::string std_err;
};

struct FilesystemEntry {
    std::string path;
    std::string content;
    bool executable = false;
};

using FilesystemMapping = std::vector<FilesystemEntry>;

struct ProgramResult {
    Status status = Status::kOk;
    std::string std_out;
    std::string std_err;
    // Caller tracking fields with the derived keys removed.
    nlohmann::json tracking_fields = nlohmann::json::object();

    // Tracking fields overlaid with status/stdout/stderr.
    nlohmann::json ToJson() const;
};

}  // namespace runbox::executor
