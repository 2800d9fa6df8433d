#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"
#include "job/job_types.hpp"

namespace runbox::executor::variants {

// Wrapper location inside the working directory. Program files never land
// under .runbox/ since a clashing name is rejected at staging.
constexpr const char* kRunScriptPath = ".runbox/run.sh";

struct Limits {
    int time_limit_s = 0;
    int memory_limit_mb = 0;
};

// Context limits, falling back to the executor defaults for zero values.
Limits ResolveLimits(const job::ComputeContext& context, const config::ExecutorConfig& defaults);

// Throws job::ConfigError when the language has no configured interpreter.
std::string InterpreterFor(const job::ComputeContext& context,
                           const std::unordered_map<std::string, std::string>& interpreters);

std::string NormalizeLanguage(const std::string& language);

std::string ShellQuote(const std::string& value);

// "#!/bin/sh", a cd to the working directory, the preamble lines, then exec of the interpreter on the
// entrypoint, wrapped in timeout(1) when time_limit_s is positive.
std::string BuildRunScript(const std::string& interpreter,
                           const std::string& entrypoint,
                           int time_limit_s,
                           const std::vector<std::string>& preamble = {});

}  // namespace runbox::executor::variants
