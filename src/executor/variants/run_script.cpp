#include "executor/variants/run_script.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace runbox::executor::variants {

Limits ResolveLimits(const job::ComputeContext& context, const config::ExecutorConfig& defaults) {
    Limits limits{};
    limits.time_limit_s = context.time_limit_secs > 0 ? context.time_limit_secs : defaults.default_time_limit_s;
    limits.memory_limit_mb = context.memory_limit_mb > 0 ? context.memory_limit_mb : defaults.default_memory_limit_mb;
    return limits;
}

std::string NormalizeLanguage(const std::string& language) {
    std::string lowered = language;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

std::string InterpreterFor(const job::ComputeContext& context,
                           const std::unordered_map<std::string, std::string>& interpreters) {
    const auto it = interpreters.find(NormalizeLanguage(context.language));
    if (it == interpreters.end() || it->second.empty()) {
        throw job::ConfigError("Unsupported language '" + context.language + "'");
    }
    return it->second;
}

std::string ShellQuote(const std::string& value) {
    std::string quoted = "'";
    for (const char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

std::string BuildRunScript(const std::string& interpreter,
                           const std::string& entrypoint,
                           int time_limit_s,
                           const std::vector<std::string>& preamble) {
    std::ostringstream script;
    script << "#!/bin/sh\n";
    script << "cd \"$(dirname \"$0\")/..\"\n";
    for (const auto& line : preamble) {
        script << line << "\n";
    }
    script << "exec ";
    if (time_limit_s > 0) {
        script << "timeout " << time_limit_s << " ";
    }
    script << interpreter << " " << ShellQuote(entrypoint) << "\n";
    return script.str();
}

}  // namespace runbox::executor::variants
