#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "executor/executor_types.hpp"

namespace runbox::executor {

struct ProcessOptions {
    // argv[0] is looked up on PATH unless it contains a slash.
    std::vector<std::string> argv;
    std::filesystem::path working_dir;
    // Zero disables the deadline.
    std::chrono::milliseconds timeout{0};
    // Time between SIGTERM and SIGKILL once the deadline passes.
    std::chrono::milliseconds kill_grace{2000};
};

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string output;
    std::string error;
};

class ProcessRunner {
public:
    // Runs argv in its own process group and waits for it. A process killed
    // by signal N reports 128 + N; a deadline kill reports 124.
    // Throws ExecutionError when the process cannot be launched and
    // CancelledError after killing it on cancel.
    static ProcessResult Run(const ProcessOptions& options,
                             const CancellationToken* cancel = nullptr);
};

}  // namespace runbox::executor
