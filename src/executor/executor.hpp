#pragma once

#include <filesystem>
#include <string>

#include "executor/executor_types.hpp"
#include "job/job_types.hpp"

namespace runbox::executor {

// Shared staging / execution / classification pipeline. Backends only
// decide which files a run needs (Stage) and how to launch it (ExecuteRaw).
class Executor {
public:
    explicit Executor(std::filesystem::path root_dir);
    virtual ~Executor() = default;

    virtual ExecutorType Type() const = 0;

    // Files to write into a fresh working directory. Must be deterministic
    // and free of side effects.
    virtual FilesystemMapping Stage(const job::Program& program,
                                    const job::ComputeContext& context) const = 0;

    // Stages, runs and classifies one program. The working directory is
    // removed before this returns or throws. Throws ExecutionError on
    // backend failure and CancelledError once cancel is set.
    ProgramResult Run(const job::Program& program,
                      const job::ComputeContext& context,
                      const CancellationToken& cancel);

    ProgramResult Run(const job::Program& program, const job::ComputeContext& context);

    const std::filesystem::path& RootDir() const { return root_dir_; }

protected:
    // Launches the backend with cwd as the program's filesystem root and
    // returns the raw exit code and captured output.
    virtual RawResult ExecuteRaw(const std::string& run_id,
                                 const job::Program& program,
                                 const std::filesystem::path& cwd,
                                 const job::ComputeContext& context,
                                 const CancellationToken& cancel) = 0;

    // The program's own files, entrypoint marked executable.
    static FilesystemMapping StageProgramFiles(const job::Program& program);

private:
    // Throws job::ConfigError for escaping, duplicate or clashing paths.
    static void CheckMapping(const FilesystemMapping& mapping);
    static void Materialize(const std::filesystem::path& cwd, const FilesystemMapping& mapping);

    std::filesystem::path root_dir_;
};

}  // namespace runbox::executor
