#pragma once

#include <unordered_map>

#include "config/config_schema.hpp"
#include "executor/executor.hpp"

namespace runbox::executor::variants {

// Runs programs as plain child processes of the runner. Only the time
// limit is enforced; meant for trusted code and development machines.
class UnsafeExecutor : public Executor {
public:
    UnsafeExecutor(std::filesystem::path root_dir, const config::Config& config);

    ExecutorType Type() const override { return ExecutorType::kUnsafe; }
    FilesystemMapping Stage(const job::Program& program,
                            const job::ComputeContext& context) const override;

protected:
    RawResult ExecuteRaw(const std::string& run_id,
                         const job::Program& program,
                         const std::filesystem::path& cwd,
                         const job::ComputeContext& context,
                         const CancellationToken& cancel) override;

private:
    config::ExecutorConfig defaults_;
    std::unordered_map<std::string, std::string> interpreters_;
};

}  // namespace runbox::executor::variants
