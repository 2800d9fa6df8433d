#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"
#include "executor/executor.hpp"

namespace runbox::executor::variants {

// Runs programs under a namespace/cgroup jail (nsjail by default) with a
// read-only view of the host and the working directory bound read-write.
class SandboxExecutor : public Executor {
public:
    SandboxExecutor(std::filesystem::path root_dir, const config::Config& config);

    ExecutorType Type() const override { return ExecutorType::kSandbox; }
    FilesystemMapping Stage(const job::Program& program,
                            const job::ComputeContext& context) const override;

    std::vector<std::string> BuildCommand(const std::filesystem::path& cwd,
                                          const job::ComputeContext& context) const;

protected:
    RawResult ExecuteRaw(const std::string& run_id,
                         const job::Program& program,
                         const std::filesystem::path& cwd,
                         const job::ComputeContext& context,
                         const CancellationToken& cancel) override;

private:
    config::ExecutorConfig defaults_;
    config::SandboxConfig sandbox_;
    std::unordered_map<std::string, std::string> interpreters_;
};

}  // namespace runbox::executor::variants
