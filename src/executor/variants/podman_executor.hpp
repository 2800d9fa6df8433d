#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"
#include "executor/executor.hpp"

namespace runbox::executor::variants {

// Runs each program in a throwaway container with the working directory
// mounted at /workspace, networking disabled and a hard memory cap.
class PodmanExecutor : public Executor {
public:
    PodmanExecutor(std::filesystem::path root_dir, const config::Config& config);

    ExecutorType Type() const override { return ExecutorType::kPodman; }
    FilesystemMapping Stage(const job::Program& program,
                            const job::ComputeContext& context) const override;

    // Image configured for the language; a context version replaces the tag.
    std::string ImageFor(const job::ComputeContext& context) const;

    // Where podman records the container id once the container exists.
    static std::filesystem::path CidFilePath(const std::string& run_id);

    std::vector<std::string> BuildCommand(const std::string& run_id,
                                          const std::filesystem::path& cwd,
                                          const job::ComputeContext& context) const;

protected:
    RawResult ExecuteRaw(const std::string& run_id,
                         const job::Program& program,
                         const std::filesystem::path& cwd,
                         const job::ComputeContext& context,
                         const CancellationToken& cancel) override;

private:
    void RemoveContainer(const std::string& container_name) const;

    config::ExecutorConfig defaults_;
    config::PodmanConfig podman_;
    std::unordered_map<std::string, std::string> interpreters_;
};

}  // namespace runbox::executor::variants
