#include "executor/variants/sandbox_executor.hpp"

#include <utility>

#include "executor/process_runner.hpp"
#include "executor/variants/run_script.hpp"

namespace runbox::executor::variants {
namespace {

constexpr auto kDeadlineSlack = std::chrono::seconds(5);

}  // namespace

SandboxExecutor::SandboxExecutor(std::filesystem::path root_dir, const config::Config& config)
    : Executor(std::move(root_dir))
    , defaults_(config.executor)
    , sandbox_(config.sandbox)
    , interpreters_(config.interpreters) {}

FilesystemMapping SandboxExecutor::Stage(const job::Program& program,
                                         const job::ComputeContext& context) const {
    const auto limits = ResolveLimits(context, defaults_);
    auto mapping = StageProgramFiles(program);
    mapping.push_back({
        kRunScriptPath,
        BuildRunScript(InterpreterFor(context, interpreters_),
                       program.Entrypoint(),
                       limits.time_limit_s,
                       {"ulimit -c 0"}),  // no core dumps inside the jail
        true
    });
    return mapping;
}

std::vector<std::string> SandboxExecutor::BuildCommand(const std::filesystem::path& cwd,
                                                       const job::ComputeContext& context) const {
    const auto limits = ResolveLimits(context, defaults_);
    const auto workdir = std::filesystem::absolute(cwd).string();
    const auto memory_bytes = static_cast<long long>(limits.memory_limit_mb) * 1024 * 1024;
    const auto jail_time_limit = std::chrono::seconds(limits.time_limit_s) + kDeadlineSlack;

    std::vector<std::string> argv = {
        sandbox_.command,
        "--mode", "o",
        "--really_quiet",
        "--chroot", "/",
        "--bindmount", workdir + ":" + workdir,
        "--cwd", workdir,
        "--time_limit", std::to_string(jail_time_limit.count()),
        "--cgroup_mem_max", std::to_string(memory_bytes)
    };
    argv.insert(argv.end(), sandbox_.extra_args.begin(), sandbox_.extra_args.end());
    argv.push_back("--");
    argv.push_back((std::filesystem::absolute(cwd) / kRunScriptPath).string());
    return argv;
}

RawResult SandboxExecutor::ExecuteRaw(const std::string& run_id,
                                      const job::Program& program,
                                      const std::filesystem::path& cwd,
                                      const job::ComputeContext& context,
                                      const CancellationToken& cancel) {
    (void)run_id;
    (void)program;
    const auto limits = ResolveLimits(context, defaults_);

    ProcessOptions options{};
    options.argv = BuildCommand(cwd, context);
    options.working_dir = std::filesystem::absolute(cwd);
    options.timeout = std::chrono::seconds(limits.time_limit_s) + 2 * kDeadlineSlack;
    options.kill_grace = std::chrono::milliseconds(defaults_.kill_grace_ms);

    auto process = ProcessRunner::Run(options, &cancel);
    return {process.exit_code, std::move(process.output), std::move(process.error)};
}

}  // namespace runbox::executor::variants
