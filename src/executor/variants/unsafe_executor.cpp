#include "executor/variants/unsafe_executor.hpp"

#include <utility>

#include "executor/process_runner.hpp"
#include "executor/variants/run_script.hpp"

namespace runbox::executor::variants {
namespace {

// timeout(1) in the wrapper fires first; this only catches a wedged wrapper.
constexpr auto kDeadlineSlack = std::chrono::seconds(2);

}  // namespace

UnsafeExecutor::UnsafeExecutor(std::filesystem::path root_dir, const config::Config& config)
    : Executor(std::move(root_dir))
    , defaults_(config.executor)
    , interpreters_(config.interpreters) {}

FilesystemMapping UnsafeExecutor::Stage(const job::Program& program,
                                        const job::ComputeContext& context) const {
    const auto limits = ResolveLimits(context, defaults_);
    auto mapping = StageProgramFiles(program);
    mapping.push_back({
        kRunScriptPath,
        BuildRunScript(InterpreterFor(context, interpreters_), program.Entrypoint(), limits.time_limit_s),
        true
    });
    return mapping;
}

RawResult UnsafeExecutor::ExecuteRaw(const std::string& run_id,
                                     const job::Program& program,
                                     const std::filesystem::path& cwd,
                                     const job::ComputeContext& context,
                                     const CancellationToken& cancel) {
    (void)run_id;
    (void)program;
    const auto limits = ResolveLimits(context, defaults_);
    const auto workdir = std::filesystem::absolute(cwd);

    ProcessOptions options{};
    options.argv = {(workdir / kRunScriptPath).string()};
    options.working_dir = workdir;
    options.timeout = std::chrono::seconds(limits.time_limit_s) + kDeadlineSlack;
    options.kill_grace = std::chrono::milliseconds(defaults_.kill_grace_ms);

    auto process = ProcessRunner::Run(options, &cancel);
    return {process.exit_code, std::move(process.output), std::move(process.error)};
}

}  // namespace runbox::executor::variants
