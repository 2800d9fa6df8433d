#include "executor/variants/podman_executor.hpp"

#include <system_error>
#include <utility>

#include "executor/process_runner.hpp"
#include "executor/variants/run_script.hpp"
#include "utils/logging.hpp"

namespace runbox::executor::variants {
namespace {

constexpr const char* kContainerWorkdir = "/workspace";
// Image pulls and container start-up are not charged to the program.
constexpr auto kStartupSlack = std::chrono::seconds(30);
// podman run exits 125 when podman itself failed, but a container may exit
// 125 too. The cidfile tells the two apart: podman writes it on creation.
constexpr int kPodmanErrorExit = 125;

std::string ContainerName(const std::string& run_id) {
    return "runbox-" + run_id;
}

// Removes the cidfile on every exit path.
struct CidFile {
    std::filesystem::path path;

    explicit CidFile(std::filesystem::path file) : path(std::move(file)) {}

    ~CidFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    CidFile(const CidFile&) = delete;
    CidFile& operator=(const CidFile&) = delete;

    bool Written() const {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        return !ec && size > 0;
    }
};

}  // namespace

PodmanExecutor::PodmanExecutor(std::filesystem::path root_dir, const config::Config& config)
    : Executor(std::move(root_dir))
    , defaults_(config.executor)
    , podman_(config.podman)
    , interpreters_(config.interpreters) {}

FilesystemMapping PodmanExecutor::Stage(const job::Program& program,
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

std::string PodmanExecutor::ImageFor(const job::ComputeContext& context) const {
    const auto it = podman_.images.find(NormalizeLanguage(context.language));
    if (it == podman_.images.end() || it->second.empty()) {
        throw job::ConfigError("No container image configured for language '" + context.language + "'");
    }
    auto image = it->second;
    if (context.version.empty()) {
        return image;
    }
    const auto slash = image.find_last_of('/');
    const auto colon = image.find_last_of(':');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        image.erase(colon);
    }
    return image + ":" + context.version;
}

std::vector<std::string> PodmanExecutor::BuildCommand(const std::string& run_id,
                                                      const std::filesystem::path& cwd,
                                                      const job::ComputeContext& context) const {
    const auto limits = ResolveLimits(context, defaults_);
    const auto memory = std::to_string(limits.memory_limit_mb) + "m";
    const auto workdir = std::filesystem::absolute(cwd).string();

    std::vector<std::string> argv = {
        podman_.command,
        "run",
        "--rm",
        "--name", ContainerName(run_id),
        "--cidfile", CidFilePath(run_id).string(),
        "--network", "none",
        "--memory", memory,
        "--memory-swap", memory,
        "--volume", workdir + ":" + kContainerWorkdir + ":Z",
        "--workdir", kContainerWorkdir
    };
    argv.insert(argv.end(), podman_.extra_args.begin(), podman_.extra_args.end());
    argv.push_back(ImageFor(context));
    argv.push_back(std::string("./") + kRunScriptPath);
    return argv;
}

RawResult PodmanExecutor::ExecuteRaw(const std::string& run_id,
                                     const job::Program& program,
                                     const std::filesystem::path& cwd,
                                     const job::ComputeContext& context,
                                     const CancellationToken& cancel) {
    (void)program;
    const auto limits = ResolveLimits(context, defaults_);

    ProcessOptions options{};
    options.argv = BuildCommand(run_id, cwd, context);
    options.working_dir = std::filesystem::absolute(cwd);
    options.timeout = std::chrono::seconds(limits.time_limit_s) + kStartupSlack;
    options.kill_grace = std::chrono::milliseconds(defaults_.kill_grace_ms);

    CidFile cid_file(CidFilePath(run_id));
    ProcessResult process{};
    try {
        process = ProcessRunner::Run(options, &cancel);
    } catch (const CancelledError&) {
        RemoveContainer(ContainerName(run_id));
        throw;
    }
    if (process.timed_out) {
        RemoveContainer(ContainerName(run_id));
    }
    if (process.exit_code == kPodmanErrorExit && !cid_file.Written()) {
        throw ExecutionError("podman failed to start container: " + process.error);
    }
    return {process.exit_code, std::move(process.output), std::move(process.error)};
}

std::filesystem::path PodmanExecutor::CidFilePath(const std::string& run_id) {
    return std::filesystem::temp_directory_path() / (ContainerName(run_id) + ".cid");
}

void PodmanExecutor::RemoveContainer(const std::string& container_name) const {
    ProcessOptions options{};
    options.argv = {podman_.command, "rm", "--force", "--ignore", container_name};
    options.working_dir = std::filesystem::current_path();
    options.timeout = std::chrono::seconds(30);
    try {
        const auto result = ProcessRunner::Run(options);
        if (result.exit_code != 0) {
            utils::LogWarn("podman", "container removal failed",
                           {{"container", container_name}, {"stderr", result.error}});
        }
    } catch (const ExecutionError& ex) {
        utils::LogWarn("podman", "container removal failed",
                       {{"container", container_name}, {"error", ex.what()}});
    }
}

}  // namespace runbox::executor::variants
