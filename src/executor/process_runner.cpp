#include "executor/process_runner.hpp"

#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#else
#include <boost/process.hpp>
#endif
#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::executor {
#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);
constexpr int kTimeoutExitCode = 124;

// Removes the stdout/stderr capture files on every exit path.
struct CaptureFiles {
    std::filesystem::path stdout_path;
    std::filesystem::path stderr_path;

    CaptureFiles() {
        const auto stamp = utils::GenerateUuid();
        const auto dir = std::filesystem::temp_directory_path();
        stdout_path = dir / ("runbox_stdout_" + stamp + ".log");
        stderr_path = dir / ("runbox_stderr_" + stamp + ".log");
    }

    ~CaptureFiles() {
        std::error_code ec;
        std::filesystem::remove(stdout_path, ec);
        std::filesystem::remove(stderr_path, ec);
    }

    CaptureFiles(const CaptureFiles&) = delete;
    CaptureFiles& operator=(const CaptureFiles&) = delete;
};

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        throw ExecutionError("Cannot read captured output " + path.string());
    }
    std::ostringstream target;
    target << input.rdbuf();
    return target.str();
}

std::string ResolveExecutable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return name;
    }
    const auto resolved = bp::search_path(name);
    if (resolved.empty()) {
        throw ExecutionError("Executable not found on PATH: " + name);
    }
    return resolved.string();
}

// Returns true once pid has been reaped into status.
bool PollExit(pid_t pid, int& status) {
    const auto waited = ::waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
        return true;
    }
    if (waited < 0) {
        throw ExecutionError(std::string("waitpid failed: ") + std::strerror(errno));
    }
    return false;
}

void KillGroup(pid_t group, int signal) {
    if (group > 0) {
        ::kill(-group, signal);
    }
}

}  // namespace

ProcessResult ProcessRunner::Run(const ProcessOptions& options, const CancellationToken* cancel) {
    if (options.argv.empty()) {
        throw ExecutionError("Empty command line");
    }
    ProcessResult result{};
    const auto executable = ResolveExecutable(options.argv.front());
    const std::vector<std::string> args(options.argv.begin() + 1, options.argv.end());
    CaptureFiles capture;

    bp::group group;
    std::unique_ptr<bp::child> child_process;
    try {
        child_process = std::make_unique<bp::child>(
            bp::exe = executable,
            bp::args = args,
            bp::start_dir = options.working_dir.string(),
            bp::std_in.close(),
            bp::std_out > capture.stdout_path.string(),
            bp::std_err > capture.stderr_path.string(),
            group);
    } catch (const bp::process_error& ex) {
        throw ExecutionError(std::string("exec failed: ") + ex.what());
    }

    const pid_t pid = child_process->id();
    const pid_t pgid = group.native_handle();
    utils::LogDebug("process", "started", {{"pid", std::to_string(pid)}, {"exe", executable}});

    const auto has_deadline = options.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    bool finished = false;
    int status = 0;
    while (!finished) {
        finished = PollExit(pid, status);
        if (finished) {
            break;
        }
        if (cancel && cancel->IsCancelled()) {
            KillGroup(pgid, SIGKILL);
            ::waitpid(pid, &status, 0);
            utils::LogDebug("process", "killed on cancel", {{"pid", std::to_string(pid)}});
            throw CancelledError();
        }
        if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    if (!finished) {
        result.timed_out = true;
        KillGroup(pgid, SIGTERM);
        const auto grace_deadline = std::chrono::steady_clock::now() + options.kill_grace;
        while (std::chrono::steady_clock::now() < grace_deadline) {
            if (PollExit(pid, status)) {
                finished = true;
                break;
            }
            std::this_thread::sleep_for(kPollInterval);
        }
        if (!finished) {
            KillGroup(pgid, SIGKILL);
            ::waitpid(pid, &status, 0);
        }
        result.exit_code = kTimeoutExitCode;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    result.output = ReadFile(capture.stdout_path);
    result.error = ReadFile(capture.stderr_path);
    return result;
}

}  // namespace runbox::executor
