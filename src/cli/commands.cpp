#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>

#include "config/config_loader.hpp"
#include "executor/executor_factory.hpp"
#include "job/job_json.hpp"
#include "runner/batch_runner.hpp"
#include "utils/logging.hpp"
#include "nlohmann/json.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitBatchFailed = 1;
constexpr int kExitBadInput = 2;

runbox::executor::CancellationToken g_abort;

void HandleSignal(int signal) {
    (void)signal;
    g_abort.Cancel();
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGHUP, &action, nullptr);
}

void PrintUsage() {
    std::cout << "Usage: runbox run [FILE|-] | runbox validate [FILE|-] | runbox config" << std::endl;
}

bool ReadInput(const std::string& source, std::string& text) {
    if (source == "-") {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream input(source);
    if (!input.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    text = buffer.str();
    return true;
}

bool LoadRequest(const std::string& source, runbox::job::BatchRequest& request) {
    std::string text;
    if (!ReadInput(source, text)) {
        std::cerr << "[cli] cannot read " << source << std::endl;
        return false;
    }
    try {
        request = runbox::job::ParseBatchRequest(text);
    } catch (const runbox::job::ConfigError& ex) {
        std::cerr << "[cli] invalid request: " << ex.what() << std::endl;
        return false;
    }
    return true;
}

int RunBatch(const runbox::config::Config& config, const std::string& source) {
    runbox::job::BatchRequest request;
    if (!LoadRequest(source, request)) {
        return kExitBadInput;
    }

    std::unique_ptr<runbox::executor::Executor> executor;
    try {
        executor = runbox::executor::CreateExecutor(config);
    } catch (const runbox::job::ConfigError& ex) {
        std::cerr << "[cli] " << ex.what() << std::endl;
        return kExitBadInput;
    }

    InstallSignalHandlers();
    const auto max_workers = config.runner.max_workers > 0
        ? static_cast<std::size_t>(config.runner.max_workers)
        : std::size_t{0};
    runbox::runner::BatchRunner runner(*executor, max_workers);
    try {
        const auto result = runner.Run(request, &g_abort);
        std::cout << result.ToJson().dump(2) << std::endl;
        return kExitOk;
    } catch (const runbox::runner::BatchError& ex) {
        std::cout << ex.ToJson().dump(2) << std::endl;
        return kExitBatchFailed;
    } catch (const std::system_error& ex) {
        std::cerr << "[cli] cannot start workers: " << ex.what() << std::endl;
        return kExitBatchFailed;
    }
}

int ValidateRequest(const std::string& source) {
    runbox::job::BatchRequest request;
    if (!LoadRequest(source, request)) {
        return kExitBadInput;
    }
    nlohmann::json summary = {
        {"submission_id", request.submission_id},
        {"environment", runbox::job::ComputeContextToJson(request.environment)},
        {"programs", request.programs.size()}
    };
    std::cout << summary.dump(2) << std::endl;
    return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
    const auto config = runbox::config::LoadConfig();
    runbox::utils::LogConfig log_config{};
    log_config.min_level = runbox::utils::ParseLogLevel(config.logging.level);
    runbox::utils::SetLogConfig(log_config);

    if (argc < 2) {
        PrintUsage();
        return kExitBadInput;
    }
    const std::string command = argv[1];
    const std::string source = argc >= 3 ? argv[2] : "-";

    if (command == "run") {
        return RunBatch(config, source);
    }
    if (command == "validate") {
        return ValidateRequest(source);
    }
    if (command == "config") {
        std::cout << runbox::config::ConfigToJson(config).dump(2) << std::endl;
        return kExitOk;
    }
    PrintUsage();
    return kExitBadInput;
}
