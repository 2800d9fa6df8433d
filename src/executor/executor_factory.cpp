#include "executor/executor_factory.hpp"

#include "config/config_loader.hpp"
#include "executor/variants/podman_executor.hpp"
#include "executor/variants/sandbox_executor.hpp"
#include "executor/variants/unsafe_executor.hpp"

namespace runbox::executor {

std::unique_ptr<Executor> CreateExecutor(const config::Config& config) {
    const auto type = ExecutorTypeFromString(config.executor.type);
    if (!type) {
        throw job::ConfigError("Unknown executor type '" + config.executor.type + "'");
    }
    const auto root_dir = config::ResolveRootDir(config);
    switch (*type) {
        case ExecutorType::kPodman:
            return std::make_unique<variants::PodmanExecutor>(root_dir, config);
        case ExecutorType::kUnsafe:
            return std::make_unique<variants::UnsafeExecutor>(root_dir, config);
        case ExecutorType::kSandbox:
            return std::make_unique<variants::SandboxExecutor>(root_dir, config);
    }
    throw job::ConfigError("Unknown executor type '" + config.executor.type + "'");
}

}  // namespace runbox::executor
