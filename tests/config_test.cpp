#include <cstdlib>
#include <fstream>

#include <gtest/gtest.h>

#include "config/config_loader.hpp"
#include "test_support.hpp"

namespace {

using runbox::config::ApplyConfigFromJson;
using runbox::config::ApplyEnvOverrides;
using runbox::config::Config;
using runbox::config::ConfigToJson;
using runbox::config::LoadConfigFromFile;
using runbox::config::ResolveRootDir;

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~ScopedEnv() { unsetenv(name_); }

private:
    const char* name_;
};

class ConfigTest : public runbox::testing::TempRootTest {
protected:
    std::filesystem::path WriteConfig(const std::string& text) {
        std::filesystem::create_directories(root_);
        const auto path = root_ / "config.json";
        std::ofstream(path) << text;
        return path;
    }
};

TEST_F(ConfigTest, DefaultsWhenFileIsMissing) {
    const auto config = LoadConfigFromFile(root_ / "absent.json");
    EXPECT_EQ(config.executor.type, "unsafe");
    EXPECT_EQ(config.executor.root_dir, "temp");
    EXPECT_FALSE(config.executor.on_slurm);
    EXPECT_EQ(config.executor.default_time_limit_s, 10);
    EXPECT_EQ(config.interpreters.at("python"), "python3");
}

TEST_F(ConfigTest, FileOverridesNamedKeysOnly) {
    const auto config = LoadConfigFromFile(WriteConfig(R"({
        "executor": {"type": "podman", "rootDir": "/srv/runs", "defaultTimeLimitS": 3},
        "podman": {"images": {"python": "registry.local/python"}, "extraArgs": ["--pids-limit", "32"]},
        "interpreters": {"node": "node"},
        "runner": {"maxWorkers": 4},
        "logging": {"level": "debug"}
    })"));
    EXPECT_EQ(config.executor.type, "podman");
    EXPECT_EQ(config.executor.root_dir, "/srv/runs");
    EXPECT_EQ(config.executor.default_time_limit_s, 3);
    EXPECT_EQ(config.executor.default_memory_limit_mb, 256);
    EXPECT_EQ(config.podman.images.at("python"), "registry.local/python");
    EXPECT_EQ(config.podman.images.at("sh"), "docker.io/library/alpine:3.19");
    ASSERT_EQ(config.podman.extra_args.size(), 2u);
    EXPECT_EQ(config.interpreters.at("node"), "node");
    EXPECT_EQ(config.interpreters.at("sh"), "/bin/sh");
    EXPECT_EQ(config.runner.max_workers, 4);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigTest, MalformedFileKeepsDefaults) {
    const auto config = LoadConfigFromFile(WriteConfig("{ not json"));
    EXPECT_EQ(config.executor.type, "unsafe");
}

TEST_F(ConfigTest, WrongValueTypesAreIgnored) {
    Config config{};
    ApplyConfigFromJson(config, {{"executor", {{"defaultTimeLimitS", "fast"}, {"onSlurm", "yes"}}}});
    EXPECT_EQ(config.executor.default_time_limit_s, 10);
    EXPECT_FALSE(config.executor.on_slurm);
}

TEST_F(ConfigTest, OutOfRangeIntegersKeepDefaults) {
    const auto config = LoadConfigFromFile(WriteConfig(R"({
        "executor": {"defaultTimeLimitS": 4294967297, "defaultMemoryLimitMb": -4294967296, "killGraceMs": 500}
    })"));
    EXPECT_EQ(config.executor.default_time_limit_s, 10);
    EXPECT_EQ(config.executor.default_memory_limit_mb, 256);
    EXPECT_EQ(config.executor.kill_grace_ms, 500);
}

TEST_F(ConfigTest, InaccessiblePathKeepsDefaults) {
    // stat fails with ENAMETOOLONG rather than "not found"
    const auto path = root_ / std::string(300, 'x') / "config.json";
    Config config{};
    EXPECT_NO_THROW(config = LoadConfigFromFile(path));
    EXPECT_EQ(config.executor.type, "unsafe");
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    ScopedEnv type("RUNBOX_EXECUTOR__TYPE", "sandbox");
    ScopedEnv slurm("RUNBOX_EXECUTOR__ON_SLURM", "true");
    ScopedEnv limit("RUNBOX_EXECUTOR__DEFAULT_MEMORY_LIMIT_MB", "512");
    ScopedEnv args("RUNBOX_SANDBOX__EXTRA_ARGS", "--rlimit_nproc,16");
    ScopedEnv workers("RUNBOX_RUNNER__MAX_WORKERS", "not-a-number");

    Config config{};
    config.runner.max_workers = 3;
    ApplyEnvOverrides(config);
    EXPECT_EQ(config.executor.type, "sandbox");
    EXPECT_TRUE(config.executor.on_slurm);
    EXPECT_EQ(config.executor.default_memory_limit_mb, 512);
    ASSERT_EQ(config.sandbox.extra_args.size(), 2u);
    EXPECT_EQ(config.sandbox.extra_args[0], "--rlimit_nproc");
    EXPECT_EQ(config.sandbox.extra_args[1], "16");
    EXPECT_EQ(config.runner.max_workers, 3);
}

TEST_F(ConfigTest, SlurmForcesNodeLocalRoot) {
    Config config{};
    config.executor.root_dir = "/shared/runs";
    EXPECT_EQ(ResolveRootDir(config), "/shared/runs");
    config.executor.on_slurm = true;
    EXPECT_EQ(ResolveRootDir(config), "/tmp");
}

TEST_F(ConfigTest, SerializedConfigLoadsBackUnchanged) {
    Config config{};
    config.executor.type = "podman";
    config.sandbox.extra_args = {"--quiet"};
    const auto json = ConfigToJson(config);
    EXPECT_EQ(json.at("executor").at("type"), "podman");

    Config reloaded{};
    ApplyConfigFromJson(reloaded, json);
    EXPECT_EQ(ConfigToJson(reloaded), json);
}

}  // namespace
