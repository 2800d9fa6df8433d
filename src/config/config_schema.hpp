#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace runbox::config {

struct ExecutorConfig {
    std::string type = "unsafe";
    std::string root_dir = "temp";
    // Slurm nodes only guarantee /tmp to be node-local and writable.
    bool on_slurm = false;
    int default_time_limit_s = 10;
    int default_memory_limit_mb = 256;
    int kill_grace_ms = 2000;
};

struct PodmanConfig {
    std::string command = "podman";
    std::unordered_map<std::string, std::string> images = {
        {"python", "docker.io/library/python:3.11-slim"},
        {"sh", "docker.io/library/alpine:3.19"}
    };
    std::vector<std::string> extra_args;
};

struct SandboxConfig {
    std::string command = "nsjail";
    std::vector<std::string> extra_args;
};

struct RunnerConfig {
    // 0 runs every program of a batch on its own thread.
    int max_workers = 0;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    ExecutorConfig executor;
    PodmanConfig podman;
    SandboxConfig sandbox;
    std::unordered_map<std::string, std::string> interpreters = {
        {"python", "python3"},
        {"sh", "/bin/sh"}
    };
    RunnerConfig runner;
    LoggingConfig logging;
};

}  // namespace runbox::config
