#pragma once

#include <memory>

#include "config/config_schema.hpp"
#include "executor/executor.hpp"

namespace runbox::executor {

// Throws job::ConfigError for an unknown executor.type.
std::unique_ptr<Executor> CreateExecutor(const config::Config& config);

}  // namespace runbox::executor
