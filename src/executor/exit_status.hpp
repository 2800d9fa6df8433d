#pragma once

#include "executor/executor_types.hpp"

namespace runbox::executor {

// 137 (SIGKILL from the OOM killer) -> MLE, 124 (timeout) -> TLE,
// 1 -> RTE, anything else -> OK. New termination kinds get a row here.
Status ClassifyExitCode(int exit_code);

}  // namespace runbox::executor
