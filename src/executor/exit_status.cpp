#include "executor/exit_status.hpp"

namespace runbox::executor {

Status ClassifyExitCode(int exit_code) {
    switch (exit_code) {
        case 137:
            return Status::kMemoryLimitExceeded;
        case 124:
            return Status::kTimeLimitExceeded;
        case 1:
            return Status::kRuntimeError;
        default:
            return Status::kOk;
    }
}

}  // namespace runbox::executor
