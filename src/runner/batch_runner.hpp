#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "executor/executor.hpp"
#include "job/job_types.hpp"
#include "nlohmann/json.hpp"

namespace runbox::runner {

enum class BatchStatus {
    kSuccess,
    kFailed
};

const char* ToString(BatchStatus status);

struct BatchResult {
    std::string submission_id;
    BatchStatus status = BatchStatus::kSuccess;
    // Same order as BatchRequest::programs.
    std::vector<executor::ProgramResult> results;

    nlohmann::json ToJson() const;
};

// A batch aborted by at least one infrastructure failure. No results survive.
class BatchError : public std::runtime_error {
public:
    BatchError(std::string submission_id, std::vector<std::string> errors);

    const std::string& SubmissionId() const { return submission_id_; }
    const std::vector<std::string>& Errors() const { return errors_; }

    nlohmann::json ToJson() const;

private:
    std::string submission_id_;
    std::vector<std::string> errors_;
};

class BatchRunner {
public:
    // max_workers == 0 gives every program its own thread.
    explicit BatchRunner(executor::Executor& executor, std::size_t max_workers = 0);

    // Runs every program once, concurrently. Either returns a complete,
    // input-ordered result or throws BatchError after cancelling the
    // remaining programs. Setting abort cancels the whole batch.
    BatchResult Run(const job::BatchRequest& request,
                    const executor::CancellationToken* abort = nullptr);

private:
    executor::Executor& executor_;
    std::size_t max_workers_;
};

}  // namespace runbox::runner
