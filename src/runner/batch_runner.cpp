#include "runner/batch_runner.hpp"

#include <chrono>
#include <optional>
#include <utility>

#include "runner/task_group.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::runner {
namespace {

std::string DescribeFailures(const std::string& submission_id, const std::vector<std::string>& errors) {
    return "Batch " + submission_id + " failed: " + utils::Join(errors, "; ");
}

}  // namespace

const char* ToString(BatchStatus status) {
    switch (status) {
        case BatchStatus::kSuccess: return "SUCCESS";
        case BatchStatus::kFailed: return "FAILED";
    }
    return "FAILED";
}

nlohmann::json BatchResult::ToJson() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& result : results) {
        items.push_back(result.ToJson());
    }
    return {
        {"submission_id", submission_id},
        {"status", ToString(status)},
        {"result", std::move(items)}
    };
}

BatchError::BatchError(std::string submission_id, std::vector<std::string> errors)
    : std::runtime_error(DescribeFailures(submission_id, errors))
    , submission_id_(std::move(submission_id))
    , errors_(std::move(errors)) {}

nlohmann::json BatchError::ToJson() const {
    return {
        {"submission_id", submission_id_},
        {"status", ToString(BatchStatus::kFailed)},
        {"error", what()},
        {"errors", errors_}
    };
}

BatchRunner::BatchRunner(executor::Executor& executor, std::size_t max_workers)
    : executor_(executor)
    , max_workers_(max_workers) {}

BatchResult BatchRunner::Run(const job::BatchRequest& request,
                             const executor::CancellationToken* abort) {
    const auto count = request.programs.size();
    const auto started = std::chrono::steady_clock::now();
    utils::LogInfo("batch", "start", {
        {"submission_id", request.submission_id},
        {"programs", std::to_string(count)}
    });

    std::vector<std::optional<executor::ProgramResult>> slots(count);
    TaskGroup group(max_workers_);
    group.LinkParent(abort);
    for (std::size_t index = 0; index < count; ++index) {
        group.Add([this, &request, &slots, index](const executor::CancellationToken& cancel) {
            slots[index] = executor_.Run(request.programs[index], request.environment, cancel);
        });
    }

    const auto failures = group.Wait();
    if (!failures.empty()) {
        std::vector<std::string> errors;
        errors.reserve(failures.size());
        for (const auto& failure : failures) {
            errors.push_back("program[" + std::to_string(failure.index) + "]: " + failure.message);
        }
        utils::LogError("batch", "failed", {
            {"submission_id", request.submission_id},
            {"failures", std::to_string(errors.size())}
        });
        throw BatchError(request.submission_id, std::move(errors));
    }

    BatchResult batch{};
    batch.submission_id = request.submission_id;
    batch.status = BatchStatus::kSuccess;
    batch.results.reserve(count);
    for (auto& slot : slots) {
        if (!slot) {
            // skipped or killed by an external abort
            utils::LogWarn("batch", "aborted", {{"submission_id", request.submission_id}});
            throw BatchError(request.submission_id, {"batch aborted"});
        }
        batch.results.push_back(std::move(*slot));
    }
    utils::LogInfo("batch", "done", {
        {"submission_id", request.submission_id},
        {"elapsed_ms", std::to_string(utils::ElapsedMs(started))}
    });
    return batch;
}

}  // namespace runbox::runner
