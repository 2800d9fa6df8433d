#include "executor/executor.hpp"

#include <chrono>
#include <fstream>
#include <system_error>
#include <unordered_set>
#include <utility>

#include "executor/exit_status.hpp"
#include "executor/working_dir.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::executor {
namespace {

constexpr const char* kDerivedKeys[] = {"status", "stdout", "stderr"};

}  // namespace

Executor::Executor(std::filesystem::path root_dir)
    : root_dir_(std::move(root_dir)) {}

ProgramResult Executor::Run(const job::Program& program, const job::ComputeContext& context) {
    CancellationToken never_cancelled;
    return Run(program, context, never_cancelled);
}

ProgramResult Executor::Run(const job::Program& program,
                            const job::ComputeContext& context,
                            const CancellationToken& cancel) {
    if (cancel.IsCancelled()) {
        throw CancelledError();
    }
    const auto run_id = utils::GenerateUuid();
    const auto started = std::chrono::steady_clock::now();

    RawResult raw{};
    {
        WorkingDirLease lease(root_dir_, run_id);
        Materialize(lease.Path(), Stage(program, context));
        raw = ExecuteRaw(run_id, program, lease.Path(), context, cancel);
    }

    ProgramResult result{};
    result.status = ClassifyExitCode(raw.exit_code);
    result.std_out = std::move(raw.std_out);
    result.std_err = std::move(raw.std_err);
    result.tracking_fields = program.TrackingFields();
    for (const auto* key : kDerivedKeys) {
        if (result.tracking_fields.erase(key) > 0) {
            utils::LogWarn("executor", "tracking field overwritten by derived field",
                           {{"run_id", run_id}, {"key", key}});
        }
    }

    utils::LogInfo("executor", "run finished", {
        {"run_id", run_id},
        {"backend", ToString(Type())},
        {"exit_code", std::to_string(raw.exit_code)},
        {"status", ToString(result.status)},
        {"elapsed_ms", std::to_string(utils::ElapsedMs(started))}
    });
    return result;
}

FilesystemMapping Executor::StageProgramFiles(const job::Program& program) {
    FilesystemMapping mapping;
    mapping.reserve(program.Files().size() + 1);
    for (const auto& file : program.Files()) {
        mapping.push_back({file.file_name, file.content, file.file_name == program.Entrypoint()});
    }
    return mapping;
}

void Executor::CheckMapping(const FilesystemMapping& mapping) {
    std::unordered_set<std::string> files;
    for (const auto& entry : mapping) {
        if (!job::IsContainedRelativePath(entry.path)) {
            throw job::ConfigError("Refusing to stage path outside working directory: " + entry.path);
        }
        const auto normalized = std::filesystem::path(entry.path).lexically_normal().string();
        if (!files.insert(normalized).second) {
            throw job::ConfigError("Path staged twice: " + entry.path);
        }
    }
    for (const auto& file : files) {
        for (auto dir = std::filesystem::path(file).parent_path(); !dir.empty(); dir = dir.parent_path()) {
            if (files.count(dir.string()) > 0) {
                throw job::ConfigError("File " + dir.string() + " is also the parent directory of " + file);
            }
        }
    }
}

void Executor::Materialize(const std::filesystem::path& cwd, const FilesystemMapping& mapping) {
    CheckMapping(mapping);
    for (const auto& entry : mapping) {
        const auto file_path = cwd / entry.path;
        std::error_code ec;
        std::filesystem::create_directories(file_path.parent_path(), ec);
        if (ec) {
            throw ExecutionError("Failed to create " + file_path.parent_path().string() + ": " + ec.message());
        }
        {
            std::ofstream output(file_path, std::ios::out | std::ios::trunc | std::ios::binary);
            if (!output.is_open()) {
                throw ExecutionError("Failed to open " + file_path.string());
            }
            output << entry.content;
            if (!output) {
                throw ExecutionError("Failed to write " + file_path.string());
            }
        }
        if (entry.executable) {
            std::filesystem::permissions(
                file_path,
                std::filesystem::perms::owner_exec |
                    std::filesystem::perms::group_exec |
                    std::filesystem::perms::others_exec,
                std::filesystem::perm_options::add,
                ec);
            if (ec) {
                throw ExecutionError("Failed to chmod " + file_path.string() + ": " + ec.message());
            }
        }
    }
}

}  // namespace runbox::executor
