#include "executor/working_dir.hpp"

#include <system_error>
#include <utility>

#include "executor/executor_types.hpp"
#include "utils/logging.hpp"

namespace runbox::executor {

WorkingDirLease::WorkingDirLease(const std::filesystem::path& root, const std::string& id)
    : path_(root / id) {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        throw ExecutionError("Failed to create root " + root.string() + ": " + ec.message());
    }
    if (!std::filesystem::create_directory(path_, ec)) {
        const auto reason = ec ? ec.message() : std::string("already exists");
        path_.clear();
        throw ExecutionError("Failed to create working directory " + (root / id).string() + ": " + reason);
    }
}

WorkingDirLease::~WorkingDirLease() {
    Release();
}

WorkingDirLease::WorkingDirLease(WorkingDirLease&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

WorkingDirLease& WorkingDirLease::operator=(WorkingDirLease&& other) noexcept {
    if (this != &other) {
        Release();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void WorkingDirLease::Release() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        utils::LogError("workdir", "cleanup failed", {{"path", path_.string()}, {"error", ec.message()}});
    }
    path_.clear();
}

}  // namespace runbox::executor
