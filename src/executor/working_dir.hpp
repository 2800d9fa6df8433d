#pragma once

#include <filesystem>
#include <string>

namespace runbox::executor {

// Owns root/id for the lifetime of one run. The directory is created on
// construction and removed recursively on destruction.
class WorkingDirLease {
public:
    // Throws ExecutionError if the directory cannot be created or already exists.
    WorkingDirLease(const std::filesystem::path& root, const std::string& id);
    ~WorkingDirLease();

    WorkingDirLease(const WorkingDirLease&) = delete;
    WorkingDirLease& operator=(const WorkingDirLease&) = delete;
    WorkingDirLease(WorkingDirLease&& other) noexcept;
    WorkingDirLease& operator=(WorkingDirLease&& other) noexcept;

    const std::filesystem::path& Path() const { return path_; }

private:
    void Release() noexcept;

    std::filesystem::path path_;
};

}  // namespace runbox::executor
