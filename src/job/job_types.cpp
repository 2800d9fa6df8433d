#include "job/job_types.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

namespace runbox::job {

bool IsContainedRelativePath(const std::string& path) {
    if (path.empty()) {
        return false;
    }
    const std::filesystem::path parsed(path);
    if (parsed.is_absolute() || parsed.has_root_path()) {
        return false;
    }
    for (const auto& part : parsed) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

Program::Program(std::string entrypoint,
                 std::vector<File> files,
                 nlohmann::json tracking_fields)
    : entrypoint_(std::move(entrypoint))
    , files_(std::move(files))
    , tracking_fields_(std::move(tracking_fields)) {
    if (tracking_fields_.is_null()) {
        tracking_fields_ = nlohmann::json::object();
    }
    if (!tracking_fields_.is_object()) {
        throw ConfigError("Tracking fields must be a JSON object");
    }
    for (const auto& file : files_) {
        if (!IsContainedRelativePath(file.file_name)) {
            throw ConfigError("Invalid file name '" + file.file_name + "'");
        }
    }
    const auto found = std::any_of(files_.begin(), files_.end(), [this](const File& file) {
        return file.file_name == entrypoint_;
    });
    if (!found) {
        throw ConfigError("Entrypoint " + entrypoint_ + " not found in program files");
    }
}

}  // namespace runbox::job
