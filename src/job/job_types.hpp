#pragma once

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "nlohmann/json.hpp"

namespace runbox::job {

// Raised for invalid submissions; execution never starts.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct File {
    std::string file_name;
    std::string content;
};

// Caller-owned description of the environment a program runs under.
// Zero limits defer to the configured executor defaults.
struct ComputeContext {
    std::string language;
    std::string version;
    int time_limit_secs = 0;
    int memory_limit_mb = 0;
    std::unordered_map<std::string, std::string> extra_options;
};

class Program {
public:
    // Throws ConfigError when the entrypoint is not among files, when a
    // file name is empty, absolute or escapes through "..", or when
    // tracking_fields is not a JSON object.
    Program(std::string entrypoint,
            std::vector<File> files,
            nlohmann::json tracking_fields = nlohmann::json::object());

    const std::string& Entrypoint() const { return entrypoint_; }
    const std::vector<File>& Files() const { return files_; }
    // Opaque caller metadata, echoed back in the result.
    const nlohmann::json& TrackingFields() const { return tracking_fields_; }

private:
    std::string entrypoint_;
    std::vector<File> files_;
    nlohmann::json tracking_fields_;
};

// Inbound unit of work: programs sharing one environment.
struct BatchRequest {
    std::string submission_id;
    ComputeContext environment;
    std::vector<Program> programs;
};

// True when path is non-empty, relative and has no ".." component.
bool IsContainedRelativePath(const std::string& path);

}  // namespace runbox::job
