#pragma once

#include "job/job_types.hpp"
#include "nlohmann/json.hpp"

namespace runbox::job {

// All parsers throw ConfigError naming the offending field.
File ParseFile(const nlohmann::json& data);
ComputeContext ParseComputeContext(const nlohmann::json& data);

// Keys other than entrypoint/files become tracking fields.
Program ParseProgram(const nlohmann::json& data);

BatchRequest ParseBatchRequest(const nlohmann::json& data);
BatchRequest ParseBatchRequest(const std::string& text);

nlohmann::json ComputeContextToJson(const ComputeContext& context);

}  // namespace runbox::job
