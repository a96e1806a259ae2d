#pragma once

#include <string>
#include <json/json.h>
#include "config.h"
#include "orchestrator.h"

namespace execbox {

// JSON documents printed by the command line front end
class ReportJson {
public:
    // {success, exit_code, stdout, stderr, output, output_format}
    // or {success: false, errorMsg, error_kind[, actual_size, limit]}
    static Json::Value from_report(const ExecutionReport& report);

    // {types, formats, version}
    static Json::Value service_params(const ServiceConfig& config);

    static std::string to_string(const Json::Value& value);
};

} // namespace execbox
