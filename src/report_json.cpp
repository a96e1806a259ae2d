#include "report_json.h"
#include "constants.h"
#include "request.h"

namespace execbox {

namespace {

Json::Value output_value(const OutputPayload& output) {
    switch (output.kind) {
        case OutputPayload::Kind::TEXT:
        case OutputPayload::Kind::BASE64:
            return Json::Value(output.data);
        case OutputPayload::Kind::JSON:
            return output.json;
        case OutputPayload::Kind::ABSENT:
            break;
    }
    return Json::Value(Json::nullValue);
}

} // namespace

Json::Value ReportJson::from_report(const ExecutionReport& report) {
    Json::Value root(Json::objectValue);

    if (report.outcome) {
        const ExecutionOutcome& outcome = *report.outcome;
        root["success"] = outcome.succeeded();
        root["exit_code"] = outcome.exit_code();
        root["stdout"] = outcome.stdout_text();
        root["stderr"] = outcome.stderr_text();
        root["output"] = output_value(outcome.output());
        root["output_format"] = output_format_to_string(outcome.output_format());
        return root;
    }

    root["success"] = false;
    if (report.failure) {
        const Failure& failure = *report.failure;
        root["errorMsg"] = failure.message;
        root["error_kind"] = failure_kind_to_string(failure.kind);
        if (failure.kind == FailureKind::PAYLOAD_TOO_LARGE) {
            root["actual_size"] = static_cast<Json::UInt64>(failure.actual_size);
            root["limit"] = static_cast<Json::UInt64>(failure.limit);
        }
    } else {
        root["errorMsg"] = INTERNAL_FAILURE_MESSAGE;
        root["error_kind"] = failure_kind_to_string(FailureKind::ENGINE_UNAVAILABLE);
    }
    return root;
}

Json::Value ReportJson::service_params(const ServiceConfig& config) {
    Json::Value root(Json::objectValue);

    Json::Value types(Json::arrayValue);
    for (const auto& language : config.languages()) {
        types.append(language);
    }
    root["types"] = types;

    Json::Value formats(Json::arrayValue);
    for (const auto& format : supported_output_formats()) {
        formats.append(format);
    }
    root["formats"] = formats;

    root["version"] = EXECBOX_VERSION;
    return root;
}

std::string ReportJson::to_string(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

} // namespace execbox
