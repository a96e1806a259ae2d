#include "result_assembler.h"
#include "encoding.h"
#include "errors.h"
#include <memory>

namespace execbox {

OutputPayload OutputPayload::text(std::string value) {
    OutputPayload payload;
    payload.kind = Kind::TEXT;
    payload.data = std::move(value);
    return payload;
}

OutputPayload OutputPayload::base64(std::string value) {
    OutputPayload payload;
    payload.kind = Kind::BASE64;
    payload.data = std::move(value);
    return payload;
}

OutputPayload OutputPayload::parsed_json(Json::Value value) {
    OutputPayload payload;
    payload.kind = Kind::JSON;
    payload.json = std::move(value);
    return payload;
}

ExecutionOutcome::ExecutionOutcome(int exit_code, std::string stdout_text, std::string stderr_text,
                                   OutputPayload output, OutputFormat output_format)
    : exit_code_(exit_code),
      stdout_(std::move(stdout_text)),
      stderr_(std::move(stderr_text)),
      output_(std::move(output)),
      output_format_(output_format) {}

ExecutionOutcome ResultAssembler::assemble(int exit_code,
                                           const std::string& stdout_bytes,
                                           const std::string& stderr_bytes,
                                           OutputPayload output,
                                           OutputFormat format) {
    return ExecutionOutcome(exit_code,
                            Encoding::trim(Encoding::sanitize_utf8(stdout_bytes)),
                            Encoding::trim(Encoding::sanitize_utf8(stderr_bytes)),
                            std::move(output), format);
}

OutputPayload ResultAssembler::interpret_output(const std::string& bytes, OutputFormat format) {
    switch (format) {
        case OutputFormat::TEXT:
            return OutputPayload::text(Encoding::sanitize_utf8(bytes));

        case OutputFormat::BASE64:
            return OutputPayload::base64(Encoding::trim(Encoding::base64_encode(bytes)));

        case OutputFormat::JSON: {
            // Any JSON value is accepted at the root, nothing may follow it
            Json::CharReaderBuilder builder;
            builder["allowComments"] = false;
            builder["strictRoot"] = false;
            builder["failIfExtra"] = true;
            builder["allowSpecialFloats"] = true;
            std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

            Json::Value value;
            std::string errors;
            if (!reader->parse(bytes.data(), bytes.data() + bytes.size(), &value, &errors)) {
                throw ExecutionError(FailureKind::OUTPUT_PARSE_ERROR,
                                     "Output file could not be parsed as valid JSON: " +
                                         Encoding::trim(errors));
            }
            return OutputPayload::parsed_json(std::move(value));
        }
    }
    return OutputPayload::absent();
}

} // namespace execbox
