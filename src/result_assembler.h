#pragma once

#include <string>
#include <json/json.h>
#include "request.h"

namespace execbox {

// Interpreted content of the declared output file
struct OutputPayload {
    enum class Kind {
        ABSENT,     // no output file declared, or the run failed
        TEXT,
        BASE64,
        JSON
    };

    Kind kind = Kind::ABSENT;
    std::string data;           // TEXT and BASE64
    Json::Value json;           // JSON

    static OutputPayload absent() { return OutputPayload{}; }
    static OutputPayload text(std::string value);
    static OutputPayload base64(std::string value);
    static OutputPayload parsed_json(Json::Value value);
};

// Normalized result of one execution; immutable once built
class ExecutionOutcome {
public:
    ExecutionOutcome(int exit_code, std::string stdout_text, std::string stderr_text,
                     OutputPayload output, OutputFormat output_format);

    bool succeeded() const { return exit_code_ == 0; }
    int exit_code() const { return exit_code_; }
    const std::string& stdout_text() const { return stdout_; }
    const std::string& stderr_text() const { return stderr_; }
    const OutputPayload& output() const { return output_; }
    OutputFormat output_format() const { return output_format_; }

private:
    const int exit_code_;
    const std::string stdout_;
    const std::string stderr_;
    const OutputPayload output_;
    const OutputFormat output_format_;
};

class ResultAssembler {
public:
    // Streams are decoded permissively (invalid UTF-8 replaced) and trimmed
    static ExecutionOutcome assemble(int exit_code,
                                     const std::string& stdout_bytes,
                                     const std::string& stderr_bytes,
                                     OutputPayload output,
                                     OutputFormat format);

    // Interpret raw output file bytes. Throws ExecutionError(OUTPUT_PARSE_ERROR)
    // when JSON is requested and the bytes are not a JSON document.
    static OutputPayload interpret_output(const std::string& bytes, OutputFormat format);
};

} // namespace execbox
