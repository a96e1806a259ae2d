#include "request.h"
#include "errors.h"
#include "encoding.h"
#include "token_store.h"
#include <regex>
#include <sstream>

namespace execbox {

namespace {

constexpr size_t MAX_FILENAME_LENGTH = 255;

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::ostringstream out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out << separator;
        out << items[i];
    }
    return out.str();
}

} // namespace

std::string output_format_to_string(OutputFormat format) {
    switch (format) {
        case OutputFormat::TEXT: return "text";
        case OutputFormat::BASE64: return "base64_encoded_binary";
        case OutputFormat::JSON: return "json";
    }
    return "base64_encoded_binary";
}

std::optional<OutputFormat> parse_output_format(const std::string& name) {
    if (name == "text") return OutputFormat::TEXT;
    if (name == "base64_encoded_binary" || name == "base64") return OutputFormat::BASE64;
    if (name == "json") return OutputFormat::JSON;
    return std::nullopt;
}

std::vector<std::string> supported_output_formats() {
    return {"text", "base64_encoded_binary", "json"};
}

RequestValidator::RequestValidator(const ServiceConfig& config, const TokenStore* tokens)
    : config_(config), tokens_(tokens) {}

bool RequestValidator::is_valid_output_filename(const std::string& filename) {
    static const std::regex pattern(R"(^[\w, -]+\.[A-Za-z]{1,4}$)");
    if (filename.empty() || filename.size() > MAX_FILENAME_LENGTH) {
        return false;
    }
    return std::regex_match(filename, pattern);
}

ValidatedRequest RequestValidator::validate(const ExecutionRequest& request) const {
    size_t payload_size = request.code.size() + request.requirements.size() +
                          request.output_file.size() + request.output_format.size() +
                          request.token.size() + request.language.size();
    if (payload_size > config_.max_request_bytes) {
        throw PayloadTooLargeError(
            "Request is " + std::to_string(payload_size) + " bytes (max size is " +
                std::to_string(config_.max_request_bytes) + " bytes)",
            payload_size, config_.max_request_bytes);
    }

    if (request.code.empty()) {
        throw ExecutionError(FailureKind::INVALID_INPUT, "Payload is empty.");
    }

    if (tokens_) {
        if (request.token.empty()) {
            throw ExecutionError(FailureKind::UNAUTHORIZED, "Request is missing a token.");
        }
        if (!tokens_->is_valid(request.token)) {
            throw ExecutionError(FailureKind::UNAUTHORIZED, "Token is invalid.");
        }
    }

    if (!Encoding::is_base64(request.code)) {
        throw ExecutionError(FailureKind::INVALID_INPUT,
                             "Code is not valid Base64 Encoding (RFC 3548).");
    }

    if (!request.output_file.empty() && !is_valid_output_filename(request.output_file)) {
        throw ExecutionError(FailureKind::INVALID_INPUT,
                             "Output filename is not allowed. Use a valid filename.");
    }

    auto image = config_.images.find(request.language);
    if (image == config_.images.end()) {
        throw ExecutionError(FailureKind::INVALID_INPUT,
                             "Language " + request.language +
                                 " is not supported. Supported languages are: " +
                                 join(config_.languages(), ", ") + ".");
    }

    OutputFormat format = OutputFormat::BASE64;
    if (!request.output_format.empty()) {
        auto parsed = parse_output_format(request.output_format);
        if (!parsed) {
            throw ExecutionError(FailureKind::INVALID_INPUT,
                                 "output_file_type " + request.output_format +
                                     " is not supported. Supported values are: " +
                                     join(supported_output_formats(), ", ") +
                                     ", or blank (defaulting to base64_encoded_binary).");
        }
        format = *parsed;
    }

    ValidatedRequest validated;
    validated.language = request.language;
    validated.image = image->second;
    validated.code = Encoding::base64_decode(request.code);
    validated.requirements = request.requirements;
    validated.output_file = request.output_file;
    validated.output_format = format;
    return validated;
}

} // namespace execbox
