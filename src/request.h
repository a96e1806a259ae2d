#pragma once

#include <string>
#include <vector>
#include <optional>
#include "config.h"

namespace execbox {

class TokenStore;

// Interpretation of the declared output file
enum class OutputFormat {
    TEXT,       // permissive UTF-8 text
    BASE64,     // raw bytes, base64 encoded
    JSON        // parsed JSON value
};

// Wire names: "text", "base64_encoded_binary", "json"
std::string output_format_to_string(OutputFormat format);

// Accepts the wire names plus "base64"; std::nullopt for anything else
std::optional<OutputFormat> parse_output_format(const std::string& name);

std::vector<std::string> supported_output_formats();

// Execution request as handed over by the caller
struct ExecutionRequest {
    std::string language;
    std::string code;                      // base64 of the program bytes
    std::string requirements;              // pip manifest, may be empty
    std::string output_file;               // empty = no output file
    std::string output_format;             // empty = base64_encoded_binary
    std::string token;
};

// Request after validation; everything a sandbox run needs, nothing to re-check
struct ValidatedRequest {
    std::string language;
    std::string image;
    std::string code;                      // decoded program bytes
    std::string requirements;
    std::string output_file;
    OutputFormat output_format = OutputFormat::BASE64;

    bool wants_output_file() const { return !output_file.empty(); }
};

class RequestValidator {
public:
    // tokens == nullptr disables the token check
    RequestValidator(const ServiceConfig& config, const TokenStore* tokens);

    // Throws ExecutionError (INVALID_INPUT, UNAUTHORIZED) or PayloadTooLargeError
    ValidatedRequest validate(const ExecutionRequest& request) const;

    // Plain file name: no separators, single extension of 1-4 letters
    static bool is_valid_output_filename(const std::string& filename);

private:
    const ServiceConfig& config_;
    const TokenStore* tokens_;
};

} // namespace execbox
