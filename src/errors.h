#pragma once

#include <stdexcept>
#include <string>
#include <cstddef>

namespace execbox {

// Terminal failure kinds of one execution request
enum class FailureKind {
    INVALID_INPUT,
    UNAUTHORIZED,
    PAYLOAD_TOO_LARGE,
    NOT_FOUND,
    EXECUTION_TIMED_OUT,
    OUTPUT_PARSE_ERROR,
    ENGINE_UNAVAILABLE,
    RESOURCE_EXHAUSTED
};

// Stable identifier ("invalid_input", "payload_too_large", ...)
std::string failure_kind_to_string(FailureKind kind);

class ExecutionError : public std::runtime_error {
public:
    ExecutionError(FailureKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    FailureKind kind() const { return kind_; }

private:
    FailureKind kind_;
};

// Size ceiling violation; carries the offending size and the ceiling
class PayloadTooLargeError : public ExecutionError {
public:
    PayloadTooLargeError(const std::string& message, size_t actual_size, size_t limit)
        : ExecutionError(FailureKind::PAYLOAD_TOO_LARGE, message),
          actual_size_(actual_size), limit_(limit) {}

    size_t actual_size() const { return actual_size_; }
    size_t limit() const { return limit_; }

private:
    size_t actual_size_;
    size_t limit_;
};

// Malformed or unsafe TAR stream
class ArchiveError : public std::runtime_error {
public:
    explicit ArchiveError(const std::string& message)
        : std::runtime_error("Archive error: " + message) {}
};

} // namespace execbox
