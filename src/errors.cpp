#include "errors.h"

namespace execbox {

std::string failure_kind_to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::INVALID_INPUT: return "invalid_input";
        case FailureKind::UNAUTHORIZED: return "unauthorized";
        case FailureKind::PAYLOAD_TOO_LARGE: return "payload_too_large";
        case FailureKind::NOT_FOUND: return "not_found";
        case FailureKind::EXECUTION_TIMED_OUT: return "execution_timed_out";
        case FailureKind::OUTPUT_PARSE_ERROR: return "output_parse_error";
        case FailureKind::ENGINE_UNAVAILABLE: return "engine_unavailable";
        case FailureKind::RESOURCE_EXHAUSTED: return "resource_exhausted";
    }
    return "unknown";
}

} // namespace execbox
