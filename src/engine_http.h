#pragma once

#include <string>
#include <map>
#include <chrono>
#include <functional>
#include <stdexcept>
#include "constants.h"

namespace execbox {

// HTTP/1.1 request to the container engine
struct EngineRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::string body;
};

// Parsed engine reply; header names are stored lowercase
struct EngineResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    std::string header(const std::string& name) const;
};

// Socket could not be opened, written or read
class EngineConnectionError : public std::runtime_error {
public:
    explicit EngineConnectionError(const std::string& message)
        : std::runtime_error("Engine connection: " + message) {}
};

// No complete reply before the deadline
class EngineTimeoutError : public std::runtime_error {
public:
    explicit EngineTimeoutError(const std::string& message)
        : std::runtime_error("Engine timeout: " + message) {}
};

// Reply grew past the caller's ceiling
class EngineResponseTooLargeError : public std::runtime_error {
public:
    EngineResponseTooLargeError(const std::string& message, size_t size, size_t limit)
        : std::runtime_error("Engine response too large: " + message),
          size_(size), limit_(limit) {}

    // Declared body length, or the bytes received before giving up
    size_t size() const { return size_; }
    size_t limit() const { return limit_; }

private:
    size_t size_;
    size_t limit_;
};

struct SendOptions {
    size_t max_response_bytes = MAX_ENGINE_RESPONSE_SIZE;   // 0 = unlimited

    // Called once with status and headers, before the body is read.
    // An exception thrown here abandons the reply.
    std::function<void(const EngineResponse&)> on_headers;
};

// Minimal HTTP client over a unix domain socket, one connection per request.
class UnixHttpClient {
public:
    explicit UnixHttpClient(std::string socket_path);

    // Blocks until the full reply arrived or timeout elapsed
    EngineResponse send(const EngineRequest& request, std::chrono::seconds timeout,
                        const SendOptions& options = SendOptions()) const;

    static std::string build_request(const EngineRequest& request);

    // Throws std::runtime_error on a malformed or incomplete reply
    static EngineResponse parse_response(const std::string& raw);

    // Status line and headers only; body left empty
    static EngineResponse parse_head(const std::string& raw);

    static std::string decode_chunked(const std::string& body);

    const std::string& socket_path() const { return socket_path_; }

private:
    int connect_socket() const;

    std::string socket_path_;
};

} // namespace execbox
