#pragma once

#include <string>
#include <chrono>
#include "sandbox_runtime.h"
#include "engine_http.h"
#include "config.h"
#include "constants.h"

namespace execbox {

// SandboxRuntime backed by the Docker Engine API over its unix socket.
// The only place Docker status codes and payloads are interpreted.
class DockerRuntime : public SandboxRuntime {
public:
    struct Options {
        std::string socket_path = DEFAULT_DOCKER_SOCKET;
        size_t memory_limit_bytes = DEFAULT_CONTAINER_MEMORY_BYTES;  // 0 = engine default
        int pids_limit = DEFAULT_CONTAINER_PIDS_LIMIT;               // 0 = engine default
        size_t max_log_bytes = MAX_LOG_SIZE;                         // 0 = unlimited
        std::chrono::seconds request_timeout{ENGINE_REQUEST_TIMEOUT_SECONDS};
        std::chrono::seconds pull_timeout{IMAGE_PULL_TIMEOUT_SECONDS};
    };

    explicit DockerRuntime(const Options& options);

    static Options options_from(const ServiceConfig& config);

    SandboxHandle create_detached(const std::string& image,
                                  const std::string& command,
                                  const std::string& working_dir) override;
    void copy_into(const SandboxHandle& handle,
                   const std::string& archive,
                   const std::string& dest_dir) override;
    void start(const SandboxHandle& handle) override;
    int await_completion(const SandboxHandle& handle, std::chrono::seconds timeout) override;
    LogStreams read_logs(const SandboxHandle& handle) override;
    ArchiveStream copy_out_of(const SandboxHandle& handle, const std::string& path,
                              size_t max_bytes) override;
    void force_remove(const SandboxHandle& handle) noexcept override;

    // Split the engine's multiplexed log stream (8-byte frame headers)
    static LogStreams demultiplex_logs(const std::string& raw);

    // Decode the X-Docker-Container-Path-Stat header (base64 JSON) into name and size
    static void decode_path_stat(const std::string& header, std::string& name, size_t& size);

    // Percent-encode a query value
    static std::string url_encode(const std::string& value);

    // Body of POST /containers/create
    std::string create_body(const std::string& image,
                            const std::string& command,
                            const std::string& working_dir) const;

private:
    // Round trip; connection failures become ENGINE_UNAVAILABLE, the timeout error passes through
    EngineResponse call(const std::string& method,
                        const std::string& path,
                        const std::string& body,
                        const std::string& content_type,
                        std::chrono::seconds timeout) const;

    void pull_image(const std::string& image);

    static std::string api(const std::string& path);

    Options options_;
    UnixHttpClient client_;
};

} // namespace execbox
