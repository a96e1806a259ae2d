#pragma once

#include <cstddef>  // for size_t

namespace execbox {

constexpr const char* EXECBOX_VERSION = "2.0.0";

// Size limits
constexpr size_t MAX_REQUEST_SIZE = 1 * 1024 * 1024;              // 1MB max request payload
constexpr size_t MAX_OUTPUT_FILESIZE = 4 * 1024 * 1024;           // 4MB max copied-out file
constexpr size_t MAX_ENGINE_RESPONSE_SIZE = 64 * 1024 * 1024;     // 64MB cap on engine replies
constexpr size_t MAX_LOG_SIZE = 64 * 1024 * 1024;                 // 64MB stdout + stderr
constexpr size_t ARCHIVE_HEADROOM_BYTES = 64 * 1024;              // TAR headers and padding

// Time limits
constexpr int DEFAULT_EXECUTION_TIMEOUT_SECONDS = 60;             // Wall clock per execution
constexpr int ENGINE_REQUEST_TIMEOUT_SECONDS = 30;                // Any other engine call
constexpr int IMAGE_PULL_TIMEOUT_SECONDS = 600;                   // Image pulls are slow

// Container limits
constexpr size_t DEFAULT_CONTAINER_MEMORY_BYTES = 512 * 1024 * 1024;  // 512MB
constexpr int DEFAULT_CONTAINER_PIDS_LIMIT = 64;

// Sandbox layout
constexpr const char* CONTAINER_WORKING_DIR = "/usr/src/app";
constexpr const char* CODE_FILENAME = "run.py";
constexpr const char* MANIFEST_FILENAME = "requirements.txt";
constexpr const char* SANDBOX_COMMAND =
    "pip install -qqq --no-cache-dir -r requirements.txt && python run.py";

// Reported for engine and internal failures; details only go to the log
constexpr const char* INTERNAL_FAILURE_MESSAGE =
    "Fatal Error. Please contact the service's operators and consult for support.";

// Host side
constexpr const char* DEFAULT_DOCKER_SOCKET = "/var/run/docker.sock";
constexpr const char* DOCKER_API_VERSION = "v1.40";
constexpr const char* WORKSPACE_PREFIX = "execbox_";

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                        // Socket read buffer
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                     // Initial HTTP buffer
constexpr size_t TAR_BLOCK_SIZE = 512;

} // namespace execbox
