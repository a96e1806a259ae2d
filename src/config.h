#pragma once

#include <string>
#include <map>
#include <vector>
#include <chrono>
#include "constants.h"

namespace execbox {

// Process-wide settings; read-only once an orchestrator holds a reference
struct ServiceConfig {
    // language identifier -> container image reference
    std::map<std::string, std::string> images = default_images();

    // Ceilings
    size_t max_request_bytes = MAX_REQUEST_SIZE;
    size_t max_output_bytes = MAX_OUTPUT_FILESIZE;     // 0 = unlimited
    size_t max_log_bytes = MAX_LOG_SIZE;               // 0 = unlimited
    std::chrono::seconds execution_timeout{DEFAULT_EXECUTION_TIMEOUT_SECONDS};

    // Container
    std::string working_dir = CONTAINER_WORKING_DIR;
    std::string command = SANDBOX_COMMAND;
    size_t memory_limit_bytes = DEFAULT_CONTAINER_MEMORY_BYTES;
    int pids_limit = DEFAULT_CONTAINER_PIDS_LIMIT;

    // Host
    std::string docker_socket = DEFAULT_DOCKER_SOCKET;
    std::string workspace_root;             // empty = system temp directory
    std::string tokens_file;                // empty = no token check

    static std::map<std::string, std::string> default_images();

    // Overlay settings from a JSON file onto the defaults.
    // Throws std::runtime_error if the file is unreadable or malformed.
    static ServiceConfig from_file(const std::string& path);

    // Apply the keys present in a JSON document; unknown keys are ignored
    void apply_json(const std::string& json_text);

    bool supports_language(const std::string& language) const;
    std::vector<std::string> languages() const;
};

} // namespace execbox
