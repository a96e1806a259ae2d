#include "docker_runtime.h"
#include "encoding.h"
#include "errors.h"
#include <json/json.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <iomanip>

namespace execbox {

namespace {

[[noreturn]] void engine_unavailable(const std::string& detail) {
    std::cerr << "[Docker] " << detail << std::endl;
    throw ExecutionError(FailureKind::ENGINE_UNAVAILABLE, INTERNAL_FAILURE_MESSAGE);
}

bool parse_json(const std::string& text, Json::Value& out) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    return reader->parse(text.data(), text.data() + text.size(), &out, &errors);
}

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

// "message" field of an engine error reply, or the raw body
std::string engine_message(const EngineResponse& resp) {
    Json::Value body;
    if (parse_json(resp.body, body) && body.isObject() && body["message"].isString()) {
        return body["message"].asString();
    }
    return resp.body;
}

std::string short_id(const SandboxHandle& handle) {
    return handle.id.substr(0, 12);
}

PayloadTooLargeError file_too_large(const std::string& path, size_t size, size_t limit) {
    std::string name = path.substr(path.rfind('/') + 1);
    return PayloadTooLargeError("File " + name + " is " + std::to_string(size) +
                                    " bytes, (max size is " + std::to_string(limit) + " bytes)",
                                size, limit);
}

uint32_t read_be32(const std::string& data, size_t pos) {
    return (static_cast<uint32_t>(static_cast<unsigned char>(data[pos])) << 24) |
           (static_cast<uint32_t>(static_cast<unsigned char>(data[pos + 1])) << 16) |
           (static_cast<uint32_t>(static_cast<unsigned char>(data[pos + 2])) << 8) |
           static_cast<uint32_t>(static_cast<unsigned char>(data[pos + 3]));
}

} // namespace

DockerRuntime::DockerRuntime(const Options& options)
    : options_(options), client_(options.socket_path) {}

DockerRuntime::Options DockerRuntime::options_from(const ServiceConfig& config) {
    Options options;
    options.socket_path = config.docker_socket;
    options.memory_limit_bytes = config.memory_limit_bytes;
    options.pids_limit = config.pids_limit;
    options.max_log_bytes = config.max_log_bytes;
    return options;
}

std::string DockerRuntime::api(const std::string& path) {
    return std::string("/") + DOCKER_API_VERSION + path;
}

std::string DockerRuntime::url_encode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out << c;
        } else {
            out << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return out.str();
}

EngineResponse DockerRuntime::call(const std::string& method,
                                   const std::string& path,
                                   const std::string& body,
                                   const std::string& content_type,
                                   std::chrono::seconds timeout) const {
    EngineRequest req;
    req.method = method;
    req.path = api(path);
    req.body = body;
    if (!content_type.empty()) {
        req.headers["Content-Type"] = content_type;
    }

    try {
        return client_.send(req, timeout);
    } catch (const EngineConnectionError& e) {
        engine_unavailable(method + " " + path + ": " + e.what());
    } catch (const EngineTimeoutError& e) {
        engine_unavailable(method + " " + path + ": " + e.what());
    }
}

std::string DockerRuntime::create_body(const std::string& image,
                                       const std::string& command,
                                       const std::string& working_dir) const {
    Json::Value body;
    body["Image"] = image;

    Json::Value cmd(Json::arrayValue);
    cmd.append("sh");
    cmd.append("-c");
    cmd.append(command);
    body["Cmd"] = cmd;

    body["WorkingDir"] = working_dir;
    body["AttachStdin"] = false;
    body["AttachStdout"] = true;
    body["AttachStderr"] = true;
    body["Tty"] = false;
    body["OpenStdin"] = false;

    Json::Value host_config(Json::objectValue);
    host_config["AutoRemove"] = false;
    if (options_.memory_limit_bytes > 0) {
        host_config["Memory"] = static_cast<Json::Int64>(options_.memory_limit_bytes);
    }
    if (options_.pids_limit > 0) {
        host_config["PidsLimit"] = static_cast<Json::Int64>(options_.pids_limit);
    }
    body["HostConfig"] = host_config;

    return write_json(body);
}

void DockerRuntime::pull_image(const std::string& image) {
    std::string repository = image;
    std::string tag = "latest";
    size_t slash = image.rfind('/');
    size_t colon = image.rfind(':');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        repository = image.substr(0, colon);
        tag = image.substr(colon + 1);
    }

    std::cout << "[Docker] Pulling image " << repository << ":" << tag << std::endl;
    EngineResponse resp = call("POST",
                               "/images/create?fromImage=" + url_encode(repository) +
                                   "&tag=" + url_encode(tag),
                               "", "", options_.pull_timeout);
    if (resp.status_code != 200) {
        engine_unavailable("pull " + image + " failed (" + std::to_string(resp.status_code) +
                           "): " + engine_message(resp));
    }

    // Progress is streamed as JSON lines; failures arrive as {"error": ...} with status 200
    std::istringstream lines(resp.body);
    std::string line;
    while (std::getline(lines, line)) {
        Json::Value progress;
        if (!line.empty() && parse_json(line, progress) && progress.isObject() &&
            progress.isMember("error")) {
            engine_unavailable("pull " + image + " failed: " + progress["error"].asString());
        }
    }
}

SandboxHandle DockerRuntime::create_detached(const std::string& image,
                                             const std::string& command,
                                             const std::string& working_dir) {
    std::string body = create_body(image, command, working_dir);
    EngineResponse resp = call("POST", "/containers/create", body, "application/json",
                               options_.request_timeout);

    if (resp.status_code == 404) {
        pull_image(image);
        resp = call("POST", "/containers/create", body, "application/json",
                    options_.request_timeout);
    }
    if (resp.status_code != 201) {
        engine_unavailable("create from " + image + " failed (" +
                           std::to_string(resp.status_code) + "): " + engine_message(resp));
    }

    Json::Value created;
    if (!parse_json(resp.body, created) || !created.isObject() || !created["Id"].isString() ||
        created["Id"].asString().empty()) {
        engine_unavailable("create returned no container id: " + resp.body);
    }

    SandboxHandle handle{created["Id"].asString()};
    std::cout << "[Docker] Created container " << short_id(handle) << " from " << image
              << std::endl;
    return handle;
}

void DockerRuntime::copy_into(const SandboxHandle& handle,
                              const std::string& archive,
                              const std::string& dest_dir) {
    EngineResponse resp = call("PUT",
                               "/containers/" + handle.id + "/archive?path=" + url_encode(dest_dir),
                               archive, "application/x-tar", options_.request_timeout);
    if (resp.status_code != 200) {
        engine_unavailable("copy into " + short_id(handle) + ":" + dest_dir + " failed (" +
                           std::to_string(resp.status_code) + "): " + engine_message(resp));
    }
}

void DockerRuntime::start(const SandboxHandle& handle) {
    EngineResponse resp = call("POST", "/containers/" + handle.id + "/start", "", "",
                               options_.request_timeout);
    // 304: already started
    if (resp.status_code != 204 && resp.status_code != 304) {
        engine_unavailable("start " + short_id(handle) + " failed (" +
                           std::to_string(resp.status_code) + "): " + engine_message(resp));
    }
}

int DockerRuntime::await_completion(const SandboxHandle& handle, std::chrono::seconds timeout) {
    EngineRequest req;
    req.method = "POST";
    req.path = api("/containers/" + handle.id + "/wait");

    EngineResponse resp;
    try {
        resp = client_.send(req, timeout);
    } catch (const EngineTimeoutError&) {
        std::cout << "[Docker] Container " << short_id(handle) << " still running after "
                  << timeout.count() << "s" << std::endl;
        throw ExecutionError(FailureKind::EXECUTION_TIMED_OUT,
                             "Execution time has passed the limit of " +
                                 std::to_string(timeout.count()) + " seconds.");
    } catch (const EngineConnectionError& e) {
        engine_unavailable("wait " + short_id(handle) + ": " + e.what());
    }

    if (resp.status_code != 200) {
        engine_unavailable("wait " + short_id(handle) + " failed (" +
                           std::to_string(resp.status_code) + "): " + engine_message(resp));
    }

    Json::Value result;
    if (!parse_json(resp.body, result) || !result.isObject() || !result["StatusCode"].isInt()) {
        engine_unavailable("wait returned no status code: " + resp.body);
    }
    if (result["Error"].isObject() && result["Error"]["Message"].isString() &&
        !result["Error"]["Message"].asString().empty()) {
        engine_unavailable("wait " + short_id(handle) + ": " +
                           result["Error"]["Message"].asString());
    }
    return result["StatusCode"].asInt();
}

LogStreams DockerRuntime::demultiplex_logs(const std::string& raw) {
    LogStreams logs;
    size_t pos = 0;

    while (pos < raw.size()) {
        unsigned char stream = static_cast<unsigned char>(raw[pos]);
        bool framed = raw.size() - pos >= 8 && stream <= 2 &&
                      raw[pos + 1] == '\0' && raw[pos + 2] == '\0' && raw[pos + 3] == '\0';
        if (!framed) {
            // Not multiplexed (TTY container): everything is stdout
            logs.stdout_bytes.append(raw, pos, std::string::npos);
            break;
        }

        size_t length = read_be32(raw, pos + 4);
        size_t payload = pos + 8;
        size_t available = std::min(length, raw.size() - payload);
        if (stream == 2) {
            logs.stderr_bytes.append(raw, payload, available);
        } else {
            logs.stdout_bytes.append(raw, payload, available);
        }
        pos = payload + available;
    }

    return logs;
}

LogStreams DockerRuntime::read_logs(const SandboxHandle& handle) {
    EngineRequest req;
    req.method = "GET";
    req.path = api("/containers/" + handle.id + "/logs?stdout=1&stderr=1");
    SendOptions send_options;
    send_options.max_response_bytes = options_.max_log_bytes;

    EngineResponse resp;
    try {
        resp = client_.send(req, options_.request_timeout, send_options);
    } catch (const EngineResponseTooLargeError& e) {
        std::cout << "[Docker] Logs of " << short_id(handle) << " exceed "
                  << options_.max_log_bytes << " bytes" << std::endl;
        throw PayloadTooLargeError("Program output is " + std::to_string(e.size()) +
                                       " bytes, (max size is " +
                                       std::to_string(options_.max_log_bytes) + " bytes)",
                                   e.size(), options_.max_log_bytes);
    } catch (const EngineConnectionError& e) {
        engine_unavailable("logs " + short_id(handle) + ": " + e.what());
    } catch (const EngineTimeoutError& e) {
        engine_unavailable("logs " + short_id(handle) + ": " + e.what());
    }

    if (resp.status_code != 200) {
        engine_unavailable("logs " + short_id(handle) + " failed (" +
                           std::to_string(resp.status_code) + "): " + engine_message(resp));
    }
    return demultiplex_logs(resp.body);
}

void DockerRuntime::decode_path_stat(const std::string& header, std::string& name, size_t& size) {
    name.clear();
    size = 0;
    if (header.empty()) {
        return;
    }

    Json::Value stat;
    std::string decoded = Encoding::is_base64(header) ? Encoding::base64_decode(header) : "";
    if (!parse_json(decoded, stat) || !stat.isObject()) {
        return;
    }
    if (stat["name"].isString()) {
        name = stat["name"].asString();
    }
    if (stat["size"].isUInt64()) {
        size = static_cast<size_t>(stat["size"].asUInt64());
    }
}

ArchiveStream DockerRuntime::copy_out_of(const SandboxHandle& handle, const std::string& path,
                                         size_t max_bytes) {
    EngineRequest req;
    req.method = "GET";
    req.path = api("/containers/" + handle.id + "/archive?path=" + url_encode(path));

    // The path stat header arrives before the archive body
    SendOptions send_options;
    send_options.max_response_bytes =
        max_bytes == 0 ? 0 : std::max(MAX_ENGINE_RESPONSE_SIZE, max_bytes + ARCHIVE_HEADROOM_BYTES);
    send_options.on_headers = [&path, max_bytes](const EngineResponse& head) {
        if (head.status_code != 200 || max_bytes == 0) {
            return;
        }
        std::string name;
        size_t size = 0;
        decode_path_stat(head.header("X-Docker-Container-Path-Stat"), name, size);
        if (size > max_bytes) {
            throw file_too_large(path, size, max_bytes);
        }
    };

    EngineResponse resp;
    try {
        resp = client_.send(req, options_.request_timeout, send_options);
    } catch (const EngineResponseTooLargeError& e) {
        throw file_too_large(path, e.size(), max_bytes);
    } catch (const EngineConnectionError& e) {
        engine_unavailable("copy out of " + short_id(handle) + ":" + path + ": " + e.what());
    } catch (const EngineTimeoutError& e) {
        engine_unavailable("copy out of " + short_id(handle) + ":" + path + ": " + e.what());
    }

    if (resp.status_code == 404) {
        throw ExecutionError(FailureKind::NOT_FOUND,
                             "Could not find the file " + path + " in the sandbox.");
    }
    if (resp.status_code != 200) {
        engine_unavailable("copy out of " + short_id(handle) + ":" + path + " failed (" +
                           std::to_string(resp.status_code) + "): " + engine_message(resp));
    }

    ArchiveStream stream;
    stream.data = std::move(resp.body);
    decode_path_stat(resp.header("X-Docker-Container-Path-Stat"), stream.name,
                     stream.declared_size);
    return stream;
}

void DockerRuntime::force_remove(const SandboxHandle& handle) noexcept {
    try {
        EngineRequest req;
        req.method = "DELETE";
        req.path = api("/containers/" + handle.id + "?force=1&v=1");
        EngineResponse resp = client_.send(req, options_.request_timeout);

        if (resp.status_code == 204 || resp.status_code == 404) {
            std::cout << "[Docker] Removed container " << short_id(handle) << std::endl;
        } else {
            std::cerr << "[Docker] Remove " << short_id(handle) << " failed ("
                      << resp.status_code << "): " << engine_message(resp) << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Docker] Remove " << short_id(handle) << " failed: " << e.what()
                  << std::endl;
    }
}

} // namespace execbox
