#include "config.h"
#include <json/json.h>
#include <fstream>
#include <sstream>
#include <memory>
#include <stdexcept>

namespace execbox {

namespace {

Json::Value parse_document(const std::string& json_text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(json_text.data(), json_text.data() + json_text.size(), &root, &errors)) {
        throw std::runtime_error("Invalid configuration JSON: " + errors);
    }
    if (!root.isObject()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }
    return root;
}

size_t read_size(const Json::Value& root, const char* key, size_t fallback) {
    if (!root.isMember(key)) return fallback;
    const Json::Value& value = root[key];
    if (!value.isUInt64()) {
        throw std::runtime_error(std::string("Configuration key '") + key +
                                 "' must be a non-negative integer");
    }
    return static_cast<size_t>(value.asUInt64());
}

std::string read_string(const Json::Value& root, const char* key, const std::string& fallback) {
    if (!root.isMember(key)) return fallback;
    const Json::Value& value = root[key];
    if (!value.isString()) {
        throw std::runtime_error(std::string("Configuration key '") + key + "' must be a string");
    }
    return value.asString();
}

} // namespace

std::map<std::string, std::string> ServiceConfig::default_images() {
    return {
        {"py37", "python:3.7-slim"},
        {"py36", "python:3.6-slim"},
        {"py35", "python:3.5-slim"},
        {"py27", "python:2.7-slim"},
    };
}

ServiceConfig ServiceConfig::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path);
    }
    std::stringstream contents;
    contents << file.rdbuf();

    ServiceConfig config;
    config.apply_json(contents.str());
    return config;
}

void ServiceConfig::apply_json(const std::string& json_text) {
    Json::Value root = parse_document(json_text);

    if (root.isMember("images")) {
        const Json::Value& table = root["images"];
        if (!table.isObject() || table.empty()) {
            throw std::runtime_error("Configuration key 'images' must be a non-empty object");
        }
        std::map<std::string, std::string> parsed;
        for (const auto& language : table.getMemberNames()) {
            if (!table[language].isString()) {
                throw std::runtime_error("Image for language '" + language + "' must be a string");
            }
            parsed[language] = table[language].asString();
        }
        images = std::move(parsed);
    }

    max_request_bytes = read_size(root, "max_request_bytes", max_request_bytes);
    max_output_bytes = read_size(root, "max_output_bytes", max_output_bytes);
    max_log_bytes = read_size(root, "max_log_bytes", max_log_bytes);
    execution_timeout = std::chrono::seconds(
        read_size(root, "execution_timeout_seconds", execution_timeout.count()));
    memory_limit_bytes = read_size(root, "memory_limit_bytes", memory_limit_bytes);
    pids_limit = static_cast<int>(read_size(root, "pids_limit", pids_limit));

    working_dir = read_string(root, "working_dir", working_dir);
    docker_socket = read_string(root, "docker_socket", docker_socket);
    workspace_root = read_string(root, "workspace_root", workspace_root);
    tokens_file = read_string(root, "tokens_file", tokens_file);

    if (execution_timeout.count() <= 0) {
        throw std::runtime_error("Configuration key 'execution_timeout_seconds' must be positive");
    }
}

bool ServiceConfig::supports_language(const std::string& language) const {
    return images.count(language) > 0;
}

std::vector<std::string> ServiceConfig::languages() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : images) {
        names.push_back(name);
    }
    return names;
}

} // namespace execbox
