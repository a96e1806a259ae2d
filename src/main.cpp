/*
 * execbox - Remote code execution in throwaway containers
 * Runs one program per invocation and prints the result as JSON
 */

#include "config.h"
#include "docker_runtime.h"
#include "encoding.h"
#include "orchestrator.h"
#include "report_json.h"
#include "request.h"
#include "token_store.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <memory>
#include <cstdlib>

using namespace execbox;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " --lang <id> --code <file> [options]\n"
              << "       " << program << " --params [--config <json>]\n"
              << "\n"
              << "Options:\n"
              << "  --requirements <file>     pip requirements installed before the run\n"
              << "  --output-file <name>      file in the working directory to return\n"
              << "  --output-format <fmt>     text | base64 | json (default base64)\n"
              << "  --token <t>               access token\n"
              << "  --tokens-file <path>      enable token checks against this list\n"
              << "  --config <json>           service configuration file\n"
              << "  --timeout <s>             execution ceiling in seconds\n"
              << "  --socket <path>           Docker engine socket\n";
}

bool read_file(const std::string& path, std::string& contents) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    contents = buffer.str();
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string code_file;
    std::string requirements_file;
    std::string tokens_file;
    std::string socket_path;
    int timeout_seconds = 0;
    bool show_params = false;
    ExecutionRequest request;

    // Parse command line
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--lang" && i + 1 < argc) {
            request.language = argv[++i];
        } else if (arg == "--code" && i + 1 < argc) {
            code_file = argv[++i];
        } else if (arg == "--requirements" && i + 1 < argc) {
            requirements_file = argv[++i];
        } else if (arg == "--output-file" && i + 1 < argc) {
            request.output_file = argv[++i];
        } else if (arg == "--output-format" && i + 1 < argc) {
            request.output_format = argv[++i];
        } else if (arg == "--token" && i + 1 < argc) {
            request.token = argv[++i];
        } else if (arg == "--tokens-file" && i + 1 < argc) {
            tokens_file = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--timeout" && i + 1 < argc) {
            timeout_seconds = std::atoi(argv[++i]);
            if (timeout_seconds <= 0) {
                std::cerr << "❌ --timeout must be a positive number of seconds" << std::endl;
                return 1;
            }
        } else if (arg == "--socket" && i + 1 < argc) {
            socket_path = argv[++i];
        } else if (arg == "--params") {
            show_params = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "❌ Unknown or incomplete option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    ServiceConfig config;
    if (!config_file.empty()) {
        try {
            config = ServiceConfig::from_file(config_file);
        } catch (const std::exception& e) {
            std::cerr << "❌ " << e.what() << std::endl;
            return 1;
        }
    }
    if (timeout_seconds > 0) {
        config.execution_timeout = std::chrono::seconds(timeout_seconds);
    }
    if (!socket_path.empty()) {
        config.docker_socket = socket_path;
    }
    if (!tokens_file.empty()) {
        config.tokens_file = tokens_file;
    }

    if (show_params) {
        std::cout << ReportJson::to_string(ReportJson::service_params(config)) << std::endl;
        return 0;
    }

    if (code_file.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::string code;
    if (!read_file(code_file, code)) {
        std::cerr << "❌ Cannot read code file: " << code_file << std::endl;
        return 1;
    }
    request.code = Encoding::base64_encode(code);

    if (!requirements_file.empty() && !read_file(requirements_file, request.requirements)) {
        std::cerr << "❌ Cannot read requirements file: " << requirements_file << std::endl;
        return 1;
    }

    std::unique_ptr<TokenStore> tokens;
    if (!config.tokens_file.empty()) {
        tokens = TokenStore::from_file(config.tokens_file);
        if (!tokens) {
            std::cerr << "❌ Failed to load tokens from: " << config.tokens_file << std::endl;
            return 1;
        }
    }

    // Progress lines go to stderr so stdout carries the JSON report only
    std::ostream report_out(std::cout.rdbuf());
    std::cout.rdbuf(std::cerr.rdbuf());

    std::cout << "📦 execbox " << EXECBOX_VERSION << std::endl;
    std::cout << "   Engine: " << config.docker_socket << std::endl;
    std::cout << "   Timeout: " << config.execution_timeout.count() << "s" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    int status = 1;
    try {
        DockerRuntime runtime(DockerRuntime::options_from(config));
        ExecutionOrchestrator orchestrator(config, runtime, tokens.get());

        ExecutionReport report = orchestrator.execute(request);
        report_out << ReportJson::to_string(ReportJson::from_report(report)) << std::endl;
        status = report.ok() && report.outcome->succeeded() ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "❌ " << e.what() << std::endl;
    }

    std::cout.rdbuf(report_out.rdbuf());
    return status;
}
