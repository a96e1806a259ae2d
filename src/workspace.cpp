#include "workspace.h"
#include "constants.h"
#include "errors.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace fs = std::filesystem;

namespace execbox {

Workspace::Workspace(Token, std::string path) : path_(std::move(path)) {}

Workspace::~Workspace() {
    try {
        destroy();
    } catch (const std::exception& e) {
        std::cerr << "[Workspace] Failed to remove " << path_ << ": " << e.what() << std::endl;
    }
}

std::unique_ptr<Workspace> Workspace::create(const std::string& root) {
    std::error_code ec;
    fs::path base = root.empty() ? fs::temp_directory_path(ec) : fs::path(root);
    if (ec) {
        throw ExecutionError(FailureKind::RESOURCE_EXHAUSTED,
                             "No temporary directory available: " + ec.message());
    }

    std::string pattern = (base / (std::string(WORKSPACE_PREFIX) + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    // mkdtemp creates the directory with mode 0700
    if (mkdtemp(buffer.data()) == nullptr) {
        throw ExecutionError(FailureKind::RESOURCE_EXHAUSTED,
                             "Cannot allocate workspace under " + base.string() + ": " +
                                 std::strerror(errno));
    }

    return std::make_unique<Workspace>(Token{}, std::string(buffer.data()));
}

void Workspace::write_once(const std::string& filename, const std::string& contents,
                           bool& written) {
    if (destroyed_) {
        throw std::logic_error("Workspace already destroyed: " + path_);
    }
    if (written) {
        throw std::logic_error(filename + " was already written to workspace " + path_);
    }

    std::string file_path = path_ + "/" + filename;
    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ExecutionError(FailureKind::RESOURCE_EXHAUSTED, "Cannot create " + file_path);
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.close();
    if (!out) {
        throw ExecutionError(FailureKind::RESOURCE_EXHAUSTED, "Cannot write " + file_path);
    }
    written = true;
}

void Workspace::write_code(const std::string& bytes) {
    write_once(CODE_FILENAME, bytes, code_written_);
}

void Workspace::write_manifest(const std::string& text) {
    write_once(MANIFEST_FILENAME, text, manifest_written_);
}

std::string Workspace::read_file(const std::string& relative_path) const {
    fs::path file_path = fs::path(path_) / relative_path;

    std::error_code ec;
    if (destroyed_ || !fs::is_regular_file(file_path, ec)) {
        throw ExecutionError(FailureKind::NOT_FOUND, "File " + relative_path + " not found");
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw ExecutionError(FailureKind::NOT_FOUND, "File " + relative_path + " not readable");
    }
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

void Workspace::destroy() {
    if (destroyed_) {
        return;
    }
    // One attempt only; a failure propagates and is not retried by the destructor
    destroyed_ = true;
    fs::remove_all(path_);
}

} // namespace execbox
