#pragma once

#include <string>
#include <memory>

namespace execbox {

// Host-side staging directory for one execution.
// Holds the code file and the dependency manifest, later the copied-back output.
// The directory is removed by destroy() or, at the latest, by the destructor.
class Workspace {
    struct Token {};

public:
    // Allocate an empty, exclusive directory under root (system temp dir if empty).
    // Throws ExecutionError(RESOURCE_EXHAUSTED) when the host cannot provide one.
    static std::unique_ptr<Workspace> create(const std::string& root = "");

    // Only reachable through create()
    Workspace(Token, std::string path);
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    // Each may be called once; a second call throws std::logic_error
    void write_code(const std::string& bytes);
    void write_manifest(const std::string& text);

    // Throws ExecutionError(NOT_FOUND) if absent or not a regular file
    std::string read_file(const std::string& relative_path) const;

    // Recursive removal; idempotent. Throws std::filesystem::filesystem_error on failure.
    void destroy();

    const std::string& path() const { return path_; }
    bool destroyed() const { return destroyed_; }

private:
    void write_once(const std::string& filename, const std::string& contents, bool& written);

    std::string path_;
    bool code_written_ = false;
    bool manifest_written_ = false;
    bool destroyed_ = false;
};

} // namespace execbox
