#pragma once

#include <string>
#include <chrono>
#include <cstddef>

namespace execbox {

// One container instance; owned by a single orchestration, never reused
struct SandboxHandle {
    std::string id;
};

// Archive pulled out of a sandbox together with the engine's stat of the path
struct ArchiveStream {
    std::string data;               // TAR bytes
    std::string name;               // base name reported by the engine
    size_t declared_size = 0;       // size reported by the engine
};

struct LogStreams {
    std::string stdout_bytes;
    std::string stderr_bytes;
};

// Capability set over a container engine.
// Implementations translate every engine failure into ExecutionError kinds:
// ENGINE_UNAVAILABLE, NOT_FOUND (copy_out_of), EXECUTION_TIMED_OUT (await_completion)
// and PAYLOAD_TOO_LARGE (read_logs, copy_out_of).
class SandboxRuntime {
public:
    virtual ~SandboxRuntime() = default;

    // Create without starting
    virtual SandboxHandle create_detached(const std::string& image,
                                          const std::string& command,
                                          const std::string& working_dir) = 0;

    // Extract a TAR stream into dest_dir inside the sandbox
    virtual void copy_into(const SandboxHandle& handle,
                           const std::string& archive,
                           const std::string& dest_dir) = 0;

    virtual void start(const SandboxHandle& handle) = 0;

    // Exit code of the sandbox process. Throws EXECUTION_TIMED_OUT when the
    // timeout elapses first; the sandbox is then left running.
    virtual int await_completion(const SandboxHandle& handle,
                                 std::chrono::seconds timeout) = 0;

    // Throws PAYLOAD_TOO_LARGE when the streams outgrow the runtime's log ceiling
    virtual LogStreams read_logs(const SandboxHandle& handle) = 0;

    // Throws PAYLOAD_TOO_LARGE as soon as the engine reports a file larger
    // than max_bytes, before the archive is transferred. 0 = unlimited.
    virtual ArchiveStream copy_out_of(const SandboxHandle& handle,
                                      const std::string& path,
                                      size_t max_bytes) = 0;

    // Best effort; never throws
    virtual void force_remove(const SandboxHandle& handle) noexcept = 0;
};

} // namespace execbox
