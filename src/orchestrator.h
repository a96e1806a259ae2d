#pragma once

#include <string>
#include <vector>
#include <optional>
#include <memory>
#include "config.h"
#include "errors.h"
#include "request.h"
#include "result_assembler.h"
#include "sandbox_runtime.h"

namespace execbox {

class TokenStore;
class Workspace;

enum class ExecutionState {
    IDLE,
    PROVISIONING,
    TRANSFERRING_IN,
    RUNNING,
    AWAITING,
    COLLECTING,
    TRANSFERRING_OUT,
    FINALIZING,
    DONE,
    FAILED
};

std::string execution_state_to_string(ExecutionState state);

// Why a request failed; size fields are set for PAYLOAD_TOO_LARGE only
struct Failure {
    FailureKind kind;
    std::string message;
    size_t actual_size = 0;
    size_t limit = 0;
};

// Tagged result of one request: exactly one of outcome / failure is set
struct ExecutionReport {
    std::optional<ExecutionOutcome> outcome;
    std::optional<Failure> failure;
    std::vector<ExecutionState> states;     // every state visited, in order

    bool ok() const { return outcome.has_value(); }
};

// Owns one sandbox handle for the duration of a request.
// release() force-removes it at most once; without a handle it does nothing.
class SandboxLease {
public:
    explicit SandboxLease(SandboxRuntime& runtime) : runtime_(runtime) {}
    ~SandboxLease() { release(); }

    SandboxLease(const SandboxLease&) = delete;
    SandboxLease& operator=(const SandboxLease&) = delete;

    void acquire(SandboxHandle handle);
    void release() noexcept;

    bool held() const { return held_; }
    const SandboxHandle& handle() const { return handle_; }

private:
    SandboxRuntime& runtime_;
    SandboxHandle handle_;
    bool held_ = false;
};

// Runs one request through
// IDLE -> PROVISIONING -> TRANSFERRING_IN -> RUNNING -> AWAITING -> COLLECTING
//      -> [TRANSFERRING_OUT] -> FINALIZING -> DONE | FAILED.
// FINALIZING is reached from every state and is the only place cleanup happens.
// Holds no per-request state: one instance serves any number of concurrent
// requests as long as the runtime does.
class ExecutionOrchestrator {
public:
    // tokens == nullptr disables the token check.
    // Throws std::invalid_argument if config.working_dir has no parent directory.
    ExecutionOrchestrator(const ServiceConfig& config, SandboxRuntime& runtime,
                          const TokenStore* tokens = nullptr);

    ExecutionReport execute(const ExecutionRequest& request) const;

private:
    ExecutionOutcome run(const ValidatedRequest& request,
                         ExecutionReport& report,
                         std::unique_ptr<Workspace>& workspace,
                         SandboxLease& sandbox) const;

    OutputPayload collect_output(const ValidatedRequest& request,
                                 const SandboxHandle& handle,
                                 Workspace& workspace) const;

    const ServiceConfig& config_;
    SandboxRuntime& runtime_;
    RequestValidator validator_;
    std::string sandbox_parent_dir_;    // parent of config.working_dir
    std::string sandbox_dir_name_;      // last component of config.working_dir
};

} // namespace execbox
