#include "orchestrator.h"
#include "archiver.h"
#include "constants.h"
#include "token_store.h"
#include "workspace.h"
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace execbox {

namespace {

void enter(ExecutionReport& report, ExecutionState state) {
    report.states.push_back(state);
}

} // namespace

std::string execution_state_to_string(ExecutionState state) {
    switch (state) {
        case ExecutionState::IDLE: return "idle";
        case ExecutionState::PROVISIONING: return "provisioning";
        case ExecutionState::TRANSFERRING_IN: return "transferring_in";
        case ExecutionState::RUNNING: return "running";
        case ExecutionState::AWAITING: return "awaiting";
        case ExecutionState::COLLECTING: return "collecting";
        case ExecutionState::TRANSFERRING_OUT: return "transferring_out";
        case ExecutionState::FINALIZING: return "finalizing";
        case ExecutionState::DONE: return "done";
        case ExecutionState::FAILED: return "failed";
    }
    return "unknown";
}

void SandboxLease::acquire(SandboxHandle handle) {
    if (held_) {
        throw std::logic_error("Sandbox lease already holds " + handle_.id);
    }
    handle_ = std::move(handle);
    held_ = true;
}

void SandboxLease::release() noexcept {
    if (!held_) {
        return;
    }
    held_ = false;
    runtime_.force_remove(handle_);
}

ExecutionOrchestrator::ExecutionOrchestrator(const ServiceConfig& config,
                                             SandboxRuntime& runtime,
                                             const TokenStore* tokens)
    : config_(config), runtime_(runtime), validator_(config, tokens) {
    fs::path working_dir = fs::path(config_.working_dir).lexically_normal();
    if (!working_dir.is_absolute() || !working_dir.has_filename() ||
        working_dir.parent_path() == working_dir) {
        throw std::invalid_argument("Sandbox working directory must be an absolute path below /: " +
                                    config_.working_dir);
    }
    sandbox_parent_dir_ = working_dir.parent_path().string();
    sandbox_dir_name_ = working_dir.filename().string();
}

ExecutionReport ExecutionOrchestrator::execute(const ExecutionRequest& request) const {
    ExecutionReport report;
    enter(report, ExecutionState::IDLE);

    std::unique_ptr<Workspace> workspace;
    SandboxLease sandbox(runtime_);
    std::optional<ExecutionOutcome> outcome;
    std::optional<Failure> failure;

    try {
        ValidatedRequest validated = validator_.validate(request);
        outcome.emplace(run(validated, report, workspace, sandbox));
    } catch (const PayloadTooLargeError& e) {
        failure = Failure{e.kind(), e.what(), e.actual_size(), e.limit()};
    } catch (const ExecutionError& e) {
        failure = Failure{e.kind(), e.what()};
    } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] Internal failure: " << e.what() << std::endl;
        failure = Failure{FailureKind::ENGINE_UNAVAILABLE, INTERNAL_FAILURE_MESSAGE};
    }

    enter(report, ExecutionState::FINALIZING);
    sandbox.release();
    if (workspace) {
        try {
            workspace->destroy();
        } catch (const std::exception& e) {
            std::cerr << "[Orchestrator] Workspace cleanup failed: " << e.what() << std::endl;
        }
    }

    if (failure) {
        std::cout << "[Orchestrator] Failed (" << failure_kind_to_string(failure->kind)
                  << "): " << failure->message << std::endl;
        report.failure = std::move(failure);
        enter(report, ExecutionState::FAILED);
    } else {
        std::cout << "[Orchestrator] Finished with exit code " << outcome->exit_code()
                  << std::endl;
        report.outcome.emplace(std::move(*outcome));
        enter(report, ExecutionState::DONE);
    }
    return report;
}

ExecutionOutcome ExecutionOrchestrator::run(const ValidatedRequest& request,
                                            ExecutionReport& report,
                                            std::unique_ptr<Workspace>& workspace,
                                            SandboxLease& sandbox) const {
    enter(report, ExecutionState::PROVISIONING);
    workspace = Workspace::create(config_.workspace_root);
    workspace->write_code(request.code);
    workspace->write_manifest(request.requirements);
    std::cout << "[Orchestrator] Running " << request.language << " in " << request.image
              << std::endl;

    enter(report, ExecutionState::TRANSFERRING_IN);
    sandbox.acquire(runtime_.create_detached(request.image, config_.command, config_.working_dir));
    runtime_.copy_into(sandbox.handle(),
                       Archiver::pack(workspace->path(), sandbox_dir_name_),
                       sandbox_parent_dir_);

    enter(report, ExecutionState::RUNNING);
    runtime_.start(sandbox.handle());

    enter(report, ExecutionState::AWAITING);
    int exit_code = runtime_.await_completion(sandbox.handle(), config_.execution_timeout);

    enter(report, ExecutionState::COLLECTING);
    LogStreams logs = runtime_.read_logs(sandbox.handle());

    // A failed run reports its streams only
    OutputPayload output;
    if (exit_code == 0 && request.wants_output_file()) {
        enter(report, ExecutionState::TRANSFERRING_OUT);
        output = collect_output(request, sandbox.handle(), *workspace);
    }

    return ResultAssembler::assemble(exit_code, logs.stdout_bytes, logs.stderr_bytes,
                                     std::move(output), request.output_format);
}

OutputPayload ExecutionOrchestrator::collect_output(const ValidatedRequest& request,
                                                    const SandboxHandle& handle,
                                                    Workspace& workspace) const {
    std::string sandbox_path = config_.working_dir + "/" + request.output_file;
    size_t limit = config_.max_output_bytes;
    ArchiveStream stream = runtime_.copy_out_of(handle, sandbox_path, limit);

    // Engine-reported size is checked again before anything is unpacked on the host
    if (limit > 0 && stream.declared_size > limit) {
        throw PayloadTooLargeError("File " + request.output_file + " is " +
                                       std::to_string(stream.declared_size) +
                                       " bytes, (max size is " + std::to_string(limit) +
                                       " bytes)",
                                   stream.declared_size, limit);
    }

    Archiver::unpack(stream.data, workspace.path(), limit);
    return ResultAssembler::interpret_output(workspace.read_file(request.output_file),
                                             request.output_format);
}

} // namespace execbox
