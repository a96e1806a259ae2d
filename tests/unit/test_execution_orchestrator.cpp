#include <gtest/gtest.h>
#include "orchestrator.h"
#include "archiver.h"
#include "encoding.h"
#include "errors.h"
#include "token_store.h"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace fs = std::filesystem;

namespace execbox {
namespace {

// In-memory runtime; every step can be made to fail
class FakeRuntime : public SandboxRuntime {
public:
    // Behaviour
    int exit_code = 0;
    std::string stdout_bytes;
    std::string stderr_bytes;
    std::map<std::string, ArchiveStream> files;   // sandbox path -> archive
    std::string fail_step;                        // "create", "copy_into", "start", "await", "logs", "copy_out"
    FailureKind fail_kind = FailureKind::ENGINE_UNAVAILABLE;
    bool fail_unexpectedly = false;               // throw std::runtime_error instead
    bool enforce_output_ceiling = false;          // reject from the stat, as the engine does
    size_t log_limit = 0;                         // 0 = unlimited

    // Observations
    std::atomic<int> creates{0};
    std::atomic<int> starts{0};
    std::atomic<int> log_reads{0};
    std::atomic<int> copies_out{0};
    std::string last_image;
    std::string last_command;
    std::string last_working_dir;
    std::string last_archive;
    std::string last_dest_dir;
    std::atomic<size_t> last_max_bytes{0};
    std::chrono::seconds last_timeout{0};

    SandboxHandle create_detached(const std::string& image, const std::string& command,
                                  const std::string& working_dir) override {
        maybe_fail("create");
        std::lock_guard<std::mutex> lock(mutex_);
        last_image = image;
        last_command = command;
        last_working_dir = working_dir;
        SandboxHandle handle{"sandbox-" + std::to_string(++creates)};
        removals_[handle.id] = 0;
        return handle;
    }

    void copy_into(const SandboxHandle& handle, const std::string& archive,
                   const std::string& dest_dir) override {
        expect_live(handle);
        maybe_fail("copy_into");
        std::lock_guard<std::mutex> lock(mutex_);
        last_archive = archive;
        last_dest_dir = dest_dir;
    }

    void start(const SandboxHandle& handle) override {
        expect_live(handle);
        maybe_fail("start");
        starts++;
    }

    int await_completion(const SandboxHandle& handle, std::chrono::seconds timeout) override {
        expect_live(handle);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_timeout = timeout;
        }
        if (fail_step == "await" && fail_kind == FailureKind::EXECUTION_TIMED_OUT) {
            throw ExecutionError(FailureKind::EXECUTION_TIMED_OUT,
                                 "Execution time has passed the limit of " +
                                     std::to_string(timeout.count()) + " seconds.");
        }
        maybe_fail("await");
        return exit_code;
    }

    LogStreams read_logs(const SandboxHandle& handle) override {
        expect_live(handle);
        maybe_fail("logs");
        log_reads++;
        size_t size = stdout_bytes.size() + stderr_bytes.size();
        if (log_limit > 0 && size > log_limit) {
            throw PayloadTooLargeError("Program output is " + std::to_string(size) +
                                           " bytes, (max size is " + std::to_string(log_limit) +
                                           " bytes)",
                                       size, log_limit);
        }
        return LogStreams{stdout_bytes, stderr_bytes};
    }

    ArchiveStream copy_out_of(const SandboxHandle& handle, const std::string& path,
                              size_t max_bytes) override {
        expect_live(handle);
        maybe_fail("copy_out");
        copies_out++;
        last_max_bytes = max_bytes;
        auto it = files.find(path);
        if (it == files.end()) {
            throw ExecutionError(FailureKind::NOT_FOUND,
                                 "Could not find the file " + path + " in the sandbox.");
        }
        if (enforce_output_ceiling && max_bytes > 0 && it->second.declared_size > max_bytes) {
            throw PayloadTooLargeError("File " + it->second.name + " is " +
                                           std::to_string(it->second.declared_size) +
                                           " bytes, (max size is " + std::to_string(max_bytes) +
                                           " bytes)",
                                       it->second.declared_size, max_bytes);
        }
        return it->second;
    }

    void force_remove(const SandboxHandle& handle) noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        removals_[handle.id]++;
    }

    // Removal count per created sandbox
    std::map<std::string, int> removals() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return removals_;
    }

    int total_removals() const {
        int total = 0;
        for (const auto& [id, count] : removals()) total += count;
        return total;
    }

private:
    void maybe_fail(const std::string& step) {
        if (fail_step != step) return;
        if (fail_unexpectedly) {
            throw std::runtime_error("simulated engine crash during " + step);
        }
        throw ExecutionError(fail_kind, "simulated failure during " + step);
    }

    void expect_live(const SandboxHandle& handle) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = removals_.find(handle.id);
        EXPECT_TRUE(it != removals_.end() && it->second == 0)
            << "Sandbox " << handle.id << " used after removal";
    }

    mutable std::mutex mutex_;
    std::map<std::string, int> removals_;
};

class ExecutionOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / "execbox_orchestrator_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "workspaces");
        fs::create_directories(test_dir / "files");
        config.workspace_root = (test_dir / "workspaces").string();
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    ExecutionRequest request_for(const std::string& code) {
        ExecutionRequest request;
        request.language = "py37";
        request.code = Encoding::base64_encode(code);
        return request;
    }

    // What the engine hands back for a file the program wrote
    ArchiveStream sandbox_file(const std::string& name, const std::string& content) {
        fs::path path = test_dir / "files" / name;
        {
            std::ofstream out(path, std::ios::binary);
            out << content;
        }
        ArchiveStream stream;
        stream.data = Archiver::pack(path.string());
        stream.name = name;
        stream.declared_size = content.size();
        return stream;
    }

    bool workspaces_cleaned() {
        return fs::is_empty(test_dir / "workspaces");
    }

    fs::path test_dir;
    ServiceConfig config;
    FakeRuntime runtime;
};

// ============================================================================
// Successful runs
// ============================================================================

TEST_F(ExecutionOrchestratorTest, PrintProgram_ReturnsTrimmedStdout) {
    // Given: A program that prints a line
    runtime.stdout_bytes = "hi\n";
    ExecutionOrchestrator orchestrator(config, runtime);

    // When: Executing it
    ExecutionReport report = orchestrator.execute(request_for("print('hi')"));

    // Then: The outcome carries the trimmed output and nothing else
    ASSERT_TRUE(report.ok());
    EXPECT_FALSE(report.failure.has_value());
    EXPECT_TRUE(report.outcome->succeeded());
    EXPECT_EQ(report.outcome->exit_code(), 0);
    EXPECT_EQ(report.outcome->stdout_text(), "hi");
    EXPECT_EQ(report.outcome->stderr_text(), "");
    EXPECT_EQ(report.outcome->output().kind, OutputPayload::Kind::ABSENT);

    // And: Exactly one sandbox was created and removed, the workspace is gone
    EXPECT_EQ(runtime.creates.load(), 1);
    EXPECT_EQ(runtime.removals().at("sandbox-1"), 1);
    EXPECT_EQ(runtime.copies_out.load(), 0);
    EXPECT_TRUE(workspaces_cleaned());
}

TEST_F(ExecutionOrchestratorTest, PrintProgram_VisitsStatesInOrder) {
    ExecutionOrchestrator orchestrator(config, runtime);

    ExecutionReport report = orchestrator.execute(request_for("print('hi')"));

    std::vector<ExecutionState> expected = {
        ExecutionState::IDLE,       ExecutionState::PROVISIONING, ExecutionState::TRANSFERRING_IN,
        ExecutionState::RUNNING,    ExecutionState::AWAITING,     ExecutionState::COLLECTING,
        ExecutionState::FINALIZING, ExecutionState::DONE};
    EXPECT_EQ(report.states, expected);
}

TEST_F(ExecutionOrchestratorTest, SandboxReceivesCodeAndManifest) {
    ExecutionRequest request = request_for("print('hi')");
    request.requirements = "requests\n";
    ExecutionOrchestrator orchestrator(config, runtime);

    ASSERT_TRUE(orchestrator.execute(request).ok());

    // Created from the language's image with the configured command and directory
    EXPECT_EQ(runtime.last_image, "python:3.7-slim");
    EXPECT_EQ(runtime.last_command, config.command);
    EXPECT_EQ(runtime.last_working_dir, "/usr/src/app");
    EXPECT_EQ(runtime.last_timeout, config.execution_timeout);

    // The archive lands in the parent directory and unpacks to the working directory
    EXPECT_EQ(runtime.last_dest_dir, "/usr/src");
    fs::path unpacked = test_dir / "files" / "unpacked";
    Archiver::unpack(runtime.last_archive, unpacked.string(), 0);
    std::ifstream code(unpacked / "app" / "run.py");
    std::ifstream manifest(unpacked / "app" / "requirements.txt");
    std::string code_text((std::istreambuf_iterator<char>(code)), std::istreambuf_iterator<char>());
    std::string manifest_text((std::istreambuf_iterator<char>(manifest)),
                              std::istreambuf_iterator<char>());
    EXPECT_EQ(code_text, "print('hi')");
    EXPECT_EQ(manifest_text, "requests\n");
}

TEST_F(ExecutionOrchestratorTest, EmptyManifestStillShipped) {
    ExecutionOrchestrator orchestrator(config, runtime);

    ASSERT_TRUE(orchestrator.execute(request_for("print(1)")).ok());

    std::vector<TarEntry> entries = Archiver::list(runtime.last_archive);
    bool has_manifest = false;
    for (const auto& entry : entries) {
        if (entry.name == "app/requirements.txt") has_manifest = true;
    }
    EXPECT_TRUE(has_manifest);
}

TEST_F(ExecutionOrchestratorTest, JsonOutputFile_IsParsed) {
    // Given: A program that writes out.json
    runtime.files["/usr/src/app/out.json"] = sandbox_file("out.json", "{\"a\": 1}");
    ExecutionRequest request = request_for("import json; json.dump({'a': 1}, open('out.json', 'w'))");
    request.output_file = "out.json";
    request.output_format = "json";
    ExecutionOrchestrator orchestrator(config, runtime);

    // When: Executing it
    ExecutionReport report = orchestrator.execute(request);

    // Then: The parsed document is returned
    ASSERT_TRUE(report.ok()) << report.failure->message;
    const OutputPayload& output = report.outcome->output();
    ASSERT_EQ(output.kind, OutputPayload::Kind::JSON);
    EXPECT_EQ(output.json["a"].asInt(), 1);
    EXPECT_EQ(report.outcome->output_format(), OutputFormat::JSON);
    EXPECT_EQ(runtime.copies_out.load(), 1);
    EXPECT_NE(std::find(report.states.begin(), report.states.end(),
                        ExecutionState::TRANSFERRING_OUT),
              report.states.end());
    EXPECT_TRUE(workspaces_cleaned());
}

TEST_F(ExecutionOrchestratorTest, BinaryOutputFile_DefaultsToBase64) {
    runtime.files["/usr/src/app/img.png"] = sandbox_file("img.png", std::string("\x89PNG", 4));
    ExecutionRequest request = request_for("...");
    request.output_file = "img.png";
    ExecutionOrchestrator orchestrator(config, runtime);

    ExecutionReport report = orchestrator.execute(request);

    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report.outcome->output().kind, OutputPayload::Kind::BASE64);
    EXPECT_EQ(report.outcome->output().data, "iVBORw==");
}

TEST_F(ExecutionOrchestratorTest, TextOutputFile) {
    runtime.files["/usr/src/app/out.txt"] = sandbox_file("out.txt", "line one\nline two\n");
    ExecutionRequest request = request_for("...");
    request.output_file = "out.txt";
    request.output_format = "text";
    ExecutionOrchestrator orchestrator(config, runtime);

    ExecutionReport report = orchestrator.execute(request);

    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report.outcome->output().data, "line one\nline two\n");
}

// ============================================================================
// Program failures
// ============================================================================

TEST_F(ExecutionOrchestratorTest, NonZeroExit_SkipsOutputFile) {
    // Given: A program that raises before writing its output
    runtime.exit_code = 1;
    runtime.stderr_bytes = "Traceback (most recent call last):\nNameError: name 'x' is not defined\n";
    ExecutionRequest request = request_for("raise_error()");
    request.output_file = "out.json";
    ExecutionOrchestrator orchestrator(config, runtime);

    // When: Executing it
    ExecutionReport report = orchestrator.execute(request);

    // Then: An outcome, not a failure, with the traceback and no output
    ASSERT_TRUE(report.ok());
    EXPECT_FALSE(report.outcome->succeeded());
    EXPECT_EQ(report.outcome->exit_code(), 1);
    EXPECT_NE(report.outcome->stderr_text().find("NameError"), std::string::npos);
    EXPECT_EQ(report.outcome->output().kind, OutputPayload::Kind::ABSENT);
    EXPECT_EQ(runtime.copies_out.load(), 0);
    EXPECT_EQ(runtime.total_removals(), 1);
}

TEST_F(ExecutionOrchestratorTest, Timeout_FailsAndCleansUp) {
    // Given: A program that outlives the ceiling
    config.execution_timeout = std::chrono::seconds(1);
    runtime.fail_step = "await";
    runtime.fail_kind = FailureKind::EXECUTION_TIMED_OUT;
    ExecutionOrchestrator orchestrator(config, runtime);

    // When: Executing it
    ExecutionReport report = orchestrator.execute(request_for("while True: pass"));

    // Then: The failure names the ceiling and nothing was collected
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.failure->kind, FailureKind::EXECUTION_TIMED_OUT);
    EXPECT_EQ(report.failure->message, "Execution time has passed the limit of 1 seconds.");
    EXPECT_EQ(runtime.log_reads.load(), 0);
    EXPECT_EQ(runtime.removals().at("sandbox-1"), 1);
    EXPECT_TRUE(workspaces_cleaned());
    EXPECT_EQ(report.states.back(), ExecutionState::FAILED);
    EXPECT_EQ(report.states[report.states.size() - 2], ExecutionState::FINALIZING);
}

TEST_F(ExecutionOrchestratorTest, OversizedOutput_RejectedFromEngineStat) {
    // Given: A 5 MB output file against a 4 MB ceiling
    ArchiveStream big;
    big.data = "not inspected";
    big.name = "big.bin";
    big.declared_size = 5 * 1024 * 1024;
    runtime.files["/usr/src/app/big.bin"] = big;
    ExecutionRequest request = request_for("...");
    request.output_file = "big.bin";
    ExecutionOrchestrator orchestrator(config, runtime);

    // When: Executing it
    ExecutionReport report = orchestrator.execute(request);

    // Then: PayloadTooLarge with both sizes
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.failure->kind, FailureKind::PAYLOAD_TOO_LARGE);
    EXPECT_EQ(report.failure->actual_size, 5u * 1024u * 1024u);
    EXPECT_EQ(report.failure->limit, 4u * 1024u * 1024u);
    EXPECT_EQ(report.failure->message, "File big.bin is 5242880 bytes, (max size is 4194304 bytes)");
    EXPECT_EQ(runtime.total_removals(), 1);
    EXPECT_TRUE(workspaces_cleaned());
}

TEST_F(ExecutionOrchestratorTest, OversizedOutput_RejectedFromArchiveHeaders) {
    // Given: An engine that does not report the size
    config.max_output_bytes = 10;
    ArchiveStream stream = sandbox_file("out.txt", std::string(11, 'x'));
    stream.declared_size = 0;
    runtime.files["/usr/src/app/out.txt"] = stream;
    ExecutionRequest request = request_for("...");
    request.output_file = "out.txt";
    ExecutionOrchestrator orchestrator(config, runtime);

    ExecutionReport report = orchestrator.execute(request);

    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.failure->kind, FailureKind::PAYLOAD_TOO_LARGE);
    EXPECT_EQ(report.failure->actual_size, 11u);
    EXPECT_EQ(report.failure->limit, 10u);
}

TEST_F(ExecutionOrchestratorTest, OutputCeiling_HandedToRuntime) {
    // Given: A runtime that rejects oversized files from the engine's stat
    runtime.enforce_output_ceiling = true;
    ArchiveStream huge;
    huge.name = "out.txt";
    huge.declared_size = 73400320;
    runtime.files["/usr/src/app/out.txt"] = huge;
    ExecutionRequest request = request_for("...");
    request.output_file = "out.txt";
    ExecutionOrchestrator orchestrator(config, runtime);

    // When: Executing it
    ExecutionReport report = orchestrator.execute(request);

    // Then: The configured ceiling reached the runtime and the failure keeps both sizes
    EXPECT_EQ(runtime.last_max_bytes.load(), MAX_OUTPUT_FILESIZE);
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.failure->kind, FailureKind::PAYLOAD_TOO_LARGE);
    EXPECT_EQ(report.failure->actual_size, 73400320u);
    EXPECT_EQ(report.failure->limit, MAX_OUTPUT_FILESIZE);
    EXPECT_EQ(report.failure->message, "File out.txt is 73400320 bytes, (max size is 4194304 bytes)");
    EXPECT_EQ(runtime.total_removals(), 1);
    EXPECT_TRUE(workspaces_cleaned());
}

TEST_F(ExecutionOrchestratorTest, UnlimitedOutputCeiling_AcceptsLargeFile) {
    config.max_output_bytes = 0;
    runtime.enforce_output_ceiling = true;
    ArchiveStream stream = sandbox_file("out.txt", std::string(5000, 'x'));
    stream.declared_size = 73400320;
    runtime.files["/usr/src/app/out.txt"] = stream;
    ExecutionRequest request = request_for("...");
    request.output_file = "out.txt";
    request.output_format = "text";
    ExecutionOrchestrator orchestrator(config, runtime);

    ExecutionReport report = orchestrator.execute(request);

    EXPECT_EQ(runtime.last_max_bytes.load(), 0u);
    ASSERT_TRUE(report.ok()) << report.failure->message;
    EXPECT_EQ(report.outcome->output().data, std::string(5000, 'x'));
}

TEST_F(ExecutionOrchestratorTest, OversizedLogs_IsPayloadTooLarge) {
    // Given: A program whose streams outgrow the runtime's log ceiling
    runtime.stdout_bytes = std::string(2048, 'x');
    runtime.log_limit = 1024;
    ExecutionOrchestrator orchestrator(config, runtime);

    // When: Executing it
    ExecutionReport report = orchestrator.execute(request_for("print('x' * 2048)"));

    // Then: A size violation, not an engine outage, and cleanup still ran
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.failure->kind, FailureKind::PAYLOAD_TOO_LARGE);
    EXPECT_EQ(report.failure->actual_size, 2048u);
    EXPECT_EQ(report.failure->limit, 1024u);
    EXPECT_EQ(runtime.total_removals(), 1);
    EXPECT_TRUE(workspaces_cleaned());
}

TEST_F(ExecutionOrchestratorTest, MissingOutputFile_IsNotFound) {
    ExecutionRequest request = request_for("print('forgot to write')");
    request.output_file = "out.json";
    ExecutionOrchestrator orchestrator(config, runtime);

    ExecutionReport report = orchestrator.execute(request);

    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.failure->kind, FailureKind::NOT_FOUND);
    EXPECT_EQ(runtime.total_removals(), 1);
}

TEST_F(ExecutionOrchestratorTest, InvalidJsonOutput_IsParseError) {
    runtime.files["/usr/src/app/out.json"] = sandbox_file("out.json", "{not json");
    ExecutionRequest request = request_for("...");
    request.output_file = "out.json";
    request.output_format = "json";
    ExecutionOrchestrator orchestrator(config, runtime);

    ExecutionReport report = orchestrator.execute(request);

    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.failure->kind, FailureKind::OUTPUT_PARSE_ERROR);
    EXPECT_EQ(runtime.total_removals(), 1);
    EXPECT_TRUE(workspaces_cleaned());
}

// ============================================================================
// Rejected requests
// ============================================================================

TEST_F(ExecutionOrchestratorTest, InvalidRequest_NeverTouchesEngine) {
    ExecutionRequest request = request_for("print(1)");
    request.language = "cobol";
    ExecutionOrchestrator orchestrator(config, runtime);

    ExecutionReport report = orchestrator.execute(request);

    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.failure->kind, FailureKind::INVALID_INPUT);
    EXPECT_EQ(runtime.creates.load(), 0);
    EXPECT_EQ(runtime.total_removals(), 0);
    EXPECT_TRUE(workspaces_cleaned());
    std::vector<ExecutionState> expected = {ExecutionState::IDLE, ExecutionState::FINALIZING,
                                            ExecutionState::FAILED};
    EXPECT_EQ(report.states, expected);
}

TEST_F(ExecutionOrchestratorTest, OversizedRequest_IsPayloadTooLarge) {
    config.max_request_bytes = 8;
    ExecutionOrchestrator orchestrator(config, runtime);

    ExecutionReport report = orchestrator.execute(request_for("print('this is long enough')"));

    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.failure->kind, FailureKind::PAYLOAD_TOO_LARGE);
    EXPECT_EQ(report.failure->limit, 8u);
    EXPECT_GT(report.failure->actual_size, 8u);
    EXPECT_EQ(runtime.creates.load(), 0);
}

TEST_F(ExecutionOrchestratorTest, TokenRequired_WhenStoreGiven) {
    TokenStore tokens({"letmein"});
    ExecutionOrchestrator orchestrator(config, runtime, &tokens);

    ExecutionReport denied = orchestrator.execute(request_for("print(1)"));
    ASSERT_FALSE(denied.ok());
    EXPECT_EQ(denied.failure->kind, FailureKind::UNAUTHORIZED);

    ExecutionRequest request = request_for("print(1)");
    request.token = "letmein";
    EXPECT_TRUE(orchestrator.execute(request).ok());
}

// ============================================================================
// Engine failures at every step
// ============================================================================

TEST_F(ExecutionOrchestratorTest, CreateFailure_NothingToRemove) {
    runtime.fail_step = "create";
    ExecutionOrchestrator orchestrator(config, runtime);

    ExecutionReport report = orchestrator.execute(request_for("print(1)"));

    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.failure->kind, FailureKind::ENGINE_UNAVAILABLE);
    EXPECT_EQ(runtime.total_removals(), 0);
    EXPECT_TRUE(workspaces_cleaned());
}

TEST_F(ExecutionOrchestratorTest, FailureAfterCreate_RemovesSandboxOnce) {
    for (const std::string step : {"copy_into", "start", "await", "logs"}) {
        FakeRuntime failing;
        failing.fail_step = step;
        ExecutionOrchestrator orchestrator(config, failing);

        ExecutionReport report = orchestrator.execute(request_for("print(1)"));

        ASSERT_FALSE(report.ok()) << step;
        EXPECT_EQ(report.failure->kind, FailureKind::ENGINE_UNAVAILABLE) << step;
        EXPECT_EQ(failing.removals().at("sandbox-1"), 1) << step;
        EXPECT_TRUE(workspaces_cleaned()) << step;
    }
}

TEST_F(ExecutionOrchestratorTest, UnexpectedException_BecomesEngineUnavailable) {
    runtime.fail_step = "start";
    runtime.fail_unexpectedly = true;
    ExecutionOrchestrator orchestrator(config, runtime);

    ExecutionReport report = orchestrator.execute(request_for("print(1)"));

    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.failure->kind, FailureKind::ENGINE_UNAVAILABLE);
    EXPECT_EQ(report.failure->message.find("simulated"), std::string::npos)
        << "Internal detail must not reach the caller";
    EXPECT_EQ(runtime.total_removals(), 1);
}

TEST_F(ExecutionOrchestratorTest, UnusableWorkspaceRoot_IsResourceExhausted) {
    config.workspace_root = (test_dir / "missing").string();
    ExecutionOrchestrator orchestrator(config, runtime);

    ExecutionReport report = orchestrator.execute(request_for("print(1)"));

    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.failure->kind, FailureKind::RESOURCE_EXHAUSTED);
    EXPECT_EQ(runtime.creates.load(), 0);
}

TEST_F(ExecutionOrchestratorTest, WorkingDirWithoutParentIsRejected) {
    config.working_dir = "/";
    EXPECT_THROW({ ExecutionOrchestrator orchestrator(config, runtime); }, std::invalid_argument);

    config.working_dir = "relative/app";
    EXPECT_THROW({ ExecutionOrchestrator orchestrator(config, runtime); }, std::invalid_argument);
}

// ============================================================================
// Lease and concurrency
// ============================================================================

TEST_F(ExecutionOrchestratorTest, SandboxLease_ReleasesOnce) {
    SandboxHandle handle = runtime.create_detached("img", "cmd", "/w");
    {
        SandboxLease lease(runtime);
        EXPECT_FALSE(lease.held());
        lease.release();  // nothing held: no-op

        lease.acquire(handle);
        EXPECT_TRUE(lease.held());
        lease.release();
        lease.release();
    }
    EXPECT_EQ(runtime.removals().at(handle.id), 1);
    EXPECT_EQ(runtime.total_removals(), 1);
}

TEST_F(ExecutionOrchestratorTest, ConcurrentRequests_AreIndependent) {
    runtime.stdout_bytes = "ok";
    ExecutionOrchestrator orchestrator(config, runtime);
    constexpr int kRequests = 8;
    std::atomic<int> succeeded{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < kRequests; ++i) {
        threads.emplace_back([&orchestrator, &succeeded, this, i] {
            ExecutionReport report = orchestrator.execute(request_for("print(" + std::to_string(i) + ")"));
            if (report.ok() && report.outcome->stdout_text() == "ok") succeeded++;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(succeeded.load(), kRequests);
    std::map<std::string, int> removals = runtime.removals();
    EXPECT_EQ(removals.size(), static_cast<size_t>(kRequests)) << "One sandbox per request";
    for (const auto& [id, count] : removals) {
        EXPECT_EQ(count, 1) << id;
    }
    EXPECT_TRUE(workspaces_cleaned());
}

TEST(ExecutionStateTest, Names) {
    EXPECT_EQ(execution_state_to_string(ExecutionState::IDLE), "idle");
    EXPECT_EQ(execution_state_to_string(ExecutionState::TRANSFERRING_OUT), "transferring_out");
    EXPECT_EQ(execution_state_to_string(ExecutionState::FAILED), "failed");
}

} // namespace
} // namespace execbox
