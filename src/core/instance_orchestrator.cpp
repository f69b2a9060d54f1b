/**
 * @file instance_orchestrator.cpp
 * @brief Instance pipeline driver and batch execution
 *
 * **Pipeline**:
 * ```
 * [1/7] VALIDATION   definition complete, format known, limits sane
 * [2/7] IMAGE        resolve/build environment image (shared cache)
 * [3/7] CHECKOUT     fresh clone at the base commit (retried)
 * [4/7] PATCH        candidate patch, then test patch (all or nothing)
 * [5/7] SANDBOX      container bound to the workspace
 * [6/7] TEST RUN     test command under deadline
 * [7/7] PARSE        per-test verdicts
 * ```
 *
 * Ownership: the workspace and sandbox are locals of the pipeline, so both
 * are released (sandbox first) on every return path, including exceptions.
 *
 * @date 2025
 */

#include "patchbench/core/instance_orchestrator.hpp"
#include "patchbench/core/image_cache.hpp"
#include "patchbench/core/patch_applicator.hpp"
#include "patchbench/core/sandbox_engine.hpp"
#include "patchbench/core/test_runner.hpp"
#include "patchbench/core/worker_pool.hpp"
#include "patchbench/core/workspace_builder.hpp"
#include "patchbench/parsers/result_parser.hpp"
#include "patchbench/reporters/json_reporter.hpp"
#include "patchbench/utils/hash_utils.hpp"
#include "patchbench/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <atomic>
#include <fstream>
#include <map>
#include <mutex>
#include <sstream>

namespace patchbench {
namespace core {

using utils::StringUtils;

namespace {

/**
 * @class InstanceLog
 * @brief Stage transcript: global logger plus run_instance.log
 */
class InstanceLog {
public:
    InstanceLog(std::string instance_id, const std::filesystem::path& file)
        : instance_id_(std::move(instance_id)) {
        if (file.empty()) {
            return;
        }

        try {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string(), true);
            logger_ = std::make_shared<spdlog::logger>("instance." + instance_id_, sink);
            logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            logger_->set_level(spdlog::level::debug);
            logger_->flush_on(spdlog::level::info);
        }
        catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("[{}] Cannot open instance log {}: {}", instance_id_, file.string(), e.what());
        }
    }

    ~InstanceLog() {
        if (logger_) {
            logger_->flush();
        }
    }

    template <typename... Args>
    void Log(spdlog::level::level_enum level, spdlog::format_string_t<Args...> format, Args&&... args) {
        std::string message = fmt::format(format, std::forward<Args>(args)...);
        spdlog::log(level, "[{}] {}", instance_id_, message);
        if (logger_) {
            logger_->log(level, message);
        }
    }

    template <typename... Args>
    void Info(spdlog::format_string_t<Args...> format, Args&&... args) {
        Log(spdlog::level::info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Debug(spdlog::format_string_t<Args...> format, Args&&... args) {
        Log(spdlog::level::debug, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Warn(spdlog::format_string_t<Args...> format, Args&&... args) {
        Log(spdlog::level::warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Error(spdlog::format_string_t<Args...> format, Args&&... args) {
        Log(spdlog::level::err, format, std::forward<Args>(args)...);
    }

private:
    std::string instance_id_;
    std::shared_ptr<spdlog::logger> logger_;
};

bool WriteArtifact(const std::filesystem::path& dir, const std::string& name, const std::string& content) {
    if (dir.empty()) {
        return false;
    }

    std::ofstream file(dir / name, std::ios::binary | std::ios::trunc);
    if (!file) {
        spdlog::warn("Cannot write artifact {}", (dir / name).string());
        return false;
    }
    file << content;
    return static_cast<bool>(file);
}

std::string FormatTestOutput(const std::string& command, const RawExecutionOutput& output) {
    std::ostringstream oss;
    oss << "$ " << command << "\n"
        << "exit_code: " << output.exit_code << "\n"
        << "timed_out: " << (output.timed_out ? "true" : "false") << "\n"
        << "truncated: " << (output.truncated ? "true" : "false") << "\n"
        << "duration_ms: " << output.duration.count() << "\n"
        << "\n--- stdout ---\n" << output.stdout_output
        << "\n--- stderr ---\n" << output.stderr_output << "\n";
    return oss.str();
}

std::string DescribeRejection(const PatchApplicationResult& patch) {
    std::string cause = patch.reason;
    if (!patch.rejected_hunks.empty()) {
        cause += ": " + StringUtils::Join(patch.rejected_hunks, "; ");
    }
    return cause;
}

void Fail(InstanceResult& result, InstanceLog& log, const StageFailure& failure) {
    result.failure = failure;
    result.status = StatusForFailure(failure);
    log.Error("{} failed ({}): {}", ToString(failure.stage), ToString(failure.kind), failure.cause);
}

} // anonymous namespace

// ============================================================================
// PRIVATE IMPLEMENTATION (PIMPL PATTERN)
// ============================================================================

class InstanceOrchestrator::Impl {
public:
    Impl(const HarnessConfig& config, std::shared_ptr<utils::ContainerRuntime> runtime_in)
        : runtime(std::move(runtime_in)) {
        ImageCacheOptions cache_options;
        cache_options.cache_dir = config.cache_dir;
        cache_options.retry = RetryPolicy{config.image_build_retries, config.retry_backoff};
        cache_options.build_timeout = config.image_build_timeout;
        image_cache = std::make_unique<ImageCacheManager>(runtime, cache_options);

        WorkspaceOptions workspace_options;
        workspace_options.work_root = config.work_dir;
        workspace_options.retry = RetryPolicy{config.checkout_retries, config.retry_backoff};
        workspace_options.command_timeout = config.checkout_timeout;
        workspace_builder = std::make_unique<WorkspaceBuilder>(workspace_options);

        SandboxOptions sandbox_options;
        sandbox_options.user = config.sandbox_user;
        sandbox_options.allow_network = config.allow_network;
        sandbox_options.container_workdir = config.container_workdir;
        sandbox_options.stop_grace = config.stop_grace;
        sandbox_options.run_id = config.run_id;
        sandbox_engine = std::make_unique<SandboxEngine>(runtime, sandbox_options);
    }

    std::shared_ptr<utils::CancellationToken> Register(const std::string& instance_id) {
        auto token = std::make_shared<utils::CancellationToken>(&root_cancel);
        std::lock_guard<std::mutex> lock(tokens_mutex);
        active_tokens.emplace(instance_id, token);
        return token;
    }

    void Unregister(const std::string& instance_id, const std::shared_ptr<utils::CancellationToken>& token) {
        std::lock_guard<std::mutex> lock(tokens_mutex);
        auto range = active_tokens.equal_range(instance_id);
        for (auto it = range.first; it != range.second; ++it) {
            if (it->second == token) {
                active_tokens.erase(it);
                break;
            }
        }
    }

    void Execute(const HarnessConfig& config,
                 const InstanceSpec& spec,
                 const utils::CancellationToken& cancel,
                 InstanceLog& log,
                 const std::filesystem::path& log_dir,
                 InstanceResult& result);

    std::shared_ptr<utils::ContainerRuntime> runtime;
    std::unique_ptr<ImageCacheManager> image_cache;
    std::unique_ptr<WorkspaceBuilder> workspace_builder;
    std::unique_ptr<SandboxEngine> sandbox_engine;
    TestRunner test_runner;
    parsers::ResultParser result_parser;
    reporters::JsonReporter json_reporter;

    utils::CancellationToken root_cancel;
    std::mutex tokens_mutex;
    std::multimap<std::string, std::shared_ptr<utils::CancellationToken>> active_tokens;

    std::atomic<bool> is_initialized{false};
    std::atomic<int> active_instance_count{0};
};

namespace {

std::string ResolveFormat(const HarnessConfig& config, const InstanceSpec& spec) {
    return spec.test_format.empty() ? config.default_test_format : spec.test_format;
}

StageResult<Done> Preflight(const InstanceSpec& spec, const std::string& format,
                            const ResourceLimits& limits) {
    std::vector<std::string> problems;

    if (spec.instance_id.empty()) problems.push_back("missing instance_id");
    if (spec.repo.empty()) problems.push_back("missing repo");
    if (spec.base_commit.empty()) {
        problems.push_back("missing base_commit");
    } else if (!WorkspaceBuilder::IsSafeCommitReference(spec.base_commit)) {
        problems.push_back("base_commit must be a commit reference");
    }
    if (spec.test_cmd.empty()) problems.push_back("missing test_cmd");
    if (spec.image.base.empty() && spec.image.dockerfile.empty()) problems.push_back("missing image");
    if (limits.memory_mb == 0) problems.push_back("memory limit must be positive");
    if (limits.cpus <= 0.0) problems.push_back("cpu limit must be positive");
    if (limits.timeout.count() <= 0) problems.push_back("timeout must be positive");

    if (!problems.empty()) {
        return MakeFailure(Stage::VALIDATION, FailureKind::INVALID_DEFINITION,
                           StringUtils::Join(problems, "; "));
    }

    if (!parsers::ResultParser::IsSupportedFormat(format)) {
        return MakeFailure(Stage::VALIDATION, FailureKind::PARSER_FORMAT_ERROR,
                           "unknown test output format '" + format + "'");
    }

    return Done{};
}

std::optional<StageFailure> CancelledAt(Stage stage, const utils::CancellationToken& cancel) {
    if (cancel.IsCancelled()) {
        return MakeFailure(stage, FailureKind::CANCELLED, "cancelled");
    }
    return std::nullopt;
}

StageFailure PatchFailure(Stage stage, const PatchApplicationResult& patch) {
    return MakeFailure(stage,
                       patch.outcome == PatchOutcome::PARTIALLY_APPLIED ? FailureKind::PATCH_PARTIALLY_APPLIED
                                                                         : FailureKind::PATCH_REJECTED,
                       DescribeRejection(patch));
}

} // anonymous namespace

void InstanceOrchestrator::Impl::Execute(const HarnessConfig& config,
                                         const InstanceSpec& spec,
                                         const utils::CancellationToken& cancel,
                                         InstanceLog& log,
                                         const std::filesystem::path& log_dir,
                                         InstanceResult& result) {
    std::string format = ResolveFormat(config, spec);
    ResourceLimits limits = EffectiveLimits(config, spec);
    int fuzz = EffectiveFuzz(config, spec);

    log.Info("[1/7] VALIDATION");
    auto preflight = Preflight(spec, format, limits);
    if (!Succeeded(preflight)) {
        return Fail(result, log, FailureOf(preflight));
    }
    if (auto cancelled = CancelledAt(Stage::VALIDATION, cancel)) {
        return Fail(result, log, *cancelled);
    }

    log.Info("[2/7] IMAGE {}{}", spec.image.base, spec.image.dockerfile.empty() ? "" : " + dockerfile");
    auto image = image_cache->Resolve(spec.image, &cancel);
    if (!Succeeded(image)) {
        return Fail(result, log, FailureOf(image));
    }
    const ImageRef& image_ref = ValueOf(image);
    log.Info("Image ready: {}{}", image_ref.tag, image_ref.built ? " (built)" : "");

    log.Info("[3/7] CHECKOUT {} @ {}", spec.repo, spec.base_commit);
    auto staged = workspace_builder->Stage(spec.instance_id, spec.repo, spec.base_commit, &cancel);
    if (!Succeeded(staged)) {
        return Fail(result, log, FailureOf(staged));
    }
    std::unique_ptr<Workspace> workspace = std::move(ValueOf(staged));
    std::string base_tree = utils::HashUtils::ComputeTreeHash(workspace->Root());
    log.Debug("Workspace: {} (tree {})", workspace->Root().string(), base_tree.substr(0, 16));

    // A patch that does not apply never reaches the sandbox
    log.Info("[4/7] PATCH (fuzz {})", fuzz);
    PatchApplicator applicator(fuzz);

    WriteArtifact(log_dir, "patch.diff", spec.patch);
    auto patched = applicator.Apply(*workspace, spec.patch);
    if (!patched.Applied()) {
        if (utils::HashUtils::ComputeTreeHash(workspace->Root()) != base_tree) {
            log.Error("Rejected patch left the workspace modified");
        }
        return Fail(result, log, PatchFailure(Stage::PATCH, patched));
    }
    log.Info("Patch applied: {} hunk(s), {} file(s)", patched.applied_hunks, patched.modified_files.size());

    if (!spec.test_patch.empty()) {
        WriteArtifact(log_dir, "test_patch.diff", spec.test_patch);
        auto test_patched = applicator.Apply(*workspace, spec.test_patch);
        if (!test_patched.Applied()) {
            return Fail(result, log, PatchFailure(Stage::TEST_PATCH, test_patched));
        }
        log.Info("Test patch applied: {} hunk(s)", test_patched.applied_hunks);
    }

    if (auto cancelled = CancelledAt(Stage::SANDBOX, cancel)) {
        return Fail(result, log, *cancelled);
    }

    log.Info("[5/7] SANDBOX {} MiB, {} cpu(s)", limits.memory_mb, limits.cpus);
    auto created = sandbox_engine->Create(spec.instance_id, *workspace, image_ref.tag, limits, &cancel);
    if (!Succeeded(created)) {
        return Fail(result, log, FailureOf(created));
    }
    std::unique_ptr<SandboxHandle> sandbox = std::move(ValueOf(created));
    log.Debug("Sandbox {} ({})", sandbox->ContainerName(), sandbox->ContainerId().substr(0, 12));

    log.Info("[6/7] TEST RUN (timeout {}s)", limits.timeout.count());
    TestRunOptions run_options;
    run_options.timeout = limits.timeout;
    run_options.max_output_bytes = config.max_log_bytes;
    run_options.cancel = &cancel;

    auto ran = test_runner.Run(*sandbox, spec.test_cmd, run_options);
    sandbox->Release();

    if (!Succeeded(ran)) {
        return Fail(result, log, FailureOf(ran));
    }

    const RawExecutionOutput& output = ValueOf(ran);
    WriteArtifact(log_dir, "test_output.txt", FormatTestOutput(spec.test_cmd, output));
    log.Info("Test command exited {} after {} ms{}", output.exit_code, output.duration.count(),
             output.truncated ? " (output truncated)" : "");

    if (output.timed_out) {
        result.timed_out = true;
        for (const auto& test : spec.ExpectedTests()) {
            result.test_verdicts[test] = TestVerdict::FAIL;
        }
        result.failure = MakeFailure(Stage::TEST_RUN, FailureKind::TIMEOUT_EXCEEDED,
                                     "test command exceeded " + std::to_string(limits.timeout.count()) + "s");
        result.status = StatusForFailure(*result.failure);
        log.Warn("Timeout exceeded: {} expected test(s) marked Fail", result.test_verdicts.size());
        return;
    }

    log.Info("[7/7] PARSE ({})", format);
    auto parsed = result_parser.Parse(output, spec.ExpectedTests(), format);
    if (!Succeeded(parsed)) {
        return Fail(result, log, FailureOf(parsed));
    }

    result.test_verdicts = std::move(ValueOf(parsed));
    result.status = ComputeStatus(PatchOutcome::APPLIED, result.test_verdicts);
}

// ============================================================================
// LIFECYCLE
// ============================================================================

InstanceOrchestrator::InstanceOrchestrator(const HarnessConfig& config,
                                           std::shared_ptr<utils::ContainerRuntime> runtime)
    : config_(config) {
    if (config_.run_id.empty()) {
        config_.run_id = ConfigManager::GenerateRunId();
    }
    if (config_.work_dir.empty()) {
        config_.work_dir = HarnessConfig{}.work_dir;
    }

    impl_ = std::make_unique<Impl>(config_, std::move(runtime));
    spdlog::debug("Instance orchestrator created for run {}", config_.run_id);
}

InstanceOrchestrator::~InstanceOrchestrator() {
    Shutdown();
}

bool InstanceOrchestrator::Initialize(bool sweep) {
    spdlog::info("Initializing harness (run {})", config_.run_id);

    if (!impl_->runtime) {
        spdlog::error("No container runtime configured");
        return false;
    }

    if (!impl_->sandbox_engine->Initialize()) {
        spdlog::error("Container runtime {} is not available", impl_->runtime->Name());
        return false;
    }

    try {
        std::filesystem::create_directories(config_.cache_dir);
        std::filesystem::create_directories(config_.work_dir);
        std::filesystem::create_directories(RunDirectory());
    }
    catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to create working directories: {}", e.what());
        return false;
    }

    if (sweep) {
        std::size_t containers = impl_->sandbox_engine->SweepOrphans();
        std::size_t workspaces = impl_->workspace_builder->SweepStaleWorkspaces();
        if (containers > 0 || workspaces > 0) {
            spdlog::warn("Recovered {} orphaned container(s) and {} stale workspace(s)",
                         containers, workspaces);
        }
    }

    impl_->is_initialized.store(true);
    spdlog::info("Harness initialized: {} worker(s), runtime {}, logs in {}",
                 config_.workers, impl_->runtime->Name(), RunDirectory().string());
    return true;
}

void InstanceOrchestrator::Shutdown() {
    if (!impl_ || !impl_->is_initialized.exchange(false)) {
        return;
    }

    if (impl_->active_instance_count.load() > 0) {
        spdlog::warn("Shutting down with {} instance(s) in flight", impl_->active_instance_count.load());
        CancelAll();
    }
    spdlog::debug("Harness shut down");
}

// ============================================================================
// SINGLE INSTANCE
// ============================================================================

InstanceResult InstanceOrchestrator::RunInstance(const InstanceSpec& spec) {
    auto start = std::chrono::steady_clock::now();

    InstanceResult result;
    result.instance_id = spec.instance_id;

    std::filesystem::path log_dir = InstanceLogDirectory(spec.instance_id);
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
        spdlog::warn("[{}] Cannot create log directory {}: {}", spec.instance_id, log_dir.string(), ec.message());
        log_dir.clear();
    }
    result.log_ref = log_dir;

    impl_->active_instance_count++;
    auto token = impl_->Register(spec.instance_id);

    {
        InstanceLog log(spec.instance_id, log_dir.empty() ? log_dir : log_dir / "run_instance.log");

        try {
            if (!impl_->is_initialized.load()) {
                Fail(result, log, MakeFailure(Stage::VALIDATION, FailureKind::INTERNAL_ERROR,
                                              "harness not initialized"));
            } else {
                impl_->Execute(config_, spec, *token, log, log_dir, result);
            }
        }
        catch (const std::exception& e) {
            result.test_verdicts.clear();
            Fail(result, log, MakeFailure(Stage::REPORT, FailureKind::INTERNAL_ERROR, e.what()));
        }

        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        log.Info("Status: {} ({} verdict(s), {} ms)", ToString(result.status),
                 result.test_verdicts.size(), result.duration.count());
    }

    impl_->Unregister(spec.instance_id, token);
    impl_->active_instance_count--;

    if (!log_dir.empty()) {
        impl_->json_reporter.WriteInstanceReport(result, log_dir / "report.json");
    }

    return result;
}

InstanceResult InstanceOrchestrator::RejectInvalid(const std::string& instance_id,
                                                   const std::vector<std::string>& errors) const {
    InstanceResult result;
    result.instance_id = instance_id;
    result.failure = MakeFailure(Stage::VALIDATION, FailureKind::INVALID_DEFINITION,
                                 StringUtils::Join(errors, "; "));
    result.status = StatusForFailure(*result.failure);

    spdlog::error("[{}] Invalid definition: {}", instance_id.empty() ? "<unnamed>" : instance_id,
                  result.failure->cause);
    return result;
}

// ============================================================================
// BATCH
// ============================================================================

std::vector<InstanceResult> InstanceOrchestrator::RunAll(const std::vector<InstanceSpec>& specs,
                                                         ResultCallback on_result) {
    std::vector<InstanceResult> results;
    results.reserve(specs.size());

    auto deliver = [&](InstanceResult result) {
        if (on_result) {
            on_result(result);
        }
        results.push_back(std::move(result));
    };

    if (specs.empty()) {
        return results;
    }

    spdlog::info("Running {} instance(s) on {} worker(s)", specs.size(), config_.workers);

    WorkerPool pool(config_.workers);
    bool started = pool.Start([this](const InstanceSpec& spec, std::size_t) {
        return RunInstance(spec);
    });

    // Instances sharing an id would share a log directory
    std::map<std::filesystem::path, std::string> claimed;

    std::size_t submitted = 0;
    for (const auto& spec : specs) {
        auto [it, fresh] = claimed.emplace(InstanceLogDirectory(spec.instance_id), spec.instance_id);
        if (!fresh) {
            InstanceResult result;
            result.instance_id = spec.instance_id;
            result.failure = MakeFailure(Stage::VALIDATION, FailureKind::INVALID_DEFINITION,
                                         it->second == spec.instance_id
                                             ? "duplicate instance_id in batch"
                                             : "instance_id shares a log directory with " + it->second);
            result.status = StatusForFailure(*result.failure);
            spdlog::warn("[{}] Skipped: {}", spec.instance_id, result.failure->cause);
            deliver(std::move(result));
            continue;
        }

        if (started && pool.Submit(spec)) {
            submitted++;
            continue;
        }

        InstanceResult result;
        result.instance_id = spec.instance_id;
        result.failure = MakeFailure(Stage::VALIDATION, FailureKind::INTERNAL_ERROR,
                                     "worker pool unavailable");
        result.status = StatusForFailure(*result.failure);
        deliver(std::move(result));
    }

    pool.Close();

    std::size_t received = 0;
    while (auto result = pool.NextResult()) {
        received++;
        spdlog::info("[{}/{}] {}: {}", received, submitted, result->instance_id, ToString(result->status));
        deliver(std::move(*result));
    }

    pool.Join();

    spdlog::info("Batch complete: {} result(s), peak {} concurrent sandbox(es)",
                 results.size(), PeakConcurrentSandboxes());
    return results;
}

// ============================================================================
// CANCELLATION
// ============================================================================

bool InstanceOrchestrator::Cancel(const std::string& instance_id) {
    std::lock_guard<std::mutex> lock(impl_->tokens_mutex);

    auto range = impl_->active_tokens.equal_range(instance_id);
    if (range.first == range.second) {
        return false;
    }

    spdlog::warn("Cancelling instance: {}", instance_id);
    for (auto it = range.first; it != range.second; ++it) {
        it->second->Cancel();
    }
    return true;
}

void InstanceOrchestrator::CancelAll() noexcept {
    impl_->root_cancel.Cancel();
}

bool InstanceOrchestrator::IsCancelled() const noexcept {
    return impl_->root_cancel.IsCancelled();
}

// ============================================================================
// ACCESSORS
// ============================================================================

std::size_t InstanceOrchestrator::PeakConcurrentSandboxes() const {
    return impl_->sandbox_engine->PeakActiveCount();
}

std::size_t InstanceOrchestrator::ImageBuildCount() const {
    return impl_->image_cache->BuildCount();
}

std::filesystem::path InstanceOrchestrator::RunDirectory() const {
    return config_.log_dir / config_.run_id;
}

std::filesystem::path InstanceOrchestrator::InstanceLogDirectory(const std::string& instance_id) const {
    std::string name = StringUtils::SanitizeIdentifier(instance_id);
    if (name.empty() || name == "." || name == "..") {
        name = "unnamed_instance";
    }
    return RunDirectory() / name;
}

} // namespace core
} // namespace patchbench
