/**
 * @file main.cpp
 * @brief patchbench - Command-line interface
 *
 * Loads instance definitions, validates them and evaluates every valid one
 * in isolated containers: checkout, patch, test, verdict. Prints one line
 * per instance and a batch summary, and writes per-instance artifacts and
 * summary.json under the run's log directory.
 *
 * Exit status is 0 iff every instance resolved (with --no-evaluation: iff
 * every definition is valid).
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "patchbench/core/dataset_loader.hpp"
#include "patchbench/core/harness_config.hpp"
#include "patchbench/core/instance_orchestrator.hpp"
#include "patchbench/reporters/json_reporter.hpp"
#include "patchbench/utils/container_utils.hpp"
#include "patchbench/utils/string_utils.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>

using namespace patchbench;

namespace {

std::atomic<core::InstanceOrchestrator*> g_orchestrator{nullptr};

extern "C" void HandleSignal(int) {
    core::InstanceOrchestrator* orchestrator = g_orchestrator.load();
    if (orchestrator != nullptr) {
        orchestrator->CancelAll();
    }
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

/*******************************************************************************
 * Console Output
 ******************************************************************************/

void PrintValidation(const std::vector<core::DefinitionEntry>& entries) {
    std::size_t valid = 0;

    for (const auto& entry : entries) {
        if (entry.Valid()) {
            valid++;
            std::cout << "VALID: " << entry.source;
            if (!entry.spec.instance_id.empty()) {
                std::cout << " (" << entry.spec.instance_id << ")";
            }
            std::cout << "\n";
            for (const auto& warning : entry.warnings) {
                std::cout << "  WARNING: " << warning << "\n";
            }
            continue;
        }

        std::cout << "INVALID: " << entry.source << "\n";
        for (const auto& error : entry.errors) {
            std::cout << "  ERROR: " << error << "\n";
        }
        for (const auto& warning : entry.warnings) {
            std::cout << "  WARNING: " << warning << "\n";
        }
    }

    std::cout << "\nResult: " << valid << "/" << entries.size() << " definitions valid\n";
}

void PrintResultLine(const core::InstanceResult& result) {
    std::size_t passed = 0;
    for (const auto& entry : result.test_verdicts) {
        if (entry.second == core::TestVerdict::PASS) {
            passed++;
        }
    }

    std::cout << "[" << core::ToString(result.status) << "] " << result.instance_id
              << "  tests " << passed << "/" << result.test_verdicts.size()
              << "  " << result.duration.count() << " ms";
    if (result.failure) {
        std::cout << "  (" << core::ToString(result.failure->kind) << ": "
                  << utils::StringUtils::Truncate(result.failure->cause, 120) << ")";
    }
    std::cout << std::endl;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"patchbench - isolated patch evaluation harness"};

    std::vector<std::string> files;
    std::string config_file;
    std::string run_id;
    std::string runtime_name;
    bool no_evaluation = false;
    bool strict = false;
    bool verbose = false;
    bool allow_network = false;
    bool no_sweep = false;

    std::size_t workers = 0;
    long long timeout = 0;
    std::size_t memory_mb = 0;
    double cpus = 0.0;
    int fuzz = 0;
    std::size_t max_log_bytes = 0;
    std::string cache_dir;
    std::string work_dir;
    std::string log_dir;

    app.add_option("files", files, "Instance definition files (JSON, JSON array or JSON Lines)")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("--config", config_file, "JSON config file")->check(CLI::ExistingFile);
    auto* workers_opt = app.add_option("-j,--workers", workers, "Concurrent instances")
        ->check(CLI::PositiveNumber);
    auto* timeout_opt = app.add_option("--timeout", timeout, "Test command timeout in seconds")
        ->check(CLI::PositiveNumber);
    auto* memory_opt = app.add_option("--memory-mb", memory_mb, "Sandbox memory limit (MiB)")
        ->check(CLI::PositiveNumber);
    auto* cpus_opt = app.add_option("--cpus", cpus, "Sandbox CPU limit (cores)")
        ->check(CLI::PositiveNumber);
    auto* fuzz_opt = app.add_option("--fuzz", fuzz, "Patch context drift tolerance (lines)")
        ->check(CLI::NonNegativeNumber);
    auto* log_bytes_opt = app.add_option("--max-log-bytes", max_log_bytes, "Captured output ceiling per stream")
        ->check(CLI::PositiveNumber);
    auto* cache_opt = app.add_option("--cache-dir", cache_dir, "Image cache directory");
    auto* work_opt = app.add_option("--work-dir", work_dir, "Workspace root");
    auto* log_opt = app.add_option("--log-dir", log_dir, "Log directory");
    auto* runtime_opt = app.add_option("--runtime", runtime_name, "Container runtime")
        ->check(CLI::IsMember({"docker", "podman"}));
    app.add_option("--run-id", run_id, "Run identifier (default: generated)");

    app.add_flag("--allow-network", allow_network, "Give sandboxes network access");
    app.add_flag("--no-evaluation", no_evaluation, "Only validate definitions");
    app.add_flag("--strict", strict, "Treat missing dataset fields as validation errors");
    app.add_flag("--no-sweep", no_sweep, "Skip orphaned container and workspace cleanup at start");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        // Defaults < config file < environment < flags
        core::HarnessConfig config;
        if (!config_file.empty()) {
            core::ConfigManager::LoadFromFile(config_file, config);
        }
        core::ConfigManager::ApplyEnvironment(config);

        if (workers_opt->count() > 0) config.workers = workers;
        if (timeout_opt->count() > 0) config.limits.timeout = std::chrono::seconds(timeout);
        if (memory_opt->count() > 0) config.limits.memory_mb = memory_mb;
        if (cpus_opt->count() > 0) config.limits.cpus = cpus;
        if (fuzz_opt->count() > 0) config.fuzz = fuzz;
        if (log_bytes_opt->count() > 0) config.max_log_bytes = max_log_bytes;
        if (cache_opt->count() > 0) config.cache_dir = cache_dir;
        if (work_opt->count() > 0) config.work_dir = work_dir;
        if (log_opt->count() > 0) config.log_dir = log_dir;
        if (runtime_opt->count() > 0) {
            config.runtime = runtime_name == "podman" ? utils::RuntimeKind::PODMAN : utils::RuntimeKind::DOCKER;
        }
        if (allow_network) config.allow_network = true;
        config.run_id = run_id.empty() ? core::ConfigManager::GenerateRunId() : run_id;

        auto problems = core::ConfigManager::Validate(config);
        if (!problems.empty()) {
            for (const auto& problem : problems) {
                spdlog::error("Invalid configuration: {}", problem);
            }
            return 2;
        }

        // Intake
        core::DatasetLoader loader;
        std::vector<core::DefinitionEntry> entries;
        for (const auto& file : files) {
            auto loaded = loader.LoadFile(file);
            entries.insert(entries.end(), std::make_move_iterator(loaded.begin()),
                           std::make_move_iterator(loaded.end()));
        }
        core::DatasetLoader::MarkDuplicates(entries);
        if (strict) {
            core::DatasetLoader::PromoteWarnings(entries);
        }

        if (no_evaluation) {
            PrintValidation(entries);
            for (const auto& entry : entries) {
                if (!entry.Valid()) {
                    return 1;
                }
            }
            return 0;
        }

        // Evaluation
        auto runtime = std::make_shared<utils::DockerRuntime>(config.runtime);
        core::InstanceOrchestrator orchestrator(config, runtime);
        if (!orchestrator.Initialize(!no_sweep)) {
            spdlog::error("Failed to initialize harness");
            return 2;
        }

        spdlog::debug("Effective configuration: {}",
                      core::ConfigManager::ToJson(orchestrator.GetConfig()).dump());

        g_orchestrator.store(&orchestrator);
        InstallSignalHandlers();

        std::vector<core::InstanceResult> results;
        std::vector<core::InstanceSpec> specs;

        for (auto& entry : entries) {
            if (entry.Valid()) {
                specs.push_back(std::move(entry.spec));
            } else {
                auto rejected = orchestrator.RejectInvalid(entry.spec.instance_id.empty() ? entry.source
                                                                                           : entry.spec.instance_id,
                                                           entry.errors);
                PrintResultLine(rejected);
                results.push_back(std::move(rejected));
            }
        }

        auto evaluated = orchestrator.RunAll(specs, PrintResultLine);
        results.insert(results.end(), std::make_move_iterator(evaluated.begin()),
                       std::make_move_iterator(evaluated.end()));

        g_orchestrator.store(nullptr);

        reporters::JsonReporter reporter;
        reporter.WriteSummary(results, config.run_id, orchestrator.RunDirectory() / "summary.json");

        auto summary = reporters::JsonReporter::Summarize(results);
        std::cout << "\n" << reporters::JsonReporter::FormatConsoleSummary(summary) << std::endl;

        if (orchestrator.IsCancelled()) {
            spdlog::warn("Run was cancelled");
        }

        return summary.AllResolved() ? 0 : 1;

    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 2;
    }
}
