//! # Parallel Shader Build
//!
//! Composes every `[[shader]]` variant of a manifest on a thread pool. All
//! workers share one `Resolver`, so fragments common to several variants are
//! loaded and parsed once.
//!
//! ## Thread Safety
//!
//! | Component  | Synchronization                     |
//! |------------|-------------------------------------|
//! | BuildQueue | Mutex + condition variable          |
//! | BuildStats | Atomic counters                     |
//! | Resolver   | Shared mutexes + in-flight futures  |
//! | Output     | One file per variant                |

#include "cli/builder/parallel_build.hpp"

#include "cli/utils.hpp"
#include "graph/loader.hpp"
#include "log/log.hpp"
#include "macro/macro_expr.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

namespace smc::cli {

// ============================================================================
// BuildQueue Implementation
// ============================================================================

void BuildQueue::push(std::shared_ptr<BuildJob> job) {
    std::lock_guard<std::mutex> lock(mutex);
    queue.push(job);
    cv.notify_one();
}

std::shared_ptr<BuildJob> BuildQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [this] { return !queue.empty() || stop_flag; });

    if (queue.empty()) {
        return nullptr;
    }

    auto job = queue.front();
    queue.pop();
    return job;
}

void BuildQueue::stop() {
    std::lock_guard<std::mutex> lock(mutex);
    stop_flag = true;
    cv.notify_all();
}

size_t BuildQueue::size() {
    std::lock_guard<std::mutex> lock(mutex);
    return queue.size();
}

// ============================================================================
// ParallelBuilder Implementation
// ============================================================================

ParallelBuilder::ParallelBuilder(Resolver& resolver, int num_threads)
    : resolver(resolver), num_threads(num_threads) {
    if (this->num_threads <= 0) {
        this->num_threads = std::max(1u, std::thread::hardware_concurrency());
    }
}

void ParallelBuilder::add_variant(const ShaderVariant& variant, const fs::path& output_file) {
    auto job = std::make_shared<BuildJob>();
    job->variant = variant;
    job->output_file = output_file;
    jobs.push_back(job);
}

bool ParallelBuilder::build() {
    stats.reset();
    stats.total_shaders = static_cast<int>(jobs.size());

    for (const auto& job : jobs) {
        ready_queue.push(job);
    }
    ready_queue.stop();

    int actual_threads = std::min(static_cast<int>(jobs.size()), num_threads);
    SMC_LOG_INFO("cli", "Composing " << jobs.size() << " shaders with " << actual_threads
                                     << " threads");

    std::vector<std::thread> workers;
    for (int i = 0; i < actual_threads; ++i) {
        workers.emplace_back(&ParallelBuilder::worker_thread, this);
    }

    // Wait for all workers to finish
    for (auto& worker : workers) {
        worker.join();
    }

    return stats.failed == 0;
}

void ParallelBuilder::worker_thread() {
    while (auto job = ready_queue.pop()) {
        if (compose_job(*job)) {
            job->completed = true;
            stats.completed++;
        } else {
            job->failed = true;
            stats.failed++;
        }
    }
}

bool ParallelBuilder::compose_job(BuildJob& job) {
    auto shader = resolver.resolve(job.variant.root, job.variant.defines);
    if (is_err(shader)) {
        job.error = unwrap_err(shader);
        return false;
    }
    const auto& text = unwrap(shader)->text;

    // Identical outputs are not rewritten
    auto existing = read_file(job.output_file.string());
    if (existing && *existing == text) {
        stats.unchanged++;
        SMC_LOG_DEBUG("cli", job.variant.name << " is up to date");
        return true;
    }

    if (!write_file(job.output_file.string(), text)) {
        job.error_message = "cannot write " + job.output_file.string();
        return false;
    }
    SMC_LOG_DEBUG("cli", "Wrote " << job.output_file.string());
    return true;
}

// ============================================================================
// Build Command
// ============================================================================

int run_build(const std::vector<std::string>& args) {
    std::string manifest_path = "shaders.toml";
    std::string out_dir;
    std::string only;
    int jobs = 0;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool has_value = i + 1 < args.size();

        if ((arg == "-j" || arg == "--jobs") && has_value) {
            auto value = macro::parse_int_literal(args[++i]);
            if (!value || *value <= 0 || *value > 1024) {
                std::cerr << "error: -j expects a positive thread count\n";
                return 1;
            }
            jobs = static_cast<int>(*value);
        } else if (arg == "--out-dir" && has_value) {
            out_dir = args[++i];
        } else if (arg == "--only" && has_value) {
            only = args[++i];
        } else if (arg.starts_with("-")) {
            std::cerr << "error: unknown or incomplete option '" << arg << "'\n";
            return 1;
        } else {
            manifest_path = arg;
        }
    }

    auto manifest = Manifest::load(manifest_path);
    if (is_err(manifest)) {
        std::cerr << "error: " << unwrap_err(manifest) << "\n";
        return 1;
    }
    const auto& config = unwrap(manifest);

    std::vector<const ShaderVariant*> selected;
    for (const auto& shader : config.shaders) {
        if (only.empty() || shader.name == only) {
            selected.push_back(&shader);
        }
    }
    if (!only.empty() && selected.empty()) {
        std::cerr << "error: no shader named '" << only << "' in " << manifest_path << "\n";
        return 1;
    }

    fs::path output_dir = out_dir.empty() ? config.out_dir_path() : fs::path(out_dir);
    graph::FileLoader loader(config.shader_root_path());
    Resolver resolver(loader, config.resolver_options());

    ParallelBuilder builder(resolver, jobs);
    for (const auto* shader : selected) {
        builder.add_variant(*shader, output_dir / (shader->name + ".wgsl"));
    }

    bool success = builder.build();

    for (const auto& job : builder.get_jobs()) {
        if (job->error) {
            std::cerr << "error: shader '" << job->variant.name << "' failed\n";
            print_error(*job->error);
        } else if (job->failed) {
            std::cerr << "error: shader '" << job->variant.name << "': " << job->error_message
                      << "\n";
        }
    }

    const auto& stats = builder.get_stats();
    auto resolver_stats = resolver.stats();
    std::cout << "Composed " << stats.completed << "/" << stats.total_shaders << " shaders ("
              << stats.unchanged << " unchanged, " << resolver_stats.fragments_loaded
              << " fragments loaded) in " << stats.elapsed_ms() << " ms\n";

    return success ? 0 : 1;
}

} // namespace smc::cli
