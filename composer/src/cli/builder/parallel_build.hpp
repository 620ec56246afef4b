#ifndef SMC_CLI_PARALLEL_BUILD_HPP
#define SMC_CLI_PARALLEL_BUILD_HPP

#include "cli/builder/build_config.hpp"
#include "error/diagnostic.hpp"
#include "resolver/resolver.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace smc::cli {

/**
 * Build job representing one shader variant to compose
 */
struct BuildJob {
    ShaderVariant variant;
    fs::path output_file;
    bool completed = false;
    bool failed = false;
    std::optional<ResolutionError> error;
    std::string error_message; ///< Failures that are not resolution errors
};

/**
 * Build statistics for reporting
 */
struct BuildStats {
    std::atomic<int> total_shaders{0};
    std::atomic<int> completed{0};
    std::atomic<int> failed{0};
    std::atomic<int> unchanged{0};
    std::chrono::steady_clock::time_point start_time;

    void reset() {
        total_shaders = 0;
        completed = 0;
        failed = 0;
        unchanged = 0;
        start_time = std::chrono::steady_clock::now();
    }

    int64_t elapsed_ms() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time).count();
    }
};

/**
 * Thread-safe work queue for parallel builds
 */
class BuildQueue {
public:
    BuildQueue() : stop_flag(false) {}

    void push(std::shared_ptr<BuildJob> job);

    /// Blocks until a job is available. Returns nullptr once the queue is
    /// stopped and drained.
    std::shared_ptr<BuildJob> pop();
    void stop();
    size_t size();

private:
    std::queue<std::shared_ptr<BuildJob>> queue;
    std::mutex mutex;
    std::condition_variable cv;
    bool stop_flag;
};

/**
 * Composes shader variants on a pool of worker threads sharing one resolver
 */
class ParallelBuilder {
public:
    /// `num_threads` of 0 uses the hardware concurrency.
    ParallelBuilder(Resolver& resolver, int num_threads = 0);

    void add_variant(const ShaderVariant& variant, const fs::path& output_file);

    /// Runs every job. Returns true if all succeeded.
    bool build();

    const BuildStats& get_stats() const {
        return stats;
    }

    const std::vector<std::shared_ptr<BuildJob>>& get_jobs() const {
        return jobs;
    }

private:
    Resolver& resolver;
    int num_threads;
    std::vector<std::shared_ptr<BuildJob>> jobs;
    BuildQueue ready_queue;
    BuildStats stats;

    void worker_thread();
    bool compose_job(BuildJob& job);
};

/**
 * Entry point of `smc build [manifest] [-j N] [--out-dir <dir>] [--only <name>]`
 */
int run_build(const std::vector<std::string>& args);

} // namespace smc::cli

#endif // SMC_CLI_PARALLEL_BUILD_HPP
