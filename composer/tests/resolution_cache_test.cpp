//! # Resolution Cache Tests
//!
//! Memoization, in-flight sharing, failure handling and invalidation.

#include "cache/resolution_cache.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace smc;
using namespace smc::cache;

class ResolutionCacheTest : public ::testing::Test {
protected:
    ResolutionCache cache;
    std::atomic<int> computations{0};

    static compose::ComposedShaderPtr make_shader(const std::string& root,
                                                  std::vector<std::string> fragments) {
        auto shader = make_rc<compose::ComposedShader>();
        shader->root = root;
        shader->text = "// " + root + "\n";
        shader->fragments = std::move(fragments);
        shader->fingerprint = fingerprint_string(shader->text);
        return shader;
    }

    ResolutionCache::Compute producing(const std::string& root,
                                       std::vector<std::string> fragments) {
        return [this, root, fragments]() -> ResolveResult {
            ++computations;
            return make_shader(root, fragments);
        };
    }
};

// ============================================================================
// Memoization
// ============================================================================

TEST_F(ResolutionCacheTest, MissThenHit) {
    ResolutionKey key{"main.wgsl", {{"G", 0}}};

    auto first = cache.get_or_compute(key, producing("main.wgsl", {"main.wgsl"}));
    auto second = cache.get_or_compute(key, producing("main.wgsl", {"main.wgsl"}));

    ASSERT_TRUE(is_ok(first));
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(unwrap(first).get(), unwrap(second).get());
    EXPECT_EQ(computations.load(), 1);

    auto stats = cache.get_stats();
    EXPECT_EQ(stats.total_entries, 1u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
}

TEST_F(ResolutionCacheTest, EnvironmentIsPartOfKey) {
    ResolutionKey a{"main.wgsl", {{"G", 0}}};
    ResolutionKey b{"main.wgsl", {{"G", 1}}};

    (void)cache.get_or_compute(a, producing("main.wgsl", {"main.wgsl"}));
    (void)cache.get_or_compute(b, producing("main.wgsl", {"main.wgsl"}));

    EXPECT_EQ(computations.load(), 2);
    EXPECT_TRUE(cache.contains(a));
    EXPECT_TRUE(cache.contains(b));
    EXPECT_FALSE(cache.contains(ResolutionKey{"main.wgsl", {}}));
}

TEST_F(ResolutionCacheTest, KeyFingerprint) {
    ResolutionKey a{"main.wgsl", {{"A", 0}, {"B", 1}}};
    ResolutionKey same{"main.wgsl", {{"B", 1}, {"A", 0}}};
    ResolutionKey other{"main.wgsl", {{"A", 1}, {"B", 0}}};

    EXPECT_EQ(a, same);
    EXPECT_EQ(a.fingerprint(), same.fingerprint());
    EXPECT_NE(a.fingerprint(), other.fingerprint());
}

TEST_F(ResolutionCacheTest, LookupCountsHitsAndMisses) {
    ResolutionKey key{"main.wgsl", {}};
    EXPECT_FALSE(cache.lookup(key).has_value());

    (void)cache.get_or_compute(key, producing("main.wgsl", {"main.wgsl"}));
    auto found = cache.lookup(key);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ((*found)->root, "main.wgsl");

    auto stats = cache.get_stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 2u);
}

TEST_F(ResolutionCacheTest, FailuresAreNotStored) {
    ResolutionKey key{"broken.wgsl", {}};
    auto failing = [this]() -> ResolveResult {
        ++computations;
        return make_error(ErrorKind::UnresolvedImport, "cannot load root fragment 'broken.wgsl'");
    };

    EXPECT_TRUE(is_err(cache.get_or_compute(key, failing)));
    EXPECT_TRUE(is_err(cache.get_or_compute(key, failing)));
    EXPECT_EQ(computations.load(), 2);
    EXPECT_FALSE(cache.contains(key));
}

TEST_F(ResolutionCacheTest, ExceptionLeavesNoInFlightRecord) {
    ResolutionKey key{"main.wgsl", {}};

    EXPECT_THROW((void)cache.get_or_compute(
                     key, []() -> ResolveResult { throw std::runtime_error("loader failed"); }),
                 std::runtime_error);

    auto result = cache.get_or_compute(key, producing("main.wgsl", {"main.wgsl"}));
    EXPECT_TRUE(is_ok(result));
    EXPECT_EQ(computations.load(), 1);
}

// ============================================================================
// Invalidation
// ============================================================================

TEST_F(ResolutionCacheTest, InvalidateDropsDependentEntries) {
    ResolutionKey font{"font.wgsl", {}};
    ResolutionKey unlit{"unlit.wgsl", {}};
    (void)cache.get_or_compute(font, producing("font.wgsl", {"camera.wgsl", "font.wgsl"}));
    (void)cache.get_or_compute(unlit, producing("unlit.wgsl", {"model.wgsl", "unlit.wgsl"}));

    EXPECT_EQ(cache.invalidate("camera.wgsl"), 1u);
    EXPECT_FALSE(cache.contains(font));
    EXPECT_TRUE(cache.contains(unlit));
    EXPECT_EQ(cache.invalidate("camera.wgsl"), 0u);
}

TEST_F(ResolutionCacheTest, InvalidationDuringComputeSkipsStore) {
    ResolutionKey key{"main.wgsl", {}};

    auto result = cache.get_or_compute(key, [this]() -> ResolveResult {
        cache.invalidate("lib.wgsl");
        return make_shader("main.wgsl", {"lib.wgsl", "main.wgsl"});
    });

    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result)->root, "main.wgsl");
    EXPECT_FALSE(cache.contains(key));
}

TEST_F(ResolutionCacheTest, UnrelatedInvalidationDuringComputeStores) {
    ResolutionKey key{"main.wgsl", {}};

    (void)cache.get_or_compute(key, [this]() -> ResolveResult {
        cache.invalidate("other.wgsl");
        return make_shader("main.wgsl", {"lib.wgsl", "main.wgsl"});
    });

    EXPECT_TRUE(cache.contains(key));
}

TEST_F(ResolutionCacheTest, ClearResetsEverything) {
    ResolutionKey key{"main.wgsl", {}};
    (void)cache.get_or_compute(key, producing("main.wgsl", {"main.wgsl"}));
    (void)cache.get_or_compute(key, producing("main.wgsl", {"main.wgsl"}));

    cache.clear();

    auto stats = cache.get_stats();
    EXPECT_EQ(stats.total_entries, 0u);
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.misses, 0u);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(ResolutionCacheTest, ConcurrentCallersShareOneComputation) {
    constexpr int NUM_THREADS = 8;
    ResolutionKey key{"main.wgsl", {{"G", 0}}};
    std::atomic<bool> go{false};

    auto slow = [this]() -> ResolveResult {
        ++computations;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return make_shader("main.wgsl", {"main.wgsl"});
    };

    std::vector<compose::ComposedShaderPtr> results(NUM_THREADS);
    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&, i]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto result = cache.get_or_compute(key, slow);
            if (is_ok(result)) {
                results[i] = unwrap(result);
            }
        });
    }
    go.store(true);
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(computations.load(), 1);
    for (const auto& shader : results) {
        ASSERT_NE(shader, nullptr);
        EXPECT_EQ(shader.get(), results[0].get());
    }

    auto stats = cache.get_stats();
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.hits + stats.in_flight_waits, static_cast<size_t>(NUM_THREADS - 1));
}
