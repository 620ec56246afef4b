//! # Resolver Tests
//!
//! End-to-end resolution through the public facade: caching, invalidation,
//! option plumbing and concurrent callers.

#include "resolver/resolver.hpp"

#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace smc;

class ResolverTest : public ::testing::Test {
protected:
    graph::MemoryLoader loader;

    void SetUp() override {
        loader.add("main.wgsl", "#import include/lib.wgsl\n"
                                "@group(#G) @binding(0) var<uniform> tint: vec4<f32>;\n"
                                "@fragment fn fs_main() -> @location(0) vec4<f32> {\n"
                                "    return lib::shade(tint);\n"
                                "}\n");
        loader.add("include/lib.wgsl", "@export fn shade(c: vec4<f32>) -> vec4<f32> {\n"
                                       "    return c * 0.5;\n"
                                       "}\n");
    }

    compose::ComposedShaderPtr resolve_ok(Resolver& resolver, const std::string& root,
                                          const macro::MacroEnvironment& env) {
        auto result = resolver.resolve(root, env);
        if (is_err(result)) {
            ADD_FAILURE() << unwrap_err(result).to_string();
            return nullptr;
        }
        return unwrap(result);
    }
};

// ============================================================================
// Caching
// ============================================================================

TEST_F(ResolverTest, RepeatedResolveIsCached) {
    Resolver resolver(loader);

    auto first = resolve_ok(resolver, "main.wgsl", {{"G", 0}});
    auto second = resolve_ok(resolver, "main.wgsl", {{"G", 0}});
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);

    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(first->text, second->text);

    auto stats = resolver.stats();
    EXPECT_EQ(stats.cache_hits, 1u);
    EXPECT_EQ(stats.cache_misses, 1u);
    EXPECT_EQ(stats.cached_shaders, 1u);
    EXPECT_EQ(stats.fragments_loaded, 2u);
    EXPECT_EQ(stats.fragments_cached, 2u);
}

TEST_F(ResolverTest, FreshResolverReproducesText) {
    Resolver a(loader);
    Resolver b(loader);

    auto first = resolve_ok(a, "main.wgsl", {{"G", 3}});
    auto second = resolve_ok(b, "main.wgsl", {{"G", 3}});
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(first->text, second->text);
    EXPECT_EQ(first->fingerprint, second->fingerprint);
}

TEST_F(ResolverTest, RootPathIsNormalized) {
    Resolver resolver(loader);

    auto first = resolve_ok(resolver, "main.wgsl", {{"G", 0}});
    auto second = resolve_ok(resolver, "./include/../main.wgsl", {{"G", 0}});
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(resolver.stats().cache_hits, 1u);
}

TEST_F(ResolverTest, EnvironmentSelectsComposition) {
    Resolver resolver(loader);

    auto g0 = resolve_ok(resolver, "main.wgsl", {{"G", 0}});
    auto g2 = resolve_ok(resolver, "main.wgsl", {{"G", 2}});
    ASSERT_NE(g0, nullptr);
    ASSERT_NE(g2, nullptr);

    EXPECT_NE(g0->text, g2->text);
    EXPECT_NE(g2->text.find("@group(2) @binding(0)"), std::string::npos);
    EXPECT_EQ(g2->env, (macro::MacroEnvironment{{"G", 2}}));
    EXPECT_EQ(loader.load_count("main.wgsl"), 1u);
    EXPECT_EQ(resolver.stats().cached_shaders, 2u);
}

TEST_F(ResolverTest, FailuresAreNotCached) {
    Resolver resolver(loader);
    loader.add("broken.wgsl", "#import later.wgsl\n");

    auto failed = resolver.resolve("broken.wgsl", {});
    ASSERT_TRUE(is_err(failed));
    EXPECT_EQ(unwrap_err(failed).kind, ErrorKind::UnresolvedImport);
    EXPECT_EQ(unwrap_err(failed).fragment, "broken.wgsl");

    loader.add("later.wgsl", "const L = 1;\n");
    EXPECT_TRUE(is_ok(resolver.resolve("broken.wgsl", {})));
    EXPECT_EQ(resolver.stats().cache_misses, 2u);
}

TEST_F(ResolverTest, ErrorsAreDeterministic) {
    Resolver resolver(loader);

    auto first = resolver.resolve("main.wgsl", {});
    auto second = resolver.resolve("main.wgsl", {});
    ASSERT_TRUE(is_err(first));
    ASSERT_TRUE(is_err(second));
    EXPECT_EQ(unwrap_err(first).kind, ErrorKind::UndefinedMacro);
    EXPECT_EQ(unwrap_err(first).to_string(), unwrap_err(second).to_string());
}

// ============================================================================
// Invalidation
// ============================================================================

TEST_F(ResolverTest, InvalidateRecomputes) {
    Resolver resolver(loader);
    auto before = resolve_ok(resolver, "main.wgsl", {{"G", 0}});
    ASSERT_NE(before, nullptr);

    loader.add("include/lib.wgsl", "@export fn shade(c: vec4<f32>) -> vec4<f32> {\n"
                                   "    return c * 0.25;\n"
                                   "}\n");
    resolver.invalidate("include/lib.wgsl");

    auto after = resolve_ok(resolver, "main.wgsl", {{"G", 0}});
    ASSERT_NE(after, nullptr);
    EXPECT_NE(before.get(), after.get());
    EXPECT_NE(after->text.find("c * 0.25"), std::string::npos);
    EXPECT_NE(before->fingerprint, after->fingerprint);

    EXPECT_EQ(loader.load_count("include/lib.wgsl"), 2u);
    EXPECT_EQ(loader.load_count("main.wgsl"), 1u);
    EXPECT_EQ(resolver.stats().cache_misses, 2u);
}

TEST_F(ResolverTest, InvalidateNormalizesPath) {
    Resolver resolver(loader);
    (void)resolve_ok(resolver, "main.wgsl", {{"G", 0}});

    resolver.invalidate("/include/./lib.wgsl");
    (void)resolve_ok(resolver, "main.wgsl", {{"G", 0}});
    EXPECT_EQ(resolver.stats().cache_misses, 2u);
}

TEST_F(ResolverTest, UnrelatedInvalidationKeepsEntries) {
    Resolver resolver(loader);
    (void)resolve_ok(resolver, "main.wgsl", {{"G", 0}});

    resolver.invalidate("include/other.wgsl");
    (void)resolve_ok(resolver, "main.wgsl", {{"G", 0}});

    auto stats = resolver.stats();
    EXPECT_EQ(stats.cache_hits, 1u);
    EXPECT_EQ(stats.cache_misses, 1u);
}

TEST_F(ResolverTest, ClearDropsEverything) {
    Resolver resolver(loader);
    (void)resolve_ok(resolver, "main.wgsl", {{"G", 0}});

    resolver.clear();
    auto stats = resolver.stats();
    EXPECT_EQ(stats.cached_shaders, 0u);
    EXPECT_EQ(stats.fragments_cached, 0u);

    (void)resolve_ok(resolver, "main.wgsl", {{"G", 0}});
    EXPECT_EQ(loader.load_count("main.wgsl"), 2u);
}

// ============================================================================
// Options
// ============================================================================

TEST_F(ResolverTest, OptionsReachComposer) {
    ResolverOptions options;
    options.markers = false;
    options.limits.max_bind_groups = 2;
    Resolver resolver(loader, options);

    auto shader = resolve_ok(resolver, "main.wgsl", {{"G", 1}});
    ASSERT_NE(shader, nullptr);
    EXPECT_EQ(shader->text.find("// fragment:"), std::string::npos);

    auto limited = resolver.resolve("main.wgsl", {{"G", 2}});
    ASSERT_TRUE(is_err(limited));
    EXPECT_EQ(unwrap_err(limited).kind, ErrorKind::BindingLimit);
}

// ============================================================================
// Binding Slots Across Compositions
// ============================================================================

class ResolverBindingTest : public ResolverTest {
protected:
    void SetUp() override {
        loader.add("scene.wgsl", "#import camera.wgsl\n"
                                 "#import texture.wgsl\n"
                                 "@fragment fn fs_main() -> @location(0) vec4<f32> {\n"
                                 "    return camera::view * texture::tint;\n"
                                 "}\n");
        loader.add("camera.wgsl", "@export @group(#CAMERA_GROUP) @binding(0)\n"
                                  "var<uniform> view: vec4<f32>;\n");
        loader.add("texture.wgsl", "@export @group(#TEXTURE_GROUP) @binding(0)\n"
                                   "var<uniform> tint: vec4<f32>;\n");
    }
};

TEST_F(ResolverBindingTest, CollisionAtSameSlot) {
    Resolver resolver(loader);

    auto result = resolver.resolve("scene.wgsl", {{"CAMERA_GROUP", 1}, {"TEXTURE_GROUP", 1}});
    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    EXPECT_EQ(error.kind, ErrorKind::BindingSlotCollision);
    EXPECT_EQ(error.related, (std::vector<std::string>{"view", "tint"}));
    EXPECT_NE(error.message.find("(group 1, binding 0)"), std::string::npos);
}

TEST_F(ResolverBindingTest, SameFragmentsUnderDifferentEnvironments) {
    Resolver resolver(loader);

    auto a = resolve_ok(resolver, "scene.wgsl", {{"CAMERA_GROUP", 0}, {"TEXTURE_GROUP", 1}});
    auto b = resolve_ok(resolver, "scene.wgsl", {{"CAMERA_GROUP", 1}, {"TEXTURE_GROUP", 0}});
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);

    ASSERT_EQ(a->reflection.bindings.size(), 2u);
    EXPECT_EQ(a->reflection.bindings[0].declared, "view");
    EXPECT_EQ(b->reflection.bindings[0].declared, "tint");
    EXPECT_EQ(loader.load_count("camera.wgsl"), 1u);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(ResolverTest, ConcurrentResolveLoadsEachFragmentOnce) {
    constexpr int NUM_THREADS = 8;
    Resolver resolver(loader);

    std::vector<compose::ComposedShaderPtr> results(NUM_THREADS);
    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&, i]() {
            auto result = resolver.resolve("main.wgsl", {{"G", 0}});
            if (is_ok(result)) {
                results[i] = unwrap(result);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& shader : results) {
        ASSERT_NE(shader, nullptr);
        EXPECT_EQ(shader->text, results[0]->text);
    }
    EXPECT_EQ(loader.load_count("main.wgsl"), 1u);
    EXPECT_EQ(loader.load_count("include/lib.wgsl"), 1u);
    EXPECT_EQ(resolver.stats().cache_misses, 1u);
}
