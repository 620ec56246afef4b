//! # Module Graph Tests
//!
//! Import closure, ordering, deduplication, cycles, unresolved imports, and
//! the fragment store underneath.

#include "graph/module_graph.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace smc;
using namespace smc::graph;

class ModuleGraphTest : public ::testing::Test {
protected:
    MemoryLoader loader;
    FragmentStore store{loader};

    ModuleGraph build_ok(const std::string& root) {
        auto result = ModuleGraph::build(root, store);
        if (is_err(result)) {
            ADD_FAILURE() << unwrap_err(result).to_string();
            return {};
        }
        return std::move(unwrap(result));
    }

    ResolutionError build_err(const std::string& root) {
        auto result = ModuleGraph::build(root, store);
        if (is_ok(result)) {
            ADD_FAILURE() << "expected graph construction to fail";
            return {};
        }
        return unwrap_err(result);
    }
};

// ============================================================================
// Closure and Order
// ============================================================================

TEST_F(ModuleGraphTest, SingleFragment) {
    loader.add("main.wgsl", "fn main() {}\n");

    auto graph = build_ok("main.wgsl");
    EXPECT_EQ(graph.root(), "main.wgsl");
    EXPECT_EQ(graph.paths(), std::vector<std::string>{"main.wgsl"});
    EXPECT_TRUE(graph.imports_of("main.wgsl").empty());
}

TEST_F(ModuleGraphTest, DependenciesComeFirst) {
    loader.add("main.wgsl", "#import b.wgsl\n#import c.wgsl\n");
    loader.add("b.wgsl", "#import d.wgsl\n");
    loader.add("c.wgsl", "#import d.wgsl\n");
    loader.add("d.wgsl", "const D = 1;\n");

    auto graph = build_ok("main.wgsl");
    EXPECT_EQ(graph.paths(),
              (std::vector<std::string>{"d.wgsl", "b.wgsl", "c.wgsl", "main.wgsl"}));
}

TEST_F(ModuleGraphTest, SharedImportAppearsOnce) {
    loader.add("main.wgsl", "#import a.wgsl as first\n#import a.wgsl as second\n");
    loader.add("a.wgsl", "const A = 1;\n");

    auto graph = build_ok("main.wgsl");
    EXPECT_EQ(graph.size(), 2u);
    EXPECT_EQ(loader.load_count("a.wgsl"), 1u);

    ASSERT_NE(graph.find_import("main.wgsl", "first"), nullptr);
    ASSERT_NE(graph.find_import("main.wgsl", "second"), nullptr);
    EXPECT_EQ(graph.find_import("main.wgsl", "second")->to, "a.wgsl");
    EXPECT_EQ(graph.find_import("main.wgsl", "third"), nullptr);
}

TEST_F(ModuleGraphTest, ImportsResolveRelativeToImporter) {
    loader.add("shaders/main.wgsl", "#import include/camera.wgsl\n#import /common/math.wgsl\n");
    loader.add("shaders/include/camera.wgsl", "#import ../../common/math.wgsl as m\n");
    loader.add("common/math.wgsl", "const PI = 3.14;\n");

    auto graph = build_ok("shaders/main.wgsl");
    EXPECT_EQ(graph.paths(), (std::vector<std::string>{"common/math.wgsl",
                                                      "shaders/include/camera.wgsl",
                                                      "shaders/main.wgsl"}));

    const auto& edges = graph.imports_of("shaders/main.wgsl");
    ASSERT_EQ(edges.size(), 2u);
    EXPECT_EQ(edges[0].alias, "camera");
    EXPECT_EQ(edges[0].to, "shaders/include/camera.wgsl");
    EXPECT_EQ(edges[1].to, "common/math.wgsl");
    EXPECT_EQ(edges[1].line, 2u);
}

TEST_F(ModuleGraphTest, UpstreamIsTransitive) {
    loader.add("main.wgsl", "#import b.wgsl\n");
    loader.add("b.wgsl", "#import c.wgsl\n");
    loader.add("c.wgsl", "");
    loader.add("unrelated.wgsl", "");

    auto graph = build_ok("main.wgsl");
    auto upstream = graph.upstream("main.wgsl");
    ASSERT_EQ(upstream.size(), 2u);
    EXPECT_EQ(upstream[0]->path, "c.wgsl");
    EXPECT_EQ(upstream[1]->path, "b.wgsl");
    EXPECT_TRUE(graph.upstream("c.wgsl").empty());
    EXPECT_FALSE(graph.contains("unrelated.wgsl"));
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(ModuleGraphTest, CycleNamesMembers) {
    loader.add("a.wgsl", "#import b.wgsl\n");
    loader.add("b.wgsl", "\n#import a.wgsl\n");

    auto error = build_err("a.wgsl");
    EXPECT_EQ(error.kind, ErrorKind::CyclicImport);
    EXPECT_EQ(error.message, "import cycle: a.wgsl -> b.wgsl -> a.wgsl");
    EXPECT_EQ(error.fragment, "b.wgsl");
    EXPECT_EQ(error.line, 2u);
    EXPECT_EQ(error.related, (std::vector<std::string>{"a.wgsl", "b.wgsl", "a.wgsl"}));
}

TEST_F(ModuleGraphTest, SelfImportIsCycle) {
    loader.add("self.wgsl", "#import self.wgsl as me\n");

    auto error = build_err("self.wgsl");
    EXPECT_EQ(error.kind, ErrorKind::CyclicImport);
    EXPECT_EQ(error.message, "import cycle: self.wgsl -> self.wgsl");
}

TEST_F(ModuleGraphTest, MissingRoot) {
    auto error = build_err("missing.wgsl");
    EXPECT_EQ(error.kind, ErrorKind::UnresolvedImport);
    EXPECT_EQ(error.symbol, "missing.wgsl");
    EXPECT_TRUE(error.fragment.empty());
    EXPECT_EQ(error.message.rfind("cannot load root fragment 'missing.wgsl'", 0), 0u);
}

TEST_F(ModuleGraphTest, MissingImportNamesImporter) {
    loader.add("main.wgsl", "const A = 1;\n#import gone.wgsl\n");

    auto error = build_err("main.wgsl");
    EXPECT_EQ(error.kind, ErrorKind::UnresolvedImport);
    EXPECT_EQ(error.fragment, "main.wgsl");
    EXPECT_EQ(error.line, 2u);
    EXPECT_EQ(error.symbol, "gone.wgsl");
    EXPECT_EQ(error.message.rfind("cannot resolve import 'gone.wgsl'", 0), 0u);
}

TEST_F(ModuleGraphTest, SyntaxErrorInImportedFragment) {
    loader.add("main.wgsl", "#import bad.wgsl\n");
    loader.add("bad.wgsl", "#import\n");

    auto error = build_err("main.wgsl");
    EXPECT_EQ(error.kind, ErrorKind::DirectiveSyntax);
    EXPECT_EQ(error.fragment, "bad.wgsl");
}

// ============================================================================
// Fragment Store
// ============================================================================

TEST_F(ModuleGraphTest, StoreCachesParsedFragments) {
    loader.add("main.wgsl", "#import a.wgsl\n");
    loader.add("a.wgsl", "const A = 1;\n");

    build_ok("main.wgsl");
    build_ok("main.wgsl");

    auto stats = store.get_stats();
    EXPECT_EQ(stats.cached_fragments, 2u);
    EXPECT_EQ(stats.loads, 2u);
    EXPECT_EQ(stats.hits, 2u);
    EXPECT_EQ(loader.load_count(), 2u);
}

TEST_F(ModuleGraphTest, StoreInvalidationReloads) {
    loader.add("a.wgsl", "const A = 1;\n");
    auto first = store.get("a.wgsl");
    ASSERT_TRUE(is_ok(first));

    loader.add("a.wgsl", "const A = 2;\n");
    EXPECT_TRUE(store.invalidate("a.wgsl"));
    EXPECT_FALSE(store.invalidate("a.wgsl"));

    auto second = store.get("a.wgsl");
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(unwrap(second)->source, "const A = 2;\n");
    EXPECT_NE(unwrap(first)->fingerprint, unwrap(second)->fingerprint);
    EXPECT_EQ(loader.load_count("a.wgsl"), 2u);
}

TEST_F(ModuleGraphTest, StoreDoesNotCacheFailures) {
    auto missing = store.get("late.wgsl");
    ASSERT_TRUE(is_err(missing));
    EXPECT_EQ(unwrap_err(missing).kind, ErrorKind::UnresolvedImport);

    loader.add("late.wgsl", "");
    EXPECT_TRUE(is_ok(store.get("late.wgsl")));
    EXPECT_EQ(store.get_stats().cached_fragments, 1u);
}

// ============================================================================
// Paths
// ============================================================================

TEST(FragmentPathTest, Normalize) {
    EXPECT_EQ(normalize_path("a/./b/../c.wgsl"), "a/c.wgsl");
    EXPECT_EQ(normalize_path("/root.wgsl"), "root.wgsl");
    EXPECT_EQ(normalize_path("dir\\file.wgsl"), "dir/file.wgsl");
    EXPECT_EQ(normalize_path("."), "");
}

TEST(FragmentPathTest, ResolveImport) {
    EXPECT_EQ(resolve_import_path("a/b/main.wgsl", "c.wgsl"), "a/b/c.wgsl");
    EXPECT_EQ(resolve_import_path("a/b/main.wgsl", "../c.wgsl"), "a/c.wgsl");
    EXPECT_EQ(resolve_import_path("a/b/main.wgsl", "/c.wgsl"), "c.wgsl");
    EXPECT_EQ(resolve_import_path("main.wgsl", "inc/c.wgsl"), "inc/c.wgsl");
}

TEST(FragmentPathTest, StemIsIdentifierSafe) {
    Fragment fragment;
    fragment.path = "include/font-vertex.wgsl";
    EXPECT_EQ(fragment.stem(), "font_vertex");
    fragment.path = "2d.wgsl";
    EXPECT_EQ(fragment.stem(), "f2d");
}
