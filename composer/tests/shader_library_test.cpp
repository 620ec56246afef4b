//! # Shader Library Tests
//!
//! Composes the WGSL library shipped in `shaders/` from disk, under the
//! pipeline layouts listed in `shaders.toml`.

#include "cli/builder/build_config.hpp"
#include "graph/loader.hpp"
#include "resolver/resolver.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

#ifndef SMC_SHADER_DIR
#error "SMC_SHADER_DIR must point at the shipped shaders/ directory"
#endif

using namespace smc;

class ShaderLibraryTest : public ::testing::Test {
protected:
    graph::FileLoader loader{SMC_SHADER_DIR};

    static macro::MacroEnvironment unlit_layout() {
        return {{"CAMERA_GROUP", 0}, {"MODEL_GROUP", 1}, {"TEXTURE_GROUP", 2}};
    }

    static macro::MacroEnvironment font_layout() {
        return {{"TEXTURE_GROUP", 0}, {"CAMERA_GROUP", 1}, {"MODEL_GROUP", 2}};
    }

    static std::vector<std::string> declared_bindings(const compose::ComposedShader& shader) {
        std::vector<std::string> names;
        for (const auto& binding : shader.reflection.bindings) {
            names.push_back(binding.declared);
        }
        return names;
    }
};

TEST_F(ShaderLibraryTest, UnlitDiffuse) {
    Resolver resolver(loader);
    auto result = resolver.resolve("unlit_diffuse.wgsl", unlit_layout());
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& shader = *unwrap(result);

    EXPECT_EQ(shader.fragments,
              (std::vector<std::string>{"include/basic_vertex.wgsl", "include/camera.wgsl",
                                        "include/model.wgsl", "include/texture.wgsl",
                                        "unlit_diffuse.wgsl"}));
    EXPECT_EQ(declared_bindings(shader),
              (std::vector<std::string>{"camera", "model", "diffuse_texture", "diffuse_sampler"}));
    EXPECT_EQ(shader.reflection.bindings[3].slot, (compose::BindingSlot{2, 1}));

    ASSERT_EQ(shader.reflection.entry_points.size(), 2u);
    EXPECT_EQ(shader.reflection.entry_points[0].name, "vs_main");
    EXPECT_EQ(shader.reflection.entry_points[1].name, "fs_main");
}

TEST_F(ShaderLibraryTest, OutputHasNoDirectivesLeft) {
    Resolver resolver(loader);
    auto result = resolver.resolve("font.wgsl", font_layout());
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& text = unwrap(result)->text;

    EXPECT_EQ(text.find("#import"), std::string::npos);
    EXPECT_EQ(text.find("#define"), std::string::npos);
    EXPECT_EQ(text.find("@export"), std::string::npos);
    EXPECT_EQ(text.find("::"), std::string::npos);
    EXPECT_EQ(text.find('#'), std::string::npos);
    EXPECT_NE(text.find("@group(0) @binding(1)"), std::string::npos);
    EXPECT_NE(text.find("// fragment: include/font_vertex.wgsl\n"), std::string::npos);
}

TEST_F(ShaderLibraryTest, SharedFragmentsUnderBothLayouts) {
    Resolver resolver(loader);

    auto unlit = resolver.resolve("unlit_diffuse.wgsl", unlit_layout());
    auto font = resolver.resolve("font.wgsl", font_layout());
    ASSERT_TRUE(is_ok(unlit)) << unwrap_err(unlit).to_string();
    ASSERT_TRUE(is_ok(font)) << unwrap_err(font).to_string();

    const auto& camera = unwrap(font)->reflection.bindings;
    ASSERT_EQ(camera.size(), 4u);
    EXPECT_EQ(camera[0].declared, "diffuse_texture");
    EXPECT_EQ(camera[2].declared, "camera");
    EXPECT_EQ(camera[2].slot, (compose::BindingSlot{1, 0}));

    // camera, model and texture were parsed once for both variants
    EXPECT_EQ(resolver.stats().fragments_loaded, 7u);
}

TEST_F(ShaderLibraryTest, CameraAndTextureInOneGroupCollide) {
    Resolver resolver(loader);
    auto result =
        resolver.resolve("unlit_diffuse.wgsl",
                         {{"CAMERA_GROUP", 0}, {"MODEL_GROUP", 1}, {"TEXTURE_GROUP", 0}});

    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    EXPECT_EQ(error.kind, ErrorKind::BindingSlotCollision);
    EXPECT_EQ(error.fragment, "include/texture.wgsl");
    EXPECT_EQ(error.related, (std::vector<std::string>{"camera", "diffuse_texture"}));
}

TEST_F(ShaderLibraryTest, MissingLayoutMacro) {
    Resolver resolver(loader);
    auto result = resolver.resolve("unlit_diffuse.wgsl", {{"CAMERA_GROUP", 0}, {"MODEL_GROUP", 1}});

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::UndefinedMacro);
    EXPECT_EQ(unwrap_err(result).symbol, "TEXTURE_GROUP");
}

TEST_F(ShaderLibraryTest, ManifestVariantsCompose) {
    auto manifest_path = fs::path(SMC_SHADER_DIR).parent_path() / "shaders.toml";
    auto manifest = cli::Manifest::load(manifest_path);
    ASSERT_TRUE(is_ok(manifest)) << unwrap_err(manifest);
    const auto& config = unwrap(manifest);

    graph::FileLoader manifest_loader(config.shader_root_path());
    Resolver resolver(manifest_loader, config.resolver_options());
    ASSERT_EQ(config.shaders.size(), 2u);
    for (const auto& variant : config.shaders) {
        auto result = resolver.resolve(variant.root, variant.defines);
        EXPECT_TRUE(is_ok(result)) << variant.name << ": "
                                   << (is_err(result) ? unwrap_err(result).to_string() : "");
    }
}
