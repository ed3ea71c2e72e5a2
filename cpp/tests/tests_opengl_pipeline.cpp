// End-to-end rendering through SDL + OpenGL. Each case returns early when
// the machine has no display or GL driver.

#include "guard/guard.h"
#include "fragpipe/platform/sdl_offscreen_context.hpp"
#include "fragpipe/render/errors.hpp"
#include "fragpipe/render/render_pipeline.hpp"
#include "fp_log.hpp"

#include <memory>
#include <string>

using namespace fragpipe;

static const char* SOLID_RED = R"(
void main() {
    gl_FragColor = vec4(1.0, 0.0, 0.0, 1.0);
}
)";

static const char* GRADIENT = R"(
varying vec2 texCoord;
void main() {
    gl_FragColor = vec4(texCoord.x, texCoord.y, 0.25, 1.0);
}
)";

static const char* COPY_PREV = R"(
uniform sampler2D Prev;
varying vec2 texCoord;
void main() {
    gl_FragColor = texture2D(Prev, texCoord);
}
)";

static const char* TINT = R"(
uniform vec3 u_tint;
uniform float u_alpha;
void main() {
    gl_FragColor = vec4(u_tint, u_alpha);
}
)";

static std::unique_ptr<SDLOffscreenContextFactory> try_factory() {
    try {
        auto factory = std::make_unique<SDLOffscreenContextFactory>();
        // Opens a 1x1 context to query texture units
        factory->max_texture_units();
        return factory;
    } catch (const ResourceCreationError& e) {
        fp::Log::warn("skipping OpenGL test: %s", e.what());
        return nullptr;
    }
}

TEST_CASE("OpenGL: solid red 2x2")
{
    auto factory = try_factory();
    if (!factory) return;

    PassResults results = render({Pass("red", SOLID_RED, 2, 2)}, *factory, PipelineConfig());
    const Image& img = results.at("red");
    CHECK_EQ(img.bytes().size(), 16u);
    for (int y = 0; y < 2; ++y) {
        for (int x = 0; x < 2; ++x) {
            auto p = img.pixel_rgba8(x, y);
            CHECK_EQ(int(p[0]), 255);
            CHECK_EQ(int(p[1]), 0);
            CHECK_EQ(int(p[2]), 0);
            CHECK_EQ(int(p[3]), 255);
        }
    }
}

TEST_CASE("OpenGL: pass wider than the carrier window renders fully")
{
    auto factory = try_factory();
    if (!factory) return;

    PassResults results = render({Pass("wide", SOLID_RED, 1024, 3)}, *factory, PipelineConfig());
    const Image& img = results.at("wide");
    CHECK_EQ(img.width(), 1024);
    CHECK_EQ(img.height(), 3);
    const int xs[] = {0, 511, 1023};
    for (int x : xs) {
        for (int y = 0; y < 3; ++y) {
            auto p = img.pixel_rgba8(x, y);
            CHECK_EQ(int(p[0]), 255);
            CHECK_EQ(int(p[3]), 255);
        }
    }
}

TEST_CASE("OpenGL: pass reference copy is pixel-identical")
{
    auto factory = try_factory();
    if (!factory) return;

    PassResults results = render({
        Pass("gradient", GRADIENT, 8, 4),
        Pass("copy", COPY_PREV, 8, 4, {Uniform::pass("Prev", "gradient", TextureFilter::NEAREST)}),
    }, *factory, PipelineConfig());

    CHECK(results.at("gradient") == results.at("copy"));
}

TEST_CASE("OpenGL: rows come back bottom-up")
{
    auto factory = try_factory();
    if (!factory) return;

    PassResults results = render({Pass("g", GRADIENT, 4, 4)}, *factory, PipelineConfig());
    const Image& img = results.at("g");
    // texCoord.y grows with the row index
    CHECK(img.pixel_rgba8(0, 0)[1] < img.pixel_rgba8(0, 3)[1]);
}

TEST_CASE("OpenGL: uniform values reach the shader")
{
    auto factory = try_factory();
    if (!factory) return;

    PassResults results = render({
        Pass("tint", TINT, 1, 1, {
            Uniform("u_tint", Vec3f{0.0f, 1.0f, 0.0f}),
            Uniform("u_alpha", 1.0f),
            Uniform("u_not_declared", 3.0f),
        }),
    }, *factory, PipelineConfig());

    auto p = results.at("tint").pixel_rgba8(0, 0);
    CHECK_EQ(int(p[0]), 0);
    CHECK_EQ(int(p[1]), 255);
    CHECK_EQ(int(p[3]), 255);
}

TEST_CASE("OpenGL: ninth texture exceeds the default limit")
{
    auto factory = try_factory();
    if (!factory) return;

    Image px(1, 1, std::vector<uint8_t>{0, 0, 255, 255});
    std::vector<Uniform> uniforms;
    for (int i = 0; i < 9; ++i) {
        uniforms.push_back(Uniform::texture("Tex" + std::to_string(i), px));
    }

    bool thrown = false;
    try {
        render({Pass("many", SOLID_RED, 1, 1, uniforms)}, *factory, PipelineConfig());
    } catch (const TooManyTexturesError& e) {
        thrown = true;
        CHECK_EQ(e.uniform_name(), std::string("Tex8"));
    }
    CHECK(thrown);
}

TEST_CASE("OpenGL: fragment compile error names the stage")
{
    auto factory = try_factory();
    if (!factory) return;

    bool thrown = false;
    try {
        render({Pass("broken", "void main() { this is not glsl }", 1, 1)}, *factory, PipelineConfig());
    } catch (const ShaderCompileError& e) {
        thrown = true;
        CHECK(e.stage() == ShaderStage::Fragment);
        CHECK_EQ(e.pass_name(), std::string("broken"));
    }
    CHECK(thrown);
}
