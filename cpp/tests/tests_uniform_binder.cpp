#include "guard/guard.h"
#include "fragpipe/render/errors.hpp"
#include "fragpipe/render/uniform_binder.hpp"
#include "recording_backend.hpp"

#include <string>

using guard::Approx;
using namespace fragpipe;
using fragpipe::testing::RecordingBackend;
using fragpipe::testing::RecordingShader;
using fragpipe::testing::RecordingState;
using fragpipe::testing::UniformCall;

static Image red_pixel() {
    return Image(1, 1, std::vector<uint8_t>{255, 0, 0, 255});
}

TEST_CASE("Binder sets scalar, vector, matrix and array uniforms")
{
    RecordingState state;
    RecordingBackend backend(state);
    RecordingShader shader(state);
    PassResults results;
    UniformBinder binder(backend, shader, results, 8);

    binder.bind(Uniform("u_time", 0.25f));
    binder.bind(Uniform("u_frame", int32_t(7)));
    binder.bind(Uniform("u_color", Vec3f{0.1f, 0.2f, 0.3f}));
    binder.bind(Uniform("u_cell", Vec2i{4, -2}));
    Mat2f m;
    m.data = {1, 2, 3, 4};
    binder.bind(Uniform("u_rot", m));
    binder.bind(Uniform("u_weights", FloatArray{{0.5f, 0.25f, 0.125f}}));
    binder.bind(Uniform("u_ids", IntArray{{3, 1}}));

    const UniformCall* time = state.call_for("u_time");
    CHECK(time != nullptr);
    CHECK_EQ(time->kind, std::string("float"));
    CHECK_EQ(time->values[0], Approx(0.25).epsilon(1e-6));

    CHECK_EQ(state.call_for("u_frame")->kind, std::string("int"));
    CHECK_EQ(state.call_for("u_frame")->values[0], Approx(7.0).epsilon(1e-6));

    const UniformCall* color = state.call_for("u_color");
    CHECK_EQ(color->kind, std::string("vec3"));
    CHECK_EQ(color->values[2], Approx(0.3).epsilon(1e-6));

    CHECK_EQ(state.call_for("u_cell")->kind, std::string("ivec2"));
    CHECK_EQ(state.call_for("u_cell")->values[1], Approx(-2.0).epsilon(1e-6));

    const UniformCall* rot = state.call_for("u_rot");
    CHECK_EQ(rot->kind, std::string("mat2"));
    CHECK_EQ(rot->values.size(), 4u);
    CHECK_EQ(rot->values[1], Approx(2.0).epsilon(1e-6));

    CHECK_EQ(state.call_for("u_weights")->values.size(), 3u);
    CHECK_EQ(state.call_for("u_ids")->kind, std::string("int[]"));
    CHECK_EQ(binder.texture_slots_used(), 0);
}

TEST_CASE("Binder assigns texture slots in uniform order")
{
    RecordingState state;
    RecordingBackend backend(state);
    RecordingShader shader(state);
    PassResults results;
    UniformBinder binder(backend, shader, results, 8);

    binder.bind(Uniform::texture("A", red_pixel(), TextureFilter::NEAREST, TextureWrap::REPEAT));
    binder.bind(Uniform::texture("B", red_pixel()));

    CHECK_EQ(binder.texture_slots_used(), 2);
    CHECK_EQ(state.textures.size(), 2u);
    CHECK_EQ(state.textures[0].unit, 0);
    CHECK_EQ(state.textures[1].unit, 1);
    CHECK(state.textures[0].filter == TextureFilter::NEAREST);
    CHECK(state.textures[0].wrap == TextureWrap::REPEAT);
    CHECK(state.textures[1].filter == TextureFilter::LINEAR);
    CHECK(state.textures[1].wrap == TextureWrap::CLAMP);

    // Sampler uniform holds the slot index
    CHECK_EQ(state.call_for("A")->values[0], Approx(0.0).epsilon(1e-6));
    CHECK_EQ(state.call_for("B")->values[0], Approx(1.0).epsilon(1e-6));
}

TEST_CASE("Binder uploads float images as float textures")
{
    RecordingState state;
    RecordingBackend backend(state);
    RecordingShader shader(state);
    PassResults results;
    UniformBinder binder(backend, shader, results, 8);

    binder.bind(Uniform::texture("Hdr", Image(1, 1, std::vector<float>{2.0f, 0.5f, 0.0f, 1.0f})));
    CHECK(state.textures[0].is_float);
}

TEST_CASE("Binder resolves pass references against earlier results")
{
    RecordingState state;
    RecordingBackend backend(state);
    RecordingShader shader(state);
    PassResults results;
    results.insert("first", Image(2, 1, std::vector<uint8_t>{9, 8, 7, 6, 0, 0, 0, 0}));
    UniformBinder binder(backend, shader, results, 8);

    binder.bind(Uniform::pass("Prev", "first", TextureFilter::NEAREST));

    CHECK_EQ(state.textures.size(), 1u);
    CHECK_EQ(state.textures[0].width, 2);
    CHECK_EQ(int(state.textures[0].first_pixel[0]), 9);
    CHECK(state.textures[0].filter == TextureFilter::NEAREST);
    CHECK_EQ(binder.texture_slots_used(), 1);
}

TEST_CASE("Binder rejects unresolved pass references")
{
    RecordingState state;
    RecordingBackend backend(state);
    RecordingShader shader(state);
    PassResults results;
    UniformBinder binder(backend, shader, results, 8);

    bool thrown = false;
    try {
        binder.bind(Uniform::pass("Prev", "later"));
    } catch (const UnresolvedPassReferenceError& e) {
        thrown = true;
        std::string msg = e.what();
        CHECK(msg.find("later") != std::string::npos);
        CHECK(msg.find("Prev") != std::string::npos);
    }
    CHECK(thrown);
    CHECK(state.textures.empty());
}

TEST_CASE("Binder enforces the texture slot limit")
{
    RecordingState state;
    RecordingBackend backend(state);
    RecordingShader shader(state);
    PassResults results;
    UniformBinder binder(backend, shader, results, 8);

    for (int i = 0; i < 8; ++i) {
        binder.bind(Uniform::texture("T" + std::to_string(i), red_pixel()));
    }
    CHECK_EQ(binder.texture_slots_used(), 8);

    bool thrown = false;
    try {
        binder.bind(Uniform::texture("T8", red_pixel()));
    } catch (const TooManyTexturesError& e) {
        thrown = true;
        CHECK_EQ(e.limit(), 8);
        CHECK_EQ(e.uniform_name(), std::string("T8"));
    }
    CHECK(thrown);
    CHECK_EQ(state.textures.size(), 8u);
}

TEST_CASE("Binder tolerates names the program does not declare")
{
    RecordingState state;
    state.undeclared_uniforms.insert("u_unused");
    RecordingBackend backend(state);
    RecordingShader shader(state);
    PassResults results;
    UniformBinder binder(backend, shader, results, 8);

    binder.bind(Uniform("u_unused", 1.0f));
    binder.bind(Uniform::texture("u_unused", red_pixel()));

    CHECK(state.uniform_calls.empty());
    // The texture still occupies a slot
    CHECK_EQ(binder.texture_slots_used(), 1);
}

TEST_CASE("Binder propagates texture creation failure")
{
    RecordingState state;
    state.fail_texture = true;
    RecordingBackend backend(state);
    RecordingShader shader(state);
    PassResults results;
    UniformBinder binder(backend, shader, results, 8);

    bool thrown = false;
    try {
        binder.bind(Uniform::texture("T", red_pixel()));
    } catch (const ResourceCreationError&) {
        thrown = true;
    }
    CHECK(thrown);
    CHECK_EQ(binder.texture_slots_used(), 0);
}
