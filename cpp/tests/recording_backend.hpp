// Recording fake backend: no GPU, every call is logged into RecordingState.
#pragma once

#include "fragpipe/render/errors.hpp"
#include "fragpipe/render/graphics_backend.hpp"
#include "fragpipe/render/render_context.hpp"

#include <array>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fragpipe::testing {

struct UniformCall {
    std::string kind;
    int location;
    std::vector<float> values;
};

struct TextureRecord {
    int width;
    int height;
    bool is_float;
    TextureFilter filter;
    TextureWrap wrap;
    int unit = -1;
    std::array<uint8_t, 4> first_pixel;
};

struct RecordingState {
    // Configuration
    int max_texture_units = 16;
    std::array<uint8_t, 4> fill = {0, 0, 0, 0};
    std::set<std::string> undeclared_uniforms;
    bool fail_acquire = false;
    std::optional<ShaderStage> fail_compile;
    bool fail_link = false;
    bool fail_texture = false;
    // Query the unit count through a 1x1 context, as the SDL factory does
    bool units_query_acquires = false;

    // Observations
    int contexts_acquired = 0;
    int contexts_destroyed = 0;
    std::vector<Size2i> context_sizes;
    std::vector<std::string> events;
    std::vector<UniformCall> uniform_calls;
    std::map<std::string, int> locations;
    std::vector<TextureRecord> textures;
    std::vector<std::string> vertex_sources;
    std::vector<std::string> fragment_sources;
    std::vector<std::string> mesh_attributes;

    int count(const std::string& event) const {
        int n = 0;
        for (const auto& e : events) {
            if (e == event) ++n;
        }
        return n;
    }

    int index_of(const std::string& event) const {
        for (size_t i = 0; i < events.size(); ++i) {
            if (events[i] == event) return static_cast<int>(i);
        }
        return -1;
    }

    const UniformCall* call_at(int location) const {
        const UniformCall* found = nullptr;
        for (const auto& c : uniform_calls) {
            if (c.location == location) found = &c;
        }
        return found;
    }

    const UniformCall* call_for(const std::string& name) const {
        auto it = locations.find(name);
        return it == locations.end() ? nullptr : call_at(it->second);
    }
};

class RecordingShader : public ShaderHandle {
public:
    explicit RecordingShader(RecordingState& state) : state_(state) {}

    void use() override { state_.events.push_back("use"); }
    void release() override {}
    uint32_t get_id() const override { return 1; }

    int uniform_location(const char* name) override {
        if (state_.undeclared_uniforms.count(name)) {
            return -1;
        }
        auto it = state_.locations.find(name);
        if (it != state_.locations.end()) {
            return it->second;
        }
        int loc = static_cast<int>(state_.locations.size());
        state_.locations[name] = loc;
        return loc;
    }

    int attribute_location(const char* name) override {
        std::string n(name);
        return (n == "Position" || n == "UV") ? (n == "Position" ? 0 : 1) : -1;
    }

    void set_uniform_float(int loc, float v) override { record("float", loc, {v}); }
    void set_uniform_int(int loc, int v) override { record("int", loc, {static_cast<float>(v)}); }
    void set_uniform_vec2(int loc, float x, float y) override { record("vec2", loc, {x, y}); }
    void set_uniform_vec3(int loc, float x, float y, float z) override { record("vec3", loc, {x, y, z}); }
    void set_uniform_vec4(int loc, float x, float y, float z, float w) override {
        record("vec4", loc, {x, y, z, w});
    }
    void set_uniform_ivec2(int loc, int x, int y) override {
        record("ivec2", loc, {float(x), float(y)});
    }
    void set_uniform_ivec3(int loc, int x, int y, int z) override {
        record("ivec3", loc, {float(x), float(y), float(z)});
    }
    void set_uniform_ivec4(int loc, int x, int y, int z, int w) override {
        record("ivec4", loc, {float(x), float(y), float(z), float(w)});
    }
    void set_uniform_matrix2(int loc, const float* d) override { record("mat2", loc, {d, d + 4}); }
    void set_uniform_matrix3(int loc, const float* d) override { record("mat3", loc, {d, d + 9}); }
    void set_uniform_matrix4(int loc, const float* d) override { record("mat4", loc, {d, d + 16}); }
    void set_uniform_float_array(int loc, const float* d, int n) override {
        record("float[]", loc, {d, d + n});
    }
    void set_uniform_int_array(int loc, const int* d, int n) override {
        std::vector<float> values;
        for (int i = 0; i < n; ++i) values.push_back(static_cast<float>(d[i]));
        record("int[]", loc, values);
    }

private:
    void record(const char* kind, int loc, std::vector<float> values) {
        if (loc < 0) return;
        state_.uniform_calls.push_back({kind, loc, std::move(values)});
    }

    RecordingState& state_;
};

class RecordingMesh : public GPUMeshHandle {
public:
    explicit RecordingMesh(RecordingState& state) : state_(state) {}
    void draw() override { state_.events.push_back("draw"); }
    void release() override {}

private:
    RecordingState& state_;
};

class RecordingTexture : public GPUTextureHandle {
public:
    RecordingTexture(RecordingState& state, size_t index, int w, int h)
        : state_(state), index_(index), width_(w), height_(h) {}

    void bind(int unit) override {
        state_.textures[index_].unit = unit;
        state_.events.push_back("bind_texture " + std::to_string(unit));
    }
    void release() override {}
    uint32_t get_id() const override { return static_cast<uint32_t>(index_ + 1); }
    int get_width() const override { return width_; }
    int get_height() const override { return height_; }

private:
    RecordingState& state_;
    size_t index_;
    int width_;
    int height_;
};

class RecordingFramebuffer : public FramebufferHandle {
public:
    RecordingFramebuffer(int w, int h) : width_(w), height_(h) {}
    void release() override {}
    uint32_t get_fbo_id() const override { return 1; }
    int get_width() const override { return width_; }
    int get_height() const override { return height_; }

private:
    int width_;
    int height_;
};

class RecordingBackend : public GraphicsBackend {
public:
    explicit RecordingBackend(RecordingState& state) : state_(state) {}

    void ensure_ready() override {}
    int max_texture_units() override { return state_.max_texture_units; }

    void set_viewport(int, int, int w, int h) override {
        state_.events.push_back("viewport " + std::to_string(w) + "x" + std::to_string(h));
    }

    void clear_color(float r, float g, float b, float a) override {
        state_.events.push_back((r == 0 && g == 0 && b == 0 && a == 0) ? "clear" : "clear_nonzero");
    }

    ShaderHandle* create_shader(const char* vs, const char* fs) override {
        state_.vertex_sources.push_back(vs);
        state_.fragment_sources.push_back(fs);
        if (state_.fail_compile) {
            throw ShaderCompileError(*state_.fail_compile, "0:1: syntax error");
        }
        if (state_.fail_link) {
            throw ShaderLinkError("undefined varying");
        }
        state_.events.push_back("shader");
        shaders_.push_back(std::make_unique<RecordingShader>(state_));
        return shaders_.back().get();
    }

    GPUMeshHandle* create_mesh(
        ShaderHandle* shader,
        const float*,
        int vertex_count,
        int stride_floats,
        const std::vector<VertexAttribute>& attributes
    ) override {
        for (const auto& a : attributes) {
            if (shader->attribute_location(a.name) >= 0) {
                state_.mesh_attributes.push_back(a.name);
            }
        }
        state_.events.push_back("mesh " + std::to_string(vertex_count) + "/" + std::to_string(stride_floats));
        meshes_.push_back(std::make_unique<RecordingMesh>(state_));
        return meshes_.back().get();
    }

    GPUTextureHandle* create_texture(const Image& image, TextureFilter filter, TextureWrap wrap) override {
        if (state_.fail_texture) {
            throw ResourceCreationError("texture allocation failed");
        }
        state_.textures.push_back({image.width(), image.height(), image.is_float(),
            filter, wrap, -1, image.pixel_rgba8(0, 0)});
        state_.events.push_back("texture");
        textures_.push_back(std::make_unique<RecordingTexture>(
            state_, state_.textures.size() - 1, image.width(), image.height()));
        return textures_.back().get();
    }

    FramebufferHandle* create_framebuffer(int w, int h) override {
        framebuffers_.push_back(std::make_unique<RecordingFramebuffer>(w, h));
        return framebuffers_.back().get();
    }

    void bind_framebuffer(FramebufferHandle*) override { state_.events.push_back("bind_framebuffer"); }

    std::vector<uint8_t> read_pixels(FramebufferHandle* fbo) override {
        state_.events.push_back("read");
        std::vector<uint8_t> pixels;
        const int n = fbo->get_width() * fbo->get_height();
        for (int i = 0; i < n; ++i) {
            pixels.insert(pixels.end(), state_.fill.begin(), state_.fill.end());
        }
        return pixels;
    }

    void release_all() override {
        textures_.clear();
        meshes_.clear();
        shaders_.clear();
        framebuffers_.clear();
    }

private:
    RecordingState& state_;
    std::vector<std::unique_ptr<RecordingShader>> shaders_;
    std::vector<std::unique_ptr<RecordingMesh>> meshes_;
    std::vector<std::unique_ptr<RecordingTexture>> textures_;
    std::vector<std::unique_ptr<RecordingFramebuffer>> framebuffers_;
};

class RecordingContext : public RenderContext {
public:
    RecordingContext(RecordingState& state, int w, int h)
        : state_(state), size_(w, h), backend_(std::make_unique<RecordingBackend>(state)) {
        target_ = backend_->create_framebuffer(w, h);
    }

    ~RecordingContext() override { destroy(); }

    GraphicsBackend& graphics() override { return *backend_; }
    FramebufferHandle* target() override { return target_; }
    Size2i size() const override { return size_; }

    void destroy() override {
        if (destroyed_) return;
        destroyed_ = true;
        backend_->release_all();
        target_ = nullptr;
        state_.contexts_destroyed++;
        state_.events.push_back("destroy");
    }

    bool is_destroyed() const override { return destroyed_; }

private:
    RecordingState& state_;
    Size2i size_;
    std::unique_ptr<RecordingBackend> backend_;
    FramebufferHandle* target_ = nullptr;
    bool destroyed_ = false;
};

class RecordingFactory : public RenderContextFactory {
public:
    RecordingState state;

    RenderContextPtr acquire(int width, int height) override {
        if (state.fail_acquire) {
            throw ResourceCreationError("no display");
        }
        state.contexts_acquired++;
        state.context_sizes.push_back(Size2i(width, height));
        state.events.push_back("acquire");
        return std::make_unique<RecordingContext>(state, width, height);
    }

    int max_texture_units() override {
        if (state.units_query_acquires) {
            RenderContextPtr ctx = acquire(1, 1);
            ctx->destroy();
        }
        return state.max_texture_units;
    }
};

// Shader source that is never compiled by the fake
inline const char* dummy_fragment() {
    return "void main() { gl_FragColor = vec4(1.0); }";
}

} // namespace fragpipe::testing
