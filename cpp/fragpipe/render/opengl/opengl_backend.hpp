#pragma once

#include <glad/glad.h>
#include <memory>
#include <vector>

#include "fragpipe/render/errors.hpp"
#include "fragpipe/render/graphics_backend.hpp"
#include "fragpipe/render/opengl/opengl_framebuffer.hpp"
#include "fragpipe/render/opengl/opengl_mesh.hpp"
#include "fragpipe/render/opengl/opengl_shader.hpp"
#include "fragpipe/render/opengl/opengl_texture.hpp"

namespace fragpipe {

/**
 * Initialize OpenGL function pointers via glad.
 * Must be called after an OpenGL context is made current.
 * Returns true on success.
 */
inline bool init_opengl() {
    return gladLoadGL() != 0;
}

/**
 * OpenGL graphics backend bound to one context.
 *
 * Owns everything it creates; release_all() (or destruction) deletes the
 * GL objects while the context is still current.
 */
class OpenGLGraphicsBackend : public GraphicsBackend {
public:
    OpenGLGraphicsBackend() : initialized_(false) {}

    ~OpenGLGraphicsBackend() override {
        release_all();
    }

    void ensure_ready() override {
        if (initialized_) return;

        if (!glad_initialized_) {
            if (!init_opengl()) {
                throw ResourceCreationError("Failed to initialize GLAD");
            }
            glad_initialized_ = true;
        }

        // Full-screen passes: no depth, no culling, no blending
        glDisable(GL_DEPTH_TEST);
        glDisable(GL_CULL_FACE);
        glDisable(GL_BLEND);
        glPixelStorei(GL_PACK_ALIGNMENT, 1);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);

        initialized_ = true;
    }

    // --- Capabilities ---

    int max_texture_units() override {
        GLint units = 0;
        glGetIntegerv(GL_MAX_TEXTURE_IMAGE_UNITS, &units);
        return static_cast<int>(units);
    }

    // --- Viewport ---

    void set_viewport(int x, int y, int width, int height) override {
        glViewport(x, y, width, height);
    }

    // --- Clear ---

    void clear_color(float r, float g, float b, float a) override {
        glClearColor(r, g, b, a);
        glClear(GL_COLOR_BUFFER_BIT);
    }

    // --- Resource creation ---

    ShaderHandle* create_shader(const char* vertex_source, const char* fragment_source) override {
        shaders_.push_back(std::make_unique<OpenGLShaderHandle>(vertex_source, fragment_source));
        return shaders_.back().get();
    }

    GPUMeshHandle* create_mesh(
        ShaderHandle* shader,
        const float* vertices,
        int vertex_count,
        int stride_floats,
        const std::vector<VertexAttribute>& attributes
    ) override {
        meshes_.push_back(std::make_unique<OpenGLRawMeshHandle>(
            shader, vertices, vertex_count, stride_floats, attributes));
        return meshes_.back().get();
    }

    GPUTextureHandle* create_texture(
        const Image& image,
        TextureFilter filter,
        TextureWrap wrap
    ) override {
        textures_.push_back(std::make_unique<OpenGLTextureHandle>(image, filter, wrap));
        return textures_.back().get();
    }

    FramebufferHandle* create_framebuffer(int width, int height) override {
        framebuffers_.push_back(std::make_unique<OpenGLFramebufferHandle>(width, height));
        return framebuffers_.back().get();
    }

    // --- Framebuffer operations ---

    void bind_framebuffer(FramebufferHandle* fbo) override {
        if (fbo == nullptr) {
            glBindFramebuffer(GL_FRAMEBUFFER, 0);
        } else {
            glBindFramebuffer(GL_FRAMEBUFFER, fbo->get_fbo_id());
        }
    }

    // --- Read operations ---

    std::vector<uint8_t> read_pixels(FramebufferHandle* fbo) override {
        if (fbo == nullptr) {
            throw RenderError("read_pixels: no framebuffer");
        }

        int width = fbo->get_width();
        int height = fbo->get_height();
        std::vector<uint8_t> pixels(static_cast<size_t>(width) * height * 4);

        bind_framebuffer(fbo);
        glPixelStorei(GL_PACK_ALIGNMENT, 1);
        glReadPixels(0, 0, width, height, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());

        return pixels;
    }

    // --- Teardown ---

    void release_all() override {
        textures_.clear();
        meshes_.clear();
        shaders_.clear();
        framebuffers_.clear();
    }

private:
    bool initialized_;

    std::vector<std::unique_ptr<OpenGLShaderHandle>> shaders_;
    std::vector<std::unique_ptr<OpenGLRawMeshHandle>> meshes_;
    std::vector<std::unique_ptr<OpenGLTextureHandle>> textures_;
    std::vector<std::unique_ptr<OpenGLFramebufferHandle>> framebuffers_;

    // Static flag for GLAD initialization (shared across all backends)
    static inline bool glad_initialized_ = false;
};

} // namespace fragpipe
