#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "fragpipe/render/handles.hpp"
#include "fragpipe/render/image.hpp"
#include "fragpipe/render/types.hpp"

namespace fragpipe {

/**
 * Vertex attribute fed from an interleaved float buffer, looked up by name.
 */
struct VertexAttribute {
    const char* name;
    int components;
    int offset_floats;
};

/**
 * Abstract graphics backend interface.
 *
 * A backend lives inside one rendering context and owns every resource it
 * creates: the create_* methods return non-owning pointers that stay valid
 * until release_all(). Failure to allocate throws ResourceCreationError.
 * Concrete implementations: OpenGLGraphicsBackend.
 */
class GraphicsBackend {
public:
    virtual ~GraphicsBackend() = default;

    // --- Initialization ---
    virtual void ensure_ready() = 0;

    // --- Capabilities ---
    virtual int max_texture_units() = 0;

    // --- Viewport ---
    virtual void set_viewport(int x, int y, int width, int height) = 0;

    // --- Clear ---
    virtual void clear_color(float r, float g, float b, float a) = 0;

    // --- Resource creation ---

    // Throws ShaderCompileError / ShaderLinkError
    virtual ShaderHandle* create_shader(
        const char* vertex_source,
        const char* fragment_source
    ) = 0;

    // Uploads interleaved vertex data and binds the attributes the program declares
    virtual GPUMeshHandle* create_mesh(
        ShaderHandle* shader,
        const float* vertices,
        int vertex_count,
        int stride_floats,
        const std::vector<VertexAttribute>& attributes
    ) = 0;

    virtual GPUTextureHandle* create_texture(
        const Image& image,
        TextureFilter filter,
        TextureWrap wrap
    ) = 0;

    virtual FramebufferHandle* create_framebuffer(int width, int height) = 0;

    // --- Framebuffer operations ---
    virtual void bind_framebuffer(FramebufferHandle* fbo) = 0;

    // --- Read operations ---

    /**
     * Read the whole color attachment as tightly packed RGBA8.
     * Rows are returned bottom-up, as the graphics API stores them.
     */
    virtual std::vector<uint8_t> read_pixels(FramebufferHandle* fbo) = 0;

    // --- Teardown ---

    // Release every resource created through this backend
    virtual void release_all() = 0;
};

using GraphicsBackendPtr = std::unique_ptr<GraphicsBackend>;

} // namespace fragpipe
