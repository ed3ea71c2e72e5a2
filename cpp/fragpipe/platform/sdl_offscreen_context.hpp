#pragma once

#include <SDL2/SDL.h>

#include <memory>

#include "fragpipe/render/opengl/opengl_backend.hpp"
#include "fragpipe/render/pipeline_config.hpp"
#include "fragpipe/render/render_context.hpp"

namespace fragpipe {

/**
 * Hidden SDL2 window with its own OpenGL context and an offscreen
 * framebuffer of exactly the requested size.
 *
 * The 1x1 window only carries the context; rendering goes to target().
 */
class SDLOffscreenContext : public RenderContext {
public:
    SDLOffscreenContext(int width, int height, const ContextOptions& options);
    ~SDLOffscreenContext() override;

    SDLOffscreenContext(const SDLOffscreenContext&) = delete;
    SDLOffscreenContext& operator=(const SDLOffscreenContext&) = delete;

    GraphicsBackend& graphics() override { return *graphics_; }
    FramebufferHandle* target() override { return target_; }
    Size2i size() const override { return size_; }

    void destroy() override;
    bool is_destroyed() const override { return window_ == nullptr; }

    void make_current();

private:
    SDL_Window* window_;
    SDL_GLContext gl_context_;
    Size2i size_;
    std::unique_ptr<OpenGLGraphicsBackend> graphics_;
    FramebufferHandle* target_;
};

/**
 * Factory of SDLOffscreenContext.
 *
 * Initializes the SDL video subsystem for its lifetime.
 */
class SDLOffscreenContextFactory : public RenderContextFactory {
public:
    explicit SDLOffscreenContextFactory(ContextOptions options = {});
    ~SDLOffscreenContextFactory() override;

    SDLOffscreenContextFactory(const SDLOffscreenContextFactory&) = delete;
    SDLOffscreenContextFactory& operator=(const SDLOffscreenContextFactory&) = delete;

    RenderContextPtr acquire(int width, int height) override;

    // Queried once through a 1x1 context and cached
    int max_texture_units() override;

    const ContextOptions& options() const { return options_; }

private:
    ContextOptions options_;
    int max_texture_units_ = 0;
};

} // namespace fragpipe
