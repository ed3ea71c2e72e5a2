#include "sdl_offscreen_context.hpp"
#include "fragpipe/render/errors.hpp"
#include "fp_log.hpp"

#include <string>

namespace fragpipe {

// ============================================================================
// SDLOffscreenContext
// ============================================================================

SDLOffscreenContext::SDLOffscreenContext(int width, int height, const ContextOptions& options)
    : window_(nullptr), gl_context_(nullptr), size_(width, height), target_(nullptr) {

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, options.gl_major);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, options.gl_minor);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK,
        options.core_profile ? SDL_GL_CONTEXT_PROFILE_CORE : SDL_GL_CONTEXT_PROFILE_COMPATIBILITY);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 0);
    SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 0);

    // 1x1 carrier window, the pass size only applies to target()
    window_ = SDL_CreateWindow(
        "fragpipe",
        SDL_WINDOWPOS_UNDEFINED, SDL_WINDOWPOS_UNDEFINED,
        1, 1,
        SDL_WINDOW_OPENGL | SDL_WINDOW_HIDDEN
    );
    if (!window_) {
        throw ResourceCreationError(std::string("Failed to create SDL window: ") + SDL_GetError());
    }

    gl_context_ = SDL_GL_CreateContext(window_);
    if (!gl_context_) {
        std::string error = SDL_GetError();
        SDL_DestroyWindow(window_);
        window_ = nullptr;
        throw ResourceCreationError("Failed to create GL context: " + error);
    }

    try {
        make_current();

        graphics_ = std::make_unique<OpenGLGraphicsBackend>();
        graphics_->ensure_ready();

        target_ = graphics_->create_framebuffer(width, height);
        graphics_->bind_framebuffer(target_);
        graphics_->set_viewport(0, 0, width, height);
    } catch (...) {
        destroy();
        throw;
    }

    const GLubyte* version = glGetString(GL_VERSION);
    fp::Log::debug("[SDLOffscreenContext] %dx%d context, GL %s",
        width, height, version ? reinterpret_cast<const char*>(version) : "?");
}

SDLOffscreenContext::~SDLOffscreenContext() {
    destroy();
}

void SDLOffscreenContext::make_current() {
    if (window_ && gl_context_) {
        if (SDL_GL_MakeCurrent(window_, gl_context_) != 0) {
            throw ResourceCreationError(std::string("Failed to make GL context current: ") + SDL_GetError());
        }
    }
}

void SDLOffscreenContext::destroy() {
    if (!window_) return;

    if (gl_context_) {
        // GL objects must be deleted with their context current
        if (SDL_GL_MakeCurrent(window_, gl_context_) != 0) {
            fp::Log::warn("[SDLOffscreenContext] make current before teardown failed: %s", SDL_GetError());
        }
        if (graphics_) {
            graphics_->release_all();
            graphics_.reset();
        }
        target_ = nullptr;

        SDL_GL_MakeCurrent(window_, nullptr);
        SDL_GL_DeleteContext(gl_context_);
        gl_context_ = nullptr;
    }

    SDL_DestroyWindow(window_);
    window_ = nullptr;
}

// ============================================================================
// SDLOffscreenContextFactory
// ============================================================================

SDLOffscreenContextFactory::SDLOffscreenContextFactory(ContextOptions options)
    : options_(std::move(options)) {
    if (!options_.video_driver.empty()) {
        SDL_SetHint(SDL_HINT_VIDEODRIVER, options_.video_driver.c_str());
    }

    if (SDL_InitSubSystem(SDL_INIT_VIDEO) != 0) {
        throw ResourceCreationError(std::string("Failed to initialize SDL: ") + SDL_GetError());
    }

    fp::Log::debug("[SDLOffscreenContextFactory] video driver '%s'", SDL_GetCurrentVideoDriver());
}

SDLOffscreenContextFactory::~SDLOffscreenContextFactory() {
    SDL_QuitSubSystem(SDL_INIT_VIDEO);
}

RenderContextPtr SDLOffscreenContextFactory::acquire(int width, int height) {
    return std::make_unique<SDLOffscreenContext>(width, height, options_);
}

int SDLOffscreenContextFactory::max_texture_units() {
    if (max_texture_units_ > 0) return max_texture_units_;

    auto query_ctx = acquire(1, 1);
    max_texture_units_ = query_ctx->graphics().max_texture_units();
    query_ctx->destroy();

    return max_texture_units_;
}

} // namespace fragpipe
