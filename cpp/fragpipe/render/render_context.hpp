#pragma once

#include <memory>

#include "fragpipe/render/graphics_backend.hpp"
#include "fragpipe/render/handles.hpp"
#include "fragpipe/render/types.hpp"

namespace fragpipe {

/**
 * One isolated rendering context sized for a single pass.
 *
 * Owns the backend and an offscreen framebuffer of exactly size().
 * destroy() releases every backend object and the context itself; it is
 * idempotent and implementations call it from their destructor, so holding
 * the context in a unique_ptr is enough to guarantee teardown.
 */
class RenderContext {
public:
    virtual ~RenderContext() = default;

    virtual GraphicsBackend& graphics() = 0;
    virtual FramebufferHandle* target() = 0;
    virtual Size2i size() const = 0;

    virtual void destroy() = 0;
    virtual bool is_destroyed() const = 0;
};

using RenderContextPtr = std::unique_ptr<RenderContext>;

/**
 * Source of rendering contexts.
 */
class RenderContextFactory {
public:
    virtual ~RenderContextFactory() = default;

    // Throws ResourceCreationError when no context can be created
    virtual RenderContextPtr acquire(int width, int height) = 0;

    // Number of texture units a fragment shader can sample from
    virtual int max_texture_units() = 0;
};

} // namespace fragpipe
