#pragma once

#include "fragpipe/render/graphics_backend.hpp"
#include "fragpipe/render/handles.hpp"
#include "fragpipe/render/pass_results.hpp"
#include "fragpipe/render/uniform.hpp"

namespace fragpipe {

/**
 * Binds one pass's uniforms to its linked program.
 *
 * One binder serves one pass: it owns the texture slot counter shared by
 * every texture-bearing uniform of that pass. Textures it creates belong to
 * the backend and are released with the context.
 */
class UniformBinder {
public:
    UniformBinder(
        GraphicsBackend& graphics,
        ShaderHandle& program,
        const PassResults& results,
        int texture_slot_limit
    );

    /**
     * Bind a single uniform. The program must be in use.
     *
     * Throws TooManyTexturesError, UnresolvedPassReferenceError,
     * ResourceCreationError.
     */
    void bind(const Uniform& uniform);

    int texture_slots_used() const { return next_texture_slot_; }
    int texture_slot_limit() const { return texture_slot_limit_; }

private:
    void bind_texture(
        const Uniform& uniform,
        int location,
        const Image& image,
        TextureFilter filter,
        TextureWrap wrap
    );

    GraphicsBackend& graphics_;
    ShaderHandle& program_;
    const PassResults& results_;
    int texture_slot_limit_;
    int next_texture_slot_ = 0;
};

} // namespace fragpipe
