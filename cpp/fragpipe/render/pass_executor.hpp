#pragma once

#include "fragpipe/render/image.hpp"
#include "fragpipe/render/pass.hpp"
#include "fragpipe/render/pass_results.hpp"
#include "fragpipe/render/render_context.hpp"

namespace fragpipe {

// Throws InvalidDimensionsError or MissingShaderError; touches no GPU state
void validate_pass(const Pass& pass);

/**
 * Renders a single pass in its own short-lived context.
 *
 * Sequence per pass: validate, acquire a context of the pass size, build
 * the program, draw the full-screen quad with the uniforms bound, read the
 * target back, tear the context down. Teardown happens on every exit path.
 */
class PassExecutor {
public:
    PassExecutor(RenderContextFactory& factory, int texture_slot_limit);

    /**
     * Render one pass. Earlier results resolve pass-reference uniforms.
     *
     * Returns RGBA8 pixels, width * height * 4 bytes, bottom row first.
     * Any RenderError thrown carries the pass name.
     */
    Image execute(const Pass& pass, const PassResults& results);

    int texture_slot_limit() const { return texture_slot_limit_; }

private:
    Image render(const Pass& pass, const PassResults& results);

    RenderContextFactory& factory_;
    int texture_slot_limit_;
};

} // namespace fragpipe
