#pragma once

#include <vector>

#include "fragpipe/render/pass.hpp"
#include "fragpipe/render/pass_results.hpp"
#include "fragpipe/render/pipeline_config.hpp"
#include "fragpipe/render/render_context.hpp"

namespace fragpipe {

/**
 * Runs an ordered list of passes, one context per pass.
 *
 * Each pass sees the images of every pass before it. The first error
 * aborts the run; partial results are discarded.
 */
class RenderPipeline {
public:
    RenderPipeline(RenderContextFactory& factory, const PipelineConfig& config = PipelineConfig());

    // Non-copyable
    RenderPipeline(const RenderPipeline&) = delete;
    RenderPipeline& operator=(const RenderPipeline&) = delete;

    // Throws RenderError (with the failing pass name where one applies)
    PassResults run(const std::vector<Pass>& passes);

    const PipelineConfig& config() const { return config_; }

    // min(config.max_texture_slots, factory.max_texture_units())
    int texture_slot_limit() const { return texture_slot_limit_; }

private:
    RenderContextFactory& factory_;
    PipelineConfig config_;
    int texture_slot_limit_;
};

// Throws DuplicatePassNameError on the first repeated name
void check_unique_pass_names(const std::vector<Pass>& passes);

/**
 * Checks every pass without touching the GPU: dimensions, fragment shader
 * presence and name uniqueness. Errors carry the offending pass name.
 */
void validate_passes(const std::vector<Pass>& passes);

/**
 * Render passes with hidden SDL windows and the default configuration.
 *
 * All entry points validate the passes before the factory creates any
 * context, and apply config.log_level when it is set.
 */
PassResults render(const std::vector<Pass>& passes);

PassResults render(const std::vector<Pass>& passes, const PipelineConfig& config);

PassResults render(
    const std::vector<Pass>& passes,
    RenderContextFactory& factory,
    const PipelineConfig& config
);

} // namespace fragpipe
