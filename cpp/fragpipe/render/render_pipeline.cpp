#include "render_pipeline.hpp"
#include "errors.hpp"
#include "pass_executor.hpp"
#include "fragpipe/platform/sdl_offscreen_context.hpp"
#include "fp_log.hpp"

#include <algorithm>
#include <unordered_set>

namespace fragpipe {

namespace {

int effective_slot_limit(RenderContextFactory& factory, const PipelineConfig& config) {
    int units = factory.max_texture_units();
    if (units <= 0) {
        fp::Log::warn("[RenderPipeline] backend reports %d texture units", units);
        return 0;
    }
    return std::min(config.max_texture_slots, units);
}

} // anonymous namespace

RenderPipeline::RenderPipeline(RenderContextFactory& factory, const PipelineConfig& config)
    : factory_(factory)
    , config_(config)
    , texture_slot_limit_(effective_slot_limit(factory, config)) {
    fp::Log::info("[RenderPipeline] texture slot limit: %d (configured %d)",
        texture_slot_limit_, config_.max_texture_slots);
}

void check_unique_pass_names(const std::vector<Pass>& passes) {
    std::unordered_set<std::string> seen;
    for (const Pass& pass : passes) {
        if (!seen.insert(pass.name).second) {
            throw DuplicatePassNameError(pass.name);
        }
    }
}

void validate_passes(const std::vector<Pass>& passes) {
    for (const Pass& pass : passes) {
        try {
            validate_pass(pass);
        } catch (RenderError& e) {
            e.set_pass_name(pass.name);
            throw;
        }
    }
    check_unique_pass_names(passes);
}

PassResults RenderPipeline::run(const std::vector<Pass>& passes) {
    validate_passes(passes);

    PassExecutor executor(factory_, texture_slot_limit_);
    PassResults results;

    for (const Pass& pass : passes) {
        Image image = executor.execute(pass, results);
        results.insert(pass.name, std::move(image));
    }

    fp::Log::info("[RenderPipeline] rendered %zu pass(es)", results.size());
    return results;
}

PassResults render(const std::vector<Pass>& passes) {
    return render(passes, PipelineConfig());
}

PassResults render(const std::vector<Pass>& passes, const PipelineConfig& config) {
    apply_log_level(config);
    // The SDL factory opens a context as soon as the pipeline is built
    validate_passes(passes);

    // Nothing to draw: no need for a video subsystem
    if (passes.empty()) {
        return PassResults();
    }
    SDLOffscreenContextFactory factory(config.context);
    return render(passes, factory, config);
}

PassResults render(
    const std::vector<Pass>& passes,
    RenderContextFactory& factory,
    const PipelineConfig& config
) {
    apply_log_level(config);
    validate_passes(passes);

    RenderPipeline pipeline(factory, config);
    return pipeline.run(passes);
}

} // namespace fragpipe
