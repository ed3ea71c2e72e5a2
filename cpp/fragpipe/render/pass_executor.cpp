#include "pass_executor.hpp"
#include "errors.hpp"
#include "shader_program.hpp"
#include "uniform_binder.hpp"
#include "fp_log.hpp"

#include <string>

namespace fragpipe {

namespace {

// Two triangles as a strip covering clip space: x, y, u, v
const float FULLSCREEN_QUAD[] = {
    -1.0f, -1.0f, 0.0f, 0.0f,
     1.0f, -1.0f, 1.0f, 0.0f,
    -1.0f,  1.0f, 0.0f, 1.0f,
     1.0f,  1.0f, 1.0f, 1.0f,
};

const std::vector<VertexAttribute>& quad_attributes() {
    static const std::vector<VertexAttribute> attributes = {
        {"Position", 2, 0},
        {"UV", 2, 2},
    };
    return attributes;
}

} // anonymous namespace

void validate_pass(const Pass& pass) {
    if (pass.width <= 0 || pass.height <= 0) {
        throw InvalidDimensionsError(
            "Invalid pass size " + std::to_string(pass.width) + "x" +
            std::to_string(pass.height) + ": both dimensions must be positive");
    }
    if (!pass.fragment_source) {
        throw MissingShaderError("Pass has no fragment shader");
    }
}

PassExecutor::PassExecutor(RenderContextFactory& factory, int texture_slot_limit)
    : factory_(factory), texture_slot_limit_(texture_slot_limit) {}

Image PassExecutor::execute(const Pass& pass, const PassResults& results) {
    try {
        return render(pass, results);
    } catch (RenderError& e) {
        if (!e.has_pass_name()) {
            e.set_pass_name(pass.name);
        }
        throw;
    }
}

Image PassExecutor::render(const Pass& pass, const PassResults& results) {
    validate_pass(pass);

    fp::Log::debug("[PassExecutor] pass '%s': %dx%d, %zu uniforms",
        pass.name.c_str(), pass.width, pass.height, pass.uniforms.size());

    RenderContextPtr context = factory_.acquire(pass.width, pass.height);
    if (!context) {
        throw ResourceCreationError("Context factory returned no context");
    }
    GraphicsBackend& graphics = context->graphics();

    ShaderProgram program(
        pass.vertex_source ? *pass.vertex_source : std::string(default_vertex_shader()),
        *pass.fragment_source);
    ShaderHandle& handle = program.ensure_ready(graphics);
    program.use();

    GPUMeshHandle* quad = graphics.create_mesh(
        &handle, FULLSCREEN_QUAD, 4, 4, quad_attributes());
    if (!quad) {
        throw ResourceCreationError("Failed to create full-screen quad");
    }

    graphics.bind_framebuffer(context->target());
    graphics.set_viewport(0, 0, pass.width, pass.height);
    graphics.clear_color(0.0f, 0.0f, 0.0f, 0.0f);

    UniformBinder binder(graphics, handle, results, texture_slot_limit_);
    for (const Uniform& uniform : pass.uniforms) {
        binder.bind(uniform);
    }

    quad->draw();

    std::vector<uint8_t> pixels = graphics.read_pixels(context->target());
    context->destroy();

    fp::Log::debug("[PassExecutor] pass '%s' done, %d texture slot(s) used",
        pass.name.c_str(), binder.texture_slots_used());

    return Image(pass.width, pass.height, std::move(pixels));
}

} // namespace fragpipe
