#include "shader_program.hpp"
#include "errors.hpp"
#include "fp_log.hpp"

namespace fragpipe {

static const char* FULLSCREEN_QUAD_VERT = R"(
attribute vec2 Position;
attribute vec2 UV;
varying vec2 texCoord;

void main() {
    texCoord = UV;
    gl_Position = vec4(Position, 0.0, 1.0);
}
)";

const char* default_vertex_shader() {
    return FULLSCREEN_QUAD_VERT;
}

ShaderHandle& ShaderProgram::ensure_ready(GraphicsBackend& graphics) {
    if (handle_) return *handle_;

    handle_ = graphics.create_shader(vertex_source_.c_str(), fragment_source_.c_str());
    if (!handle_) {
        throw ResourceCreationError("Failed to create shader program");
    }

    fp::Log::debug("[ShaderProgram] linked program %u", handle_->get_id());
    return *handle_;
}

void ShaderProgram::use() {
    require_handle()->use();
}

ShaderHandle* ShaderProgram::require_handle() {
    if (!handle_) {
        throw RenderError("ShaderProgram not compiled. Call ensure_ready() first.");
    }
    return handle_;
}

} // namespace fragpipe
