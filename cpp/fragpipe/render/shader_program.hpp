#pragma once

#include <string>

#include "fragpipe/render/graphics_backend.hpp"
#include "fragpipe/render/handles.hpp"

namespace fragpipe {

/**
 * Built-in vertex shader for the full-screen quad.
 *
 * Declares attributes Position and UV and passes UV on as texCoord.
 */
const char* default_vertex_shader();

/**
 * Shader program that manages GLSL sources and compilation.
 *
 * Stores vertex/fragment sources and compiles on ensure_ready(). The
 * compiled program belongs to the backend that created it and lives as long
 * as that backend's context.
 */
class ShaderProgram {
public:
    ShaderProgram() = default;

    ShaderProgram(std::string vertex_source, std::string fragment_source)
        : vertex_source_(std::move(vertex_source)),
          fragment_source_(std::move(fragment_source)) {}

    const std::string& vertex_source() const { return vertex_source_; }
    const std::string& fragment_source() const { return fragment_source_; }

    bool is_compiled() const { return handle_ != nullptr; }

    /**
     * Compile and link if not already done.
     *
     * Throws ShaderCompileError (with the failing stage), ShaderLinkError
     * or ResourceCreationError.
     */
    ShaderHandle& ensure_ready(GraphicsBackend& graphics);

    // nullptr until compiled
    ShaderHandle* handle() const { return handle_; }

    void use();

private:
    ShaderHandle* require_handle();

    std::string vertex_source_;
    std::string fragment_source_;
    ShaderHandle* handle_ = nullptr;
};

} // namespace fragpipe
