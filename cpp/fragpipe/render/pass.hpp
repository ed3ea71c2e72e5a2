#pragma once

#include <optional>
#include <string>
#include <vector>

#include "fragpipe/render/uniform.hpp"

namespace fragpipe {

/**
 * Description of one fragment-shader pass.
 *
 * A pass owns no GPU resources. The vertex shader defaults to the built-in
 * full-screen quad shader (see default_vertex_shader()).
 */
struct Pass {
    std::string name;
    std::optional<std::string> fragment_source;
    std::optional<std::string> vertex_source;
    int width = 0;
    int height = 0;
    std::vector<Uniform> uniforms;

    Pass() = default;

    Pass(
        std::string name_,
        std::string fragment_,
        int width_,
        int height_,
        std::vector<Uniform> uniforms_ = {},
        std::optional<std::string> vertex_ = std::nullopt
    ) : name(std::move(name_)),
        fragment_source(std::move(fragment_)),
        vertex_source(std::move(vertex_)),
        width(width_),
        height(height_),
        uniforms(std::move(uniforms_)) {}
};

} // namespace fragpipe
