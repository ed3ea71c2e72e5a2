#pragma once

#include <string>
#include <vector>

#include <trent/trent.h>

#include "fragpipe/render/pass.hpp"

namespace fragpipe {

/**
 * Build passes from a parsed description tree.
 *
 * Accepts {"passes": [...]} or a bare list of pass objects. Each pass has
 * name, width, height, frag, optional vert and optional uniforms; each
 * uniform has name, type, value and, for texture kinds, filter and wrap.
 *
 * Throws InvalidDimensionsError, MissingShaderError, InvalidUniformTypeError,
 * InvalidImageError, DescriptionError.
 */
std::vector<Pass> passes_from_trent(const nos::trent& t);

// One pass object
Pass pass_from_trent(const nos::trent& t);

// One uniform object
Uniform uniform_from_trent(const nos::trent& t);

// Parse JSON text
std::vector<Pass> load_pipeline_description(const std::string& json_text);

// Read and parse a JSON file
std::vector<Pass> load_pipeline_description_file(const std::string& path);

} // namespace fragpipe
