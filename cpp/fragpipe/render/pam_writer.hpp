#pragma once

#include <ostream>
#include <string>

#include "fragpipe/render/image.hpp"

namespace fragpipe {

/**
 * "<pass name>.pam" for output next to other passes.
 *
 * Throws DescriptionError when the name is empty, "." or "..", or contains
 * a path separator, since it would leave the output directory.
 */
std::string pam_file_name(const std::string& pass_name);

/**
 * Netpbm P7 (RGB_ALPHA, MAXVAL 255). Rows are written top row first, so
 * the bottom-up image rows are flipped. Float images are converted the way
 * Image::pixel_rgba8 does.
 */
void write_pam(std::ostream& out, const Image& image);

// Throws RenderError when the file cannot be written
void write_pam_file(const std::string& path, const Image& image);

} // namespace fragpipe
