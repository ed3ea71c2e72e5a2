#pragma once

#include <optional>
#include <string>

#include <trent/trent.h>

#include "fp_log.h"

namespace fragpipe {

/**
 * Options for creating offscreen GL contexts.
 */
struct ContextOptions {
    int gl_major = 3;
    int gl_minor = 3;
    // Compatibility profile accepts unversioned GLSL (attribute/varying)
    bool core_profile = false;
    // SDL video driver hint ("x11", "wayland", "offscreen"), empty = SDL default
    std::string video_driver;
};

/**
 * Pipeline-wide settings.
 */
struct PipelineConfig {
    // Upper bound for texture-bearing uniforms per pass; the backend limit may lower it
    int max_texture_slots = 8;
    ContextOptions context;
    // Unset leaves the process-wide level alone
    std::optional<fp_log_level> log_level;

    /**
     * Read settings from a parsed JSON tree; absent keys keep defaults.
     *
     * Keys: max_texture_slots, gl_version ("3.3"), core_profile,
     * video_driver, log_level. Throws DescriptionError on bad values.
     */
    static PipelineConfig from_trent(const nos::trent& t);
};

// Parse JSON text. Throws DescriptionError.
PipelineConfig parse_pipeline_config(const std::string& json_text);

// Read and parse a JSON file. Throws DescriptionError.
PipelineConfig load_pipeline_config_file(const std::string& path);

// Applies the configured log level, if any
void apply_log_level(const PipelineConfig& config);

} // namespace fragpipe
