#include "pipeline_config.hpp"
#include "errors.hpp"
#include "fp_log.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <trent/json.h>

namespace fragpipe {

static int parse_positive_int(const nos::trent& value, const char* key) {
    if (!value.is_numer()) {
        throw DescriptionError(std::string("config: '") + key + "' must be a number");
    }
    double v = static_cast<double>(value.as_numer());
    if (!std::isfinite(v) || v < 1 || v != std::floor(v)) {
        throw DescriptionError(std::string("config: '") + key + "' must be a positive integer");
    }
    if (v > static_cast<double>(std::numeric_limits<int>::max())) {
        throw DescriptionError(std::string("config: '") + key + "' is out of range");
    }
    return static_cast<int>(v);
}

static void parse_gl_version(const std::string& text, ContextOptions& out) {
    int major = 0;
    int minor = 0;
    char dot = 0;
    std::istringstream in(text);
    if (!(in >> major >> dot >> minor) || dot != '.' || major < 2 || minor < 0) {
        throw DescriptionError("config: 'gl_version' must look like \"3.3\", got \"" + text + "\"");
    }
    out.gl_major = major;
    out.gl_minor = minor;
}

PipelineConfig PipelineConfig::from_trent(const nos::trent& t) {
    PipelineConfig config;

    if (!t.is_dict()) {
        throw DescriptionError("config: top level must be an object");
    }

    if (t.contains("max_texture_slots")) {
        config.max_texture_slots = parse_positive_int(t["max_texture_slots"], "max_texture_slots");
    }

    if (t.contains("gl_version")) {
        if (!t["gl_version"].is_string()) {
            throw DescriptionError("config: 'gl_version' must be a string");
        }
        parse_gl_version(t["gl_version"].as_string(), config.context);
    }

    if (t.contains("core_profile")) {
        if (!t["core_profile"].is_bool()) {
            throw DescriptionError("config: 'core_profile' must be a boolean");
        }
        config.context.core_profile = t["core_profile"].as_bool();
    }

    if (t.contains("video_driver")) {
        if (!t["video_driver"].is_string()) {
            throw DescriptionError("config: 'video_driver' must be a string");
        }
        config.context.video_driver = t["video_driver"].as_string();
    }

    if (t.contains("log_level")) {
        if (!t["log_level"].is_string()) {
            throw DescriptionError("config: 'log_level' must be a string");
        }
        std::string name = t["log_level"].as_string();
        fp_log_level level;
        if (!fp_log_level_from_name(name.c_str(), &level)) {
            throw DescriptionError("config: unknown log level '" + name + "'");
        }
        config.log_level = level;
    }

    return config;
}

PipelineConfig parse_pipeline_config(const std::string& json_text) {
    nos::trent t;
    try {
        t = nos::json::parse(json_text);
    } catch (const std::exception& e) {
        throw DescriptionError(std::string("config: invalid JSON: ") + e.what());
    }
    return PipelineConfig::from_trent(t);
}

PipelineConfig load_pipeline_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DescriptionError("Cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_pipeline_config(buffer.str());
}

void apply_log_level(const PipelineConfig& config) {
    if (config.log_level) {
        fp::Log::set_level(*config.log_level);
    }
}

} // namespace fragpipe
