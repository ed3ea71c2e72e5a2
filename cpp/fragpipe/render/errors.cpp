#include "errors.hpp"

namespace fragpipe {

RenderError::RenderError(const std::string& message)
    : std::runtime_error(message)
    , message_(message)
    , full_message_(message) {}

void RenderError::set_pass_name(const std::string& name) {
    pass_name_ = name;
    full_message_ = "[pass '" + pass_name_ + "'] " + message_;
}

const char* shader_stage_name(ShaderStage stage) {
    switch (stage) {
        case ShaderStage::Vertex: return "vertex";
        case ShaderStage::Fragment: return "fragment";
    }
    return "unknown";
}

ShaderCompileError::ShaderCompileError(ShaderStage stage, const std::string& info_log)
    : RenderError(std::string(shader_stage_name(stage)) + " shader compile failed: " +
                  (info_log.empty() ? std::string("(no info log)") : info_log))
    , stage_(stage)
    , info_log_(info_log) {}

ShaderLinkError::ShaderLinkError(const std::string& info_log)
    : RenderError("program link failed: " +
                  (info_log.empty() ? std::string("(no info log)") : info_log))
    , info_log_(info_log) {}

InvalidUniformTypeError::InvalidUniformTypeError(const std::string& type_tag)
    : RenderError("Invalid uniform type: '" + type_tag + "'")
    , type_tag_(type_tag) {}

TooManyTexturesError::TooManyTexturesError(int limit, const std::string& uniform_name)
    : RenderError("Too many textures: uniform '" + uniform_name + "' exceeds the limit of " +
                  std::to_string(limit) + " texture slots")
    , limit_(limit)
    , uniform_name_(uniform_name) {}

UnresolvedPassReferenceError::UnresolvedPassReferenceError(
    const std::string& reference,
    const std::string& uniform_name
)
    : RenderError((uniform_name.empty() ? std::string() : "uniform '" + uniform_name + "' references ") +
                  "pass '" + reference + "' which has not been rendered yet")
    , reference_(reference)
    , uniform_name_(uniform_name) {}

DuplicatePassNameError::DuplicatePassNameError(const std::string& name)
    : RenderError("duplicate pass name '" + name + "'") {}

} // namespace fragpipe
