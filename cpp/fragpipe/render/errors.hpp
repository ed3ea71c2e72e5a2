#pragma once

#include <stdexcept>
#include <string>

namespace fragpipe {

/**
 * Base class for every failure of a pipeline run.
 *
 * The pass executor stamps the name of the failing pass onto the error
 * before it propagates, so what() reads "[pass 'blur'] <message>".
 */
class RenderError : public std::runtime_error {
public:
    explicit RenderError(const std::string& message);

    const std::string& message() const { return message_; }
    const std::string& pass_name() const { return pass_name_; }
    bool has_pass_name() const { return !pass_name_.empty(); }

    void set_pass_name(const std::string& name);

    const char* what() const noexcept override { return full_message_.c_str(); }

private:
    std::string message_;
    std::string pass_name_;
    std::string full_message_;
};

class InvalidDimensionsError : public RenderError {
public:
    using RenderError::RenderError;
};

class MissingShaderError : public RenderError {
public:
    using RenderError::RenderError;
};

enum class ShaderStage {
    Vertex,
    Fragment
};

const char* shader_stage_name(ShaderStage stage);

class ShaderCompileError : public RenderError {
public:
    ShaderCompileError(ShaderStage stage, const std::string& info_log);

    ShaderStage stage() const { return stage_; }
    const std::string& info_log() const { return info_log_; }

private:
    ShaderStage stage_;
    std::string info_log_;
};

class ShaderLinkError : public RenderError {
public:
    explicit ShaderLinkError(const std::string& info_log);

    const std::string& info_log() const { return info_log_; }

private:
    std::string info_log_;
};

class InvalidUniformTypeError : public RenderError {
public:
    explicit InvalidUniformTypeError(const std::string& type_tag);

    const std::string& type_tag() const { return type_tag_; }

private:
    std::string type_tag_;
};

class TooManyTexturesError : public RenderError {
public:
    TooManyTexturesError(int limit, const std::string& uniform_name);

    int limit() const { return limit_; }
    const std::string& uniform_name() const { return uniform_name_; }

private:
    int limit_;
    std::string uniform_name_;
};

class ResourceCreationError : public RenderError {
public:
    using RenderError::RenderError;
};

class UnresolvedPassReferenceError : public RenderError {
public:
    UnresolvedPassReferenceError(const std::string& reference, const std::string& uniform_name);

    const std::string& reference() const { return reference_; }
    const std::string& uniform_name() const { return uniform_name_; }

private:
    std::string reference_;
    std::string uniform_name_;
};

class DuplicatePassNameError : public RenderError {
public:
    explicit DuplicatePassNameError(const std::string& name);
};

class InvalidImageError : public RenderError {
public:
    using RenderError::RenderError;
};

// Malformed pipeline description or configuration
class DescriptionError : public RenderError {
public:
    using RenderError::RenderError;
};

} // namespace fragpipe
