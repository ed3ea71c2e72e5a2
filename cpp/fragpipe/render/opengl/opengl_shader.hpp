#pragma once

#include <glad/glad.h>
#include <string>
#include <vector>

#include "fragpipe/render/errors.hpp"
#include "fragpipe/render/handles.hpp"

namespace fragpipe {

/**
 * Linked GLSL program built from a vertex and a fragment stage.
 *
 * The constructor compiles and links; failures throw ShaderCompileError,
 * ShaderLinkError or ResourceCreationError and leave no GL objects behind.
 */
class OpenGLShaderHandle : public ShaderHandle {
public:
    OpenGLShaderHandle(const char* vertex_source, const char* fragment_source)
        : program_(0) {
        build(vertex_source, fragment_source);
    }

    ~OpenGLShaderHandle() override {
        release();
    }

    void use() override {
        glUseProgram(program_);
    }

    void release() override {
        if (program_ != 0) {
            glDeleteProgram(program_);
            program_ = 0;
        }
    }

    uint32_t get_id() const override { return program_; }

    int uniform_location(const char* name) override {
        return glGetUniformLocation(program_, name);
    }

    int attribute_location(const char* name) override {
        return glGetAttribLocation(program_, name);
    }

    void set_uniform_float(int location, float value) override {
        glUniform1f(location, value);
    }

    void set_uniform_int(int location, int value) override {
        glUniform1i(location, value);
    }

    void set_uniform_vec2(int location, float x, float y) override {
        glUniform2f(location, x, y);
    }

    void set_uniform_vec3(int location, float x, float y, float z) override {
        glUniform3f(location, x, y, z);
    }

    void set_uniform_vec4(int location, float x, float y, float z, float w) override {
        glUniform4f(location, x, y, z, w);
    }

    void set_uniform_ivec2(int location, int x, int y) override {
        glUniform2i(location, x, y);
    }

    void set_uniform_ivec3(int location, int x, int y, int z) override {
        glUniform3i(location, x, y, z);
    }

    void set_uniform_ivec4(int location, int x, int y, int z, int w) override {
        glUniform4i(location, x, y, z, w);
    }

    void set_uniform_matrix2(int location, const float* data) override {
        glUniformMatrix2fv(location, 1, GL_FALSE, data);
    }

    void set_uniform_matrix3(int location, const float* data) override {
        glUniformMatrix3fv(location, 1, GL_FALSE, data);
    }

    void set_uniform_matrix4(int location, const float* data) override {
        glUniformMatrix4fv(location, 1, GL_FALSE, data);
    }

    void set_uniform_float_array(int location, const float* data, int count) override {
        if (count <= 0) return;
        glUniform1fv(location, count, data);
    }

    void set_uniform_int_array(int location, const int* data, int count) override {
        if (count <= 0) return;
        glUniform1iv(location, count, data);
    }

private:
    void build(const char* vertex_source, const char* fragment_source) {
        GLuint vs = compile_stage(GL_VERTEX_SHADER, ShaderStage::Vertex, vertex_source);
        GLuint fs = 0;
        try {
            fs = compile_stage(GL_FRAGMENT_SHADER, ShaderStage::Fragment, fragment_source);
        } catch (...) {
            glDeleteShader(vs);
            throw;
        }

        program_ = glCreateProgram();
        if (program_ == 0) {
            glDeleteShader(vs);
            glDeleteShader(fs);
            throw ResourceCreationError("Failed to create program object");
        }

        glAttachShader(program_, vs);
        glAttachShader(program_, fs);
        glLinkProgram(program_);

        // Shaders are flagged for deletion and go away with the program
        glDeleteShader(vs);
        glDeleteShader(fs);

        GLint linked = GL_FALSE;
        glGetProgramiv(program_, GL_LINK_STATUS, &linked);
        if (linked != GL_TRUE) {
            std::string log = program_info_log(program_);
            release();
            throw ShaderLinkError(log);
        }
    }

    static GLuint compile_stage(GLenum type, ShaderStage stage, const char* source) {
        GLuint shader = glCreateShader(type);
        if (shader == 0) {
            throw ResourceCreationError(
                std::string("Failed to create ") + shader_stage_name(stage) + " shader object");
        }

        glShaderSource(shader, 1, &source, nullptr);
        glCompileShader(shader);

        GLint compiled = GL_FALSE;
        glGetShaderiv(shader, GL_COMPILE_STATUS, &compiled);
        if (compiled != GL_TRUE) {
            std::string log = shader_info_log(shader);
            glDeleteShader(shader);
            throw ShaderCompileError(stage, log);
        }
        return shader;
    }

    static std::string shader_info_log(GLuint shader) {
        GLint length = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
        if (length <= 1) return {};

        std::vector<char> buffer(static_cast<size_t>(length));
        glGetShaderInfoLog(shader, length, nullptr, buffer.data());
        return std::string(buffer.data());
    }

    static std::string program_info_log(GLuint program) {
        GLint length = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
        if (length <= 1) return {};

        std::vector<char> buffer(static_cast<size_t>(length));
        glGetProgramInfoLog(program, length, nullptr, buffer.data());
        return std::string(buffer.data());
    }

    GLuint program_;
};

} // namespace fragpipe
