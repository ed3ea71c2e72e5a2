#pragma once

#include <glad/glad.h>
#include <cstddef>
#include <vector>

#include "fragpipe/render/errors.hpp"
#include "fragpipe/render/graphics_backend.hpp"
#include "fragpipe/render/handles.hpp"

namespace fragpipe {

// Helper to convert byte offset to void* for glVertexAttribPointer
inline const void* gl_offset(size_t offset) {
    return reinterpret_cast<const void*>(offset);
}

/**
 * Interleaved float vertex buffer drawn as a triangle strip.
 *
 * Attributes are located by name in the given program; names the program
 * does not declare (location -1) are skipped.
 */
class OpenGLRawMeshHandle : public GPUMeshHandle {
public:
    OpenGLRawMeshHandle(
        ShaderHandle* shader,
        const float* vertices,
        int vertex_count,
        int stride_floats,
        const std::vector<VertexAttribute>& attributes
    ) : vao_(0), vbo_(0), vertex_count_(vertex_count) {
        upload(shader, vertices, stride_floats, attributes);
    }

    ~OpenGLRawMeshHandle() override {
        release();
    }

    void draw() override {
        glBindVertexArray(vao_);
        glDrawArrays(GL_TRIANGLE_STRIP, 0, vertex_count_);
        glBindVertexArray(0);
    }

    void release() override {
        if (vao_ != 0) {
            glDeleteVertexArrays(1, &vao_);
            vao_ = 0;
        }
        if (vbo_ != 0) {
            glDeleteBuffers(1, &vbo_);
            vbo_ = 0;
        }
    }

private:
    void upload(
        ShaderHandle* shader,
        const float* vertices,
        int stride_floats,
        const std::vector<VertexAttribute>& attributes
    ) {
        glGenVertexArrays(1, &vao_);
        glGenBuffers(1, &vbo_);
        if (vao_ == 0 || vbo_ == 0) {
            release();
            throw ResourceCreationError("Failed to create vertex buffer");
        }

        glBindVertexArray(vao_);
        glBindBuffer(GL_ARRAY_BUFFER, vbo_);
        glBufferData(GL_ARRAY_BUFFER,
                     static_cast<GLsizeiptr>(vertex_count_) * stride_floats * sizeof(float),
                     vertices, GL_STATIC_DRAW);

        const GLsizei stride = stride_floats * static_cast<GLsizei>(sizeof(float));
        for (const auto& attr : attributes) {
            int location = shader ? shader->attribute_location(attr.name) : -1;
            if (location < 0) continue;

            glEnableVertexAttribArray(static_cast<GLuint>(location));
            glVertexAttribPointer(static_cast<GLuint>(location), attr.components, GL_FLOAT, GL_FALSE,
                                  stride, gl_offset(attr.offset_floats * sizeof(float)));
        }

        glBindVertexArray(0);
    }

    GLuint vao_;
    GLuint vbo_;
    GLsizei vertex_count_;
};

} // namespace fragpipe
