#pragma once

#include <glad/glad.h>

#include "fragpipe/render/errors.hpp"
#include "fragpipe/render/handles.hpp"
#include "fragpipe/render/image.hpp"
#include "fragpipe/render/types.hpp"

namespace fragpipe {

inline GLint gl_texture_filter(TextureFilter filter) {
    switch (filter) {
        case TextureFilter::NEAREST: return GL_NEAREST;
        case TextureFilter::LINEAR: return GL_LINEAR;
    }
    return GL_LINEAR;
}

inline GLint gl_texture_wrap(TextureWrap wrap) {
    switch (wrap) {
        case TextureWrap::CLAMP: return GL_CLAMP_TO_EDGE;
        case TextureWrap::REPEAT: return GL_REPEAT;
        case TextureWrap::MIRROR: return GL_MIRRORED_REPEAT;
    }
    return GL_CLAMP_TO_EDGE;
}

/**
 * 2D RGBA texture uploaded from an Image.
 *
 * Byte images upload as RGBA8, float images as RGBA32F. Creation restores
 * the previous GL_TEXTURE_2D binding of the active unit, so already bound
 * slots are not disturbed.
 */
class OpenGLTextureHandle : public GPUTextureHandle {
public:
    OpenGLTextureHandle(const Image& image, TextureFilter filter, TextureWrap wrap)
        : tex_id_(0), width_(image.width()), height_(image.height()) {
        upload(image, filter, wrap);
    }

    ~OpenGLTextureHandle() override {
        release();
    }

    void bind(int unit) override {
        glActiveTexture(GL_TEXTURE0 + unit);
        glBindTexture(GL_TEXTURE_2D, tex_id_);
    }

    void release() override {
        if (tex_id_ != 0) {
            glDeleteTextures(1, &tex_id_);
            tex_id_ = 0;
        }
    }

    uint32_t get_id() const override { return tex_id_; }
    int get_width() const override { return width_; }
    int get_height() const override { return height_; }

private:
    void upload(const Image& image, TextureFilter filter, TextureWrap wrap) {
        GLint previous = 0;
        glGetIntegerv(GL_TEXTURE_BINDING_2D, &previous);

        glGenTextures(1, &tex_id_);
        if (tex_id_ == 0) {
            throw ResourceCreationError("Failed to create texture object");
        }

        glBindTexture(GL_TEXTURE_2D, tex_id_);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);

        if (image.is_float()) {
            glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA32F, width_, height_, 0,
                         GL_RGBA, GL_FLOAT, image.data());
        } else {
            glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, width_, height_, 0,
                         GL_RGBA, GL_UNSIGNED_BYTE, image.data());
        }

        GLint gl_wrap = gl_texture_wrap(wrap);
        GLint gl_filter = gl_texture_filter(filter);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, gl_wrap);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, gl_wrap);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, gl_filter);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, gl_filter);

        glBindTexture(GL_TEXTURE_2D, static_cast<GLuint>(previous));
    }

    GLuint tex_id_;
    int width_;
    int height_;
};

} // namespace fragpipe
