#pragma once

#include <glad/glad.h>
#include <cstdio>
#include <string>

#include "fragpipe/render/errors.hpp"
#include "fragpipe/render/handles.hpp"

namespace fragpipe {

/**
 * Offscreen render target: framebuffer with one RGBA8 color renderbuffer.
 *
 * The target is only ever read back with glReadPixels, never sampled, so a
 * renderbuffer is enough.
 */
class OpenGLFramebufferHandle : public FramebufferHandle {
public:
    OpenGLFramebufferHandle(int width, int height)
        : fbo_(0), color_rb_(0), width_(width), height_(height) {
        create();
    }

    ~OpenGLFramebufferHandle() override {
        release();
    }

    void release() override {
        if (fbo_ != 0) {
            glDeleteFramebuffers(1, &fbo_);
            fbo_ = 0;
        }
        if (color_rb_ != 0) {
            glDeleteRenderbuffers(1, &color_rb_);
            color_rb_ = 0;
        }
    }

    uint32_t get_fbo_id() const override { return fbo_; }
    int get_width() const override { return width_; }
    int get_height() const override { return height_; }

private:
    void create() {
        glGenFramebuffers(1, &fbo_);
        glGenRenderbuffers(1, &color_rb_);
        if (fbo_ == 0 || color_rb_ == 0) {
            release();
            throw ResourceCreationError("Failed to create framebuffer objects");
        }

        glBindRenderbuffer(GL_RENDERBUFFER, color_rb_);
        glRenderbufferStorage(GL_RENDERBUFFER, GL_RGBA8, width_, height_);
        glBindRenderbuffer(GL_RENDERBUFFER, 0);

        glBindFramebuffer(GL_FRAMEBUFFER, fbo_);
        glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_RENDERBUFFER, color_rb_);

        GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
        if (status != GL_FRAMEBUFFER_COMPLETE) {
            glBindFramebuffer(GL_FRAMEBUFFER, 0);
            release();
            char code[16];
            std::snprintf(code, sizeof(code), "0x%04X", static_cast<unsigned>(status));
            throw ResourceCreationError(
                "Framebuffer " + std::to_string(width_) + "x" + std::to_string(height_) +
                " incomplete: " + code);
        }
    }

    GLuint fbo_;
    GLuint color_rb_;
    int width_;
    int height_;
};

} // namespace fragpipe
