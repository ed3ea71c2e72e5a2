#pragma once

#include <cstdint>
#include <memory>

#include "fragpipe/render/types.hpp"

namespace fragpipe {

/**
 * Abstract linked shader program handle.
 *
 * Uniform setters take a location from uniform_location(). Location -1
 * means "not found" and every setter ignores it, like the graphics API does.
 */
class ShaderHandle {
public:
    virtual ~ShaderHandle() = default;

    virtual void use() = 0;
    virtual void release() = 0;

    virtual uint32_t get_id() const = 0;

    virtual int uniform_location(const char* name) = 0;
    virtual int attribute_location(const char* name) = 0;

    virtual void set_uniform_float(int location, float value) = 0;
    virtual void set_uniform_int(int location, int value) = 0;

    virtual void set_uniform_vec2(int location, float x, float y) = 0;
    virtual void set_uniform_vec3(int location, float x, float y, float z) = 0;
    virtual void set_uniform_vec4(int location, float x, float y, float z, float w) = 0;

    virtual void set_uniform_ivec2(int location, int x, int y) = 0;
    virtual void set_uniform_ivec3(int location, int x, int y, int z) = 0;
    virtual void set_uniform_ivec4(int location, int x, int y, int z, int w) = 0;

    // Column-major data, never transposed
    virtual void set_uniform_matrix2(int location, const float* data) = 0;
    virtual void set_uniform_matrix3(int location, const float* data) = 0;
    virtual void set_uniform_matrix4(int location, const float* data) = 0;

    virtual void set_uniform_float_array(int location, const float* data, int count) = 0;
    virtual void set_uniform_int_array(int location, const int* data, int count) = 0;
};

/**
 * Abstract vertex buffer handle with its attribute layout.
 */
class GPUMeshHandle {
public:
    virtual ~GPUMeshHandle() = default;

    virtual void draw() = 0;
    virtual void release() = 0;
};

/**
 * Abstract GPU texture handle.
 */
class GPUTextureHandle {
public:
    virtual ~GPUTextureHandle() = default;

    virtual void bind(int unit = 0) = 0;
    virtual void release() = 0;

    virtual uint32_t get_id() const = 0;
    virtual int get_width() const = 0;
    virtual int get_height() const = 0;
};

/**
 * Abstract offscreen framebuffer handle (RGBA8 color attachment).
 */
class FramebufferHandle {
public:
    virtual ~FramebufferHandle() = default;

    virtual void release() = 0;

    virtual uint32_t get_fbo_id() const = 0;
    virtual int get_width() const = 0;
    virtual int get_height() const = 0;

    Size2i get_size() const { return Size2i(get_width(), get_height()); }
};

/**
 * Unique pointer types for handles.
 */
using ShaderHandlePtr = std::unique_ptr<ShaderHandle>;
using GPUMeshHandlePtr = std::unique_ptr<GPUMeshHandle>;
using GPUTextureHandlePtr = std::unique_ptr<GPUTextureHandle>;
using FramebufferHandlePtr = std::unique_ptr<FramebufferHandle>;

} // namespace fragpipe
