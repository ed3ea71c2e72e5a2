#include "uniform_binder.hpp"
#include "errors.hpp"
#include "fp_log.hpp"

#include <type_traits>

namespace fragpipe {

UniformBinder::UniformBinder(
    GraphicsBackend& graphics,
    ShaderHandle& program,
    const PassResults& results,
    int texture_slot_limit
)
    : graphics_(graphics)
    , program_(program)
    , results_(results)
    , texture_slot_limit_(texture_slot_limit) {}

void UniformBinder::bind(const Uniform& uniform) {
    const int loc = program_.uniform_location(uniform.name.c_str());
    if (loc < 0) {
        // Unknown names bind to -1, which the backend ignores
        fp::Log::debug("[UniformBinder] uniform '%s' (%s) is not used by the program",
            uniform.name.c_str(), uniform.type_name());
    }

    std::visit([this, &uniform, loc](const auto& v) {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, float>) {
            program_.set_uniform_float(loc, v);
        } else if constexpr (std::is_same_v<T, int32_t>) {
            program_.set_uniform_int(loc, v);
        } else if constexpr (std::is_same_v<T, Vec2f>) {
            program_.set_uniform_vec2(loc, v.x, v.y);
        } else if constexpr (std::is_same_v<T, Vec3f>) {
            program_.set_uniform_vec3(loc, v.x, v.y, v.z);
        } else if constexpr (std::is_same_v<T, Vec4f>) {
            program_.set_uniform_vec4(loc, v.x, v.y, v.z, v.w);
        } else if constexpr (std::is_same_v<T, Vec2i>) {
            program_.set_uniform_ivec2(loc, v.x, v.y);
        } else if constexpr (std::is_same_v<T, Vec3i>) {
            program_.set_uniform_ivec3(loc, v.x, v.y, v.z);
        } else if constexpr (std::is_same_v<T, Vec4i>) {
            program_.set_uniform_ivec4(loc, v.x, v.y, v.z, v.w);
        } else if constexpr (std::is_same_v<T, Mat2f>) {
            program_.set_uniform_matrix2(loc, v.data.data());
        } else if constexpr (std::is_same_v<T, Mat3f>) {
            program_.set_uniform_matrix3(loc, v.data.data());
        } else if constexpr (std::is_same_v<T, Mat4f>) {
            program_.set_uniform_matrix4(loc, v.data.data());
        } else if constexpr (std::is_same_v<T, FloatArray>) {
            program_.set_uniform_float_array(loc, v.values.data(), static_cast<int>(v.values.size()));
        } else if constexpr (std::is_same_v<T, IntArray>) {
            program_.set_uniform_int_array(loc, v.values.data(), static_cast<int>(v.values.size()));
        } else if constexpr (std::is_same_v<T, TextureInput>) {
            if (!v.image) {
                throw InvalidImageError("texture uniform '" + uniform.name + "' has no image");
            }
            bind_texture(uniform, loc, *v.image, v.filter, v.wrap);
        } else if constexpr (std::is_same_v<T, PassInput>) {
            const Image* image = results_.find(v.pass);
            if (!image) {
                throw UnresolvedPassReferenceError(v.pass, uniform.name);
            }
            bind_texture(uniform, loc, *image, v.filter, v.wrap);
        } else {
            static_assert(always_false_v<T>, "unhandled uniform value kind");
        }
    }, uniform.value);
}

void UniformBinder::bind_texture(
    const Uniform& uniform,
    int location,
    const Image& image,
    TextureFilter filter,
    TextureWrap wrap
) {
    if (next_texture_slot_ >= texture_slot_limit_) {
        throw TooManyTexturesError(texture_slot_limit_, uniform.name);
    }

    GPUTextureHandle* texture = graphics_.create_texture(image, filter, wrap);
    if (!texture) {
        throw ResourceCreationError("Failed to create texture for uniform '" + uniform.name + "'");
    }

    const int slot = next_texture_slot_++;
    texture->bind(slot);
    program_.set_uniform_int(location, slot);
}

} // namespace fragpipe
