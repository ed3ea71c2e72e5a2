#include "pipeline_description.hpp"
#include "errors.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>
#include <trent/json.h>

namespace fragpipe {

namespace {

bool is_integral(double v) {
    return std::isfinite(v) && v == std::floor(v);
}

template <typename T>
bool fits(double v) {
    return v >= static_cast<double>(std::numeric_limits<T>::lowest()) &&
           v <= static_cast<double>(std::numeric_limits<T>::max());
}

std::string where(const std::string& uniform_name) {
    return "uniform '" + uniform_name + "'";
}

float to_float(const nos::trent& t, const std::string& ctx) {
    if (!t.is_numer()) {
        throw DescriptionError(ctx + ": expected a number");
    }
    double v = static_cast<double>(t.as_numer());
    if (!std::isfinite(v) || !fits<float>(v)) {
        throw DescriptionError(ctx + ": number out of float range");
    }
    return static_cast<float>(v);
}

int32_t to_int(const nos::trent& t, const std::string& ctx) {
    if (!t.is_numer() || !is_integral(static_cast<double>(t.as_numer()))) {
        throw DescriptionError(ctx + ": expected an integer");
    }
    double v = static_cast<double>(t.as_numer());
    if (!fits<int32_t>(v)) {
        throw DescriptionError(ctx + ": integer out of 32-bit range");
    }
    return static_cast<int32_t>(v);
}

const auto& to_list(const nos::trent& t, const std::string& ctx) {
    if (!t.is_list()) {
        throw DescriptionError(ctx + ": expected a list");
    }
    return t.as_list();
}

std::vector<float> float_list(const nos::trent& t, const std::string& ctx, size_t expected = 0) {
    const auto& items = to_list(t, ctx);
    if (expected != 0 && items.size() != expected) {
        throw DescriptionError(ctx + ": expected " + std::to_string(expected) +
            " components, got " + std::to_string(items.size()));
    }
    std::vector<float> out;
    out.reserve(items.size());
    for (const auto& item : items) {
        out.push_back(to_float(item, ctx));
    }
    return out;
}

std::vector<int32_t> int_list(const nos::trent& t, const std::string& ctx, size_t expected = 0) {
    const auto& items = to_list(t, ctx);
    if (expected != 0 && items.size() != expected) {
        throw DescriptionError(ctx + ": expected " + std::to_string(expected) +
            " components, got " + std::to_string(items.size()));
    }
    std::vector<int32_t> out;
    out.reserve(items.size());
    for (const auto& item : items) {
        out.push_back(to_int(item, ctx));
    }
    return out;
}

template <size_t N>
std::array<float, N> float_array(const nos::trent& t, const std::string& ctx) {
    std::vector<float> values = float_list(t, ctx, N);
    std::array<float, N> out{};
    std::copy(values.begin(), values.end(), out.begin());
    return out;
}

// Image dimension: numeric, finite, integral
int dimension(const nos::trent& t, const char* key, const std::string& ctx) {
    if (!t.contains(key)) {
        throw InvalidDimensionsError(ctx + ": missing '" + key + "'");
    }
    const nos::trent& v = t[key];
    if (!v.is_numer()) {
        throw InvalidDimensionsError(ctx + ": '" + key + "' must be a number");
    }
    double d = static_cast<double>(v.as_numer());
    if (!is_integral(d)) {
        throw InvalidDimensionsError(ctx + ": '" + key + "' must be an integer");
    }
    if (!fits<int>(d)) {
        throw InvalidDimensionsError(ctx + ": '" + key + "' is out of range");
    }
    return static_cast<int>(d);
}

std::shared_ptr<const Image> image_from_trent(const nos::trent& t, const std::string& ctx) {
    if (!t.is_dict()) {
        throw DescriptionError(ctx + ": texture value must be an object");
    }
    int width = dimension(t, "width", ctx);
    int height = dimension(t, "height", ctx);
    if (!t.contains("data")) {
        throw DescriptionError(ctx + ": texture value has no 'data'");
    }

    bool is_float = false;
    if (t.contains("float")) {
        if (!t["float"].is_bool()) {
            throw DescriptionError(ctx + ": 'float' must be a boolean");
        }
        is_float = t["float"].as_bool();
    }

    if (is_float) {
        return std::make_shared<const Image>(width, height, float_list(t["data"], ctx));
    }

    std::vector<uint8_t> bytes;
    for (const auto& item : to_list(t["data"], ctx)) {
        int32_t v = to_int(item, ctx);
        if (v < 0 || v > 255) {
            throw DescriptionError(ctx + ": byte value out of range: " + std::to_string(v));
        }
        bytes.push_back(static_cast<uint8_t>(v));
    }
    return std::make_shared<const Image>(width, height, std::move(bytes));
}

TextureFilter filter_from_trent(const nos::trent& t, const std::string& ctx) {
    if (!t.contains("filter")) {
        return TextureFilter::LINEAR;
    }
    if (!t["filter"].is_string()) {
        throw DescriptionError(ctx + ": 'filter' must be a string");
    }
    std::string name = t["filter"].as_string();
    auto filter = texture_filter_from_name(name);
    if (!filter) {
        throw DescriptionError(ctx + ": unknown filter '" + name + "'");
    }
    return *filter;
}

TextureWrap wrap_from_trent(const nos::trent& t, const std::string& ctx) {
    if (!t.contains("wrap")) {
        return TextureWrap::CLAMP;
    }
    if (!t["wrap"].is_string()) {
        throw DescriptionError(ctx + ": 'wrap' must be a string");
    }
    std::string name = t["wrap"].as_string();
    auto wrap = texture_wrap_from_name(name);
    if (!wrap) {
        throw DescriptionError(ctx + ": unknown wrap '" + name + "'");
    }
    return *wrap;
}

std::string string_field(const nos::trent& t, const char* key, const std::string& ctx) {
    if (!t.contains(key)) {
        throw DescriptionError(ctx + ": missing '" + key + "'");
    }
    if (!t[key].is_string()) {
        throw DescriptionError(ctx + ": '" + key + "' must be a string");
    }
    return t[key].as_string();
}

} // anonymous namespace

Uniform uniform_from_trent(const nos::trent& t) {
    if (!t.is_dict()) {
        throw DescriptionError("uniform must be an object");
    }
    std::string name = string_field(t, "name", "uniform");
    if (name.empty()) {
        throw DescriptionError("uniform name must not be empty");
    }
    const std::string ctx = where(name);

    // Type tag first: an unknown tag wins over a malformed value
    UniformType type = uniform_type_from_name(string_field(t, "type", ctx));

    if (!t.contains("value")) {
        throw DescriptionError(ctx + ": missing 'value'");
    }
    const nos::trent& v = t["value"];

    switch (type) {
        case UniformType::Float:
            return Uniform(name, to_float(v, ctx));
        case UniformType::Int:
            return Uniform(name, to_int(v, ctx));
        case UniformType::Vec2: {
            auto c = float_list(v, ctx, 2);
            return Uniform(name, Vec2f{c[0], c[1]});
        }
        case UniformType::Vec3: {
            auto c = float_list(v, ctx, 3);
            return Uniform(name, Vec3f{c[0], c[1], c[2]});
        }
        case UniformType::Vec4: {
            auto c = float_list(v, ctx, 4);
            return Uniform(name, Vec4f{c[0], c[1], c[2], c[3]});
        }
        case UniformType::IVec2: {
            auto c = int_list(v, ctx, 2);
            return Uniform(name, Vec2i{c[0], c[1]});
        }
        case UniformType::IVec3: {
            auto c = int_list(v, ctx, 3);
            return Uniform(name, Vec3i{c[0], c[1], c[2]});
        }
        case UniformType::IVec4: {
            auto c = int_list(v, ctx, 4);
            return Uniform(name, Vec4i{c[0], c[1], c[2], c[3]});
        }
        case UniformType::Mat2:
            return Uniform(name, Mat2f{float_array<4>(v, ctx)});
        case UniformType::Mat3:
            return Uniform(name, Mat3f{float_array<9>(v, ctx)});
        case UniformType::Mat4:
            return Uniform(name, Mat4f{float_array<16>(v, ctx)});
        case UniformType::FloatArray:
            return Uniform(name, FloatArray{float_list(v, ctx)});
        case UniformType::IntArray:
            return Uniform(name, IntArray{int_list(v, ctx)});
        case UniformType::Texture:
            return Uniform(name, TextureInput{
                image_from_trent(v, ctx), filter_from_trent(t, ctx), wrap_from_trent(t, ctx)});
        case UniformType::Pass:
            if (!v.is_string()) {
                throw DescriptionError(ctx + ": pass reference must be a string");
            }
            return Uniform::pass(name, v.as_string(), filter_from_trent(t, ctx), wrap_from_trent(t, ctx));
    }
    throw InvalidUniformTypeError(uniform_type_name(type));
}

Pass pass_from_trent(const nos::trent& t) {
    if (!t.is_dict()) {
        throw DescriptionError("pass must be an object");
    }

    Pass pass;
    pass.name = string_field(t, "name", "pass");
    const std::string ctx = "pass '" + pass.name + "'";

    pass.width = dimension(t, "width", ctx);
    pass.height = dimension(t, "height", ctx);

    if (!t.contains("frag") || !t["frag"].is_string()) {
        throw MissingShaderError(ctx + ": 'frag' must be a string");
    }
    pass.fragment_source = t["frag"].as_string();

    if (t.contains("vert") && !t["vert"].is_nil()) {
        pass.vertex_source = string_field(t, "vert", ctx);
    }

    if (t.contains("uniforms")) {
        for (const auto& item : to_list(t["uniforms"], ctx + ": 'uniforms'")) {
            pass.uniforms.push_back(uniform_from_trent(item));
        }
    }

    return pass;
}

std::vector<Pass> passes_from_trent(const nos::trent& t) {
    const nos::trent* list = &t;
    if (t.is_dict()) {
        if (!t.contains("passes")) {
            throw DescriptionError("description has no 'passes'");
        }
        list = &t["passes"];
    }

    std::vector<Pass> passes;
    for (const auto& item : to_list(*list, "'passes'")) {
        passes.push_back(pass_from_trent(item));
    }
    return passes;
}

std::vector<Pass> load_pipeline_description(const std::string& json_text) {
    nos::trent t;
    try {
        t = nos::json::parse(json_text);
    } catch (const std::exception& e) {
        throw DescriptionError(std::string("description: invalid JSON: ") + e.what());
    }
    return passes_from_trent(t);
}

std::vector<Pass> load_pipeline_description_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DescriptionError("Cannot open description file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_pipeline_description(buffer.str());
}

} // namespace fragpipe
