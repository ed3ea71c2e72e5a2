/**
 * Render module bindings (_fragpipe).
 *
 * Passes come in as dicts shaped like the JSON description and are turned
 * into a trent tree first, so both front ends share one loader.
 */

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>

#include "fragpipe/render/errors.hpp"
#include "fragpipe/render/pipeline_config.hpp"
#include "fragpipe/render/pipeline_description.hpp"
#include "fragpipe/render/render_pipeline.hpp"
#include "fp_log.hpp"

namespace nb = nanobind;

namespace fragpipe {

// --- Python -> trent conversion ---

static nos::trent py_to_trent(nb::handle obj) {
    if (obj.is_none()) {
        return nos::trent::nil();
    }
    if (nb::isinstance<nb::bool_>(obj)) {
        return nos::trent(nb::cast<bool>(obj));
    }
    if (nb::isinstance<nb::int_>(obj)) {
        return nos::trent(nb::cast<int64_t>(obj));
    }
    if (nb::isinstance<nb::float_>(obj)) {
        return nos::trent(nb::cast<double>(obj));
    }
    if (nb::isinstance<nb::str>(obj)) {
        return nos::trent(nb::cast<std::string>(obj));
    }
    if (nb::isinstance<nb::bytes>(obj)) {
        // Raw RGBA8 pixel data
        nb::bytes b = nb::borrow<nb::bytes>(obj);
        const auto* data = static_cast<const uint8_t*>(static_cast<const void*>(b.c_str()));
        nos::trent result;
        result.init(nos::trent_type::list);
        for (size_t i = 0; i < b.size(); ++i) {
            result.as_list().push_back(nos::trent(static_cast<int64_t>(data[i])));
        }
        return result;
    }
    if (nb::isinstance<nb::list>(obj) || nb::isinstance<nb::tuple>(obj)) {
        nos::trent result;
        result.init(nos::trent_type::list);
        for (nb::handle item : obj) {
            result.as_list().push_back(py_to_trent(item));
        }
        return result;
    }
    if (nb::isinstance<nb::dict>(obj)) {
        nos::trent result;
        result.init(nos::trent_type::dict);
        for (auto item : nb::borrow<nb::dict>(obj)) {
            std::string key = nb::cast<std::string>(item.first);
            result[key] = py_to_trent(item.second);
        }
        return result;
    }
    throw DescriptionError("unsupported Python value of type " +
        nb::cast<std::string>(nb::str(obj.type())));
}

static nb::dict image_to_py(const Image& image) {
    nb::dict d;
    d["width"] = image.width();
    d["height"] = image.height();
    const std::vector<uint8_t>& bytes = image.bytes();
    d["data"] = nb::bytes(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return d;
}

static nb::dict results_to_py(const PassResults& results) {
    nb::dict out;
    for (const std::string& name : results.names()) {
        out[nb::str(name.c_str())] = image_to_py(results.at(name));
    }
    return out;
}

static void bind_errors(nb::module_& m) {
    // Subclasses are registered after the base so their translators match first
    auto base = nb::exception<RenderError>(m, "RenderError");
    nb::exception<InvalidDimensionsError>(m, "InvalidDimensionsError", base);
    nb::exception<MissingShaderError>(m, "MissingShaderError", base);
    nb::exception<ShaderCompileError>(m, "ShaderCompileError", base);
    nb::exception<ShaderLinkError>(m, "ShaderLinkError", base);
    nb::exception<InvalidUniformTypeError>(m, "InvalidUniformTypeError", base);
    nb::exception<TooManyTexturesError>(m, "TooManyTexturesError", base);
    nb::exception<ResourceCreationError>(m, "ResourceCreationError", base);
    nb::exception<UnresolvedPassReferenceError>(m, "UnresolvedPassReferenceError", base);
    nb::exception<DuplicatePassNameError>(m, "DuplicatePassNameError", base);
    nb::exception<InvalidImageError>(m, "InvalidImageError", base);
    nb::exception<DescriptionError>(m, "DescriptionError", base);
}

} // namespace fragpipe

NB_MODULE(_fragpipe, m) {
    using namespace fragpipe;

    m.doc() = "Offscreen multi-pass fragment shader renderer";

    bind_errors(m);

    m.def("render", [](nb::object passes, nb::object config) {
        PipelineConfig cfg;
        if (!config.is_none()) {
            cfg = PipelineConfig::from_trent(py_to_trent(config));
        }
        std::vector<Pass> parsed = passes_from_trent(py_to_trent(passes));

        PassResults results;
        {
            nb::gil_scoped_release release;
            results = render(parsed, cfg);
        }
        return results_to_py(results);
    },
    nb::arg("passes"), nb::arg("config") = nb::none(),
    "Render passes in order. Returns {name: {width, height, data}}.");

    m.def("set_log_level", [](const std::string& name) {
        fp_log_level level;
        if (!fp_log_level_from_name(name.c_str(), &level)) {
            throw DescriptionError("unknown log level '" + name + "'");
        }
        fp::Log::set_level(level);
    }, nb::arg("level"));
}
