// fragpipe_render - renders a JSON pipeline description offscreen
//
// Writes one <pass name>.pam (Netpbm P7, RGB_ALPHA) per pass.

#include "fragpipe/render/errors.hpp"
#include "fragpipe/render/pam_writer.hpp"
#include "fragpipe/render/pipeline_config.hpp"
#include "fragpipe/render/pipeline_description.hpp"
#include "fragpipe/render/render_pipeline.hpp"
#include "fp_log.hpp"

#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " <pipeline.json> [--config cfg.json] [--out-dir DIR] [--verbose]" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string description_path;
    std::string config_path;
    fs::path out_dir = fs::current_path();
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--out-dir") == 0 && i + 1 < argc) {
            out_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (argv[i][0] == '-' || !description_path.empty()) {
            print_usage(argv[0]);
            return 2;
        } else {
            description_path = argv[i];
        }
    }

    if (description_path.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        fragpipe::PipelineConfig config;
        if (!config_path.empty()) {
            config = fragpipe::load_pipeline_config_file(config_path);
        }
        if (verbose) {
            config.log_level = FP_LOG_DEBUG;
        }
        fragpipe::apply_log_level(config);

        std::vector<fragpipe::Pass> passes =
            fragpipe::load_pipeline_description_file(description_path);
        // Unusable file names fail before anything is rendered
        for (const fragpipe::Pass& pass : passes) {
            fragpipe::pam_file_name(pass.name);
        }
        fragpipe::PassResults results = fragpipe::render(passes, config);

        std::error_code ec;
        fs::create_directories(out_dir, ec);
        if (ec) {
            throw fragpipe::RenderError("Cannot create output directory " +
                out_dir.string() + ": " + ec.message());
        }

        for (const std::string& name : results.names()) {
            fs::path path = out_dir / fragpipe::pam_file_name(name);
            fragpipe::write_pam_file(path.string(), results.at(name));
            fp::Log::info("wrote %s", path.string().c_str());
        }
    } catch (const fragpipe::RenderError& e) {
        fp::Log::error("%s", e.what());
        return 1;
    }

    return 0;
}
