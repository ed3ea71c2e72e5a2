#include "pam_writer.hpp"
#include "errors.hpp"

#include <fstream>

namespace fragpipe {

std::string pam_file_name(const std::string& pass_name) {
    if (pass_name.empty() || pass_name == "." || pass_name == "..") {
        throw DescriptionError("pass name '" + pass_name + "' cannot be used as a file name");
    }
    if (pass_name.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
        throw DescriptionError("pass name '" + pass_name + "' contains a path separator");
    }
    return pass_name + ".pam";
}

void write_pam(std::ostream& out, const Image& image) {
    out << "P7\n"
        << "WIDTH " << image.width() << "\n"
        << "HEIGHT " << image.height() << "\n"
        << "DEPTH 4\n"
        << "MAXVAL 255\n"
        << "TUPLTYPE RGB_ALPHA\n"
        << "ENDHDR\n";

    for (int y = image.height() - 1; y >= 0; --y) {
        for (int x = 0; x < image.width(); ++x) {
            auto rgba = image.pixel_rgba8(x, y);
            out.write(reinterpret_cast<const char*>(rgba.data()), 4);
        }
    }
}

void write_pam_file(const std::string& path, const Image& image) {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        throw RenderError("Cannot open output file: " + path);
    }
    write_pam(out, image);
    if (!out) {
        throw RenderError("Failed to write " + path);
    }
}

} // namespace fragpipe
