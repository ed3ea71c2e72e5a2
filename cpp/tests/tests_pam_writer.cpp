#include "guard/guard.h"
#include "fragpipe/render/errors.hpp"
#include "fragpipe/render/pam_writer.hpp"

#include <sstream>

using fragpipe::DescriptionError;
using fragpipe::Image;

static bool name_rejected(const std::string& name) {
    try {
        fragpipe::pam_file_name(name);
    } catch (const DescriptionError&) {
        return true;
    }
    return false;
}

TEST_CASE("PAM file name appends the extension")
{
    CHECK_EQ(fragpipe::pam_file_name("blur"), std::string("blur.pam"));
    CHECK_EQ(fragpipe::pam_file_name("pass.1"), std::string("pass.1.pam"));
}

TEST_CASE("PAM file name rejects names that leave the output directory")
{
    CHECK(name_rejected(""));
    CHECK(name_rejected("."));
    CHECK(name_rejected(".."));
    CHECK(name_rejected("../x"));
    CHECK(name_rejected("a/b"));
    CHECK(name_rejected("/abs"));
    CHECK(name_rejected("a\\b"));
}

TEST_CASE("PAM writer emits header and flips rows")
{
    // Bottom row red, top row green
    Image img(1, 2, std::vector<uint8_t>{255, 0, 0, 255, 0, 255, 0, 128});
    std::ostringstream out;
    fragpipe::write_pam(out, img);

    std::string header =
        "P7\nWIDTH 1\nHEIGHT 2\nDEPTH 4\nMAXVAL 255\nTUPLTYPE RGB_ALPHA\nENDHDR\n";
    std::string data = out.str();
    CHECK_EQ(data.size(), header.size() + 8);
    CHECK_EQ(data.substr(0, header.size()), header);

    const unsigned char* px =
        reinterpret_cast<const unsigned char*>(data.data() + header.size());
    CHECK_EQ(int(px[0]), 0);
    CHECK_EQ(int(px[1]), 255);
    CHECK_EQ(int(px[3]), 128);
    CHECK_EQ(int(px[4]), 255);
    CHECK_EQ(int(px[5]), 0);
    CHECK_EQ(int(px[7]), 255);
}
