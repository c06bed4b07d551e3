// image_io.cpp — stb_image backed decoding. This is the only translation unit
// that instantiates the stb_image implementation.

#include "image_io.hpp"
#include <climits>

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

static bool take_pixels(unsigned char* data, int w, int h, GrayImage& img, std::string& err) {
    if(!data) {
        const char* why = stbi_failure_reason();
        err = std::string("cannot decode image: ") + (why ? why : "unknown error");
        return false;
    }
    img.width = (uint32_t)w;
    img.height = (uint32_t)h;
    img.pixels.assign(data, data + (size_t)w * h);
    stbi_image_free(data);
    return true;
}

bool load_gray_image(const std::string& path, GrayImage& img, std::string& err) {
    img = GrayImage();
    int w = 0, h = 0, channels = 0;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels, 1);
    if(!take_pixels(data, w, h, img, err)) { err += " (" + path + ")"; return false; }
    return true;
}

bool decode_gray_image(const std::vector<uint8_t>& bytes, GrayImage& img, std::string& err) {
    img = GrayImage();
    if(bytes.empty() || bytes.size() > (size_t)INT_MAX) { err = "cannot decode image: empty or oversized buffer"; return false; }
    int w = 0, h = 0, channels = 0;
    unsigned char* data = stbi_load_from_memory(bytes.data(), (int)bytes.size(), &w, &h, &channels, 1);
    return take_pixels(data, w, h, img, err);
}

bool probe_image_size(const std::vector<uint8_t>& bytes, uint32_t& width, uint32_t& height, std::string& err) {
    if(bytes.empty() || bytes.size() > (size_t)INT_MAX) { err = "cannot read image header: empty or oversized buffer"; return false; }
    int w = 0, h = 0, channels = 0;
    if(!stbi_info_from_memory(bytes.data(), (int)bytes.size(), &w, &h, &channels)) {
        const char* why = stbi_failure_reason();
        err = std::string("cannot read image header: ") + (why ? why : "unknown format");
        return false;
    }
    width = (uint32_t)w;
    height = (uint32_t)h;
    return true;
}
