// image_io.hpp — Grayscale image loading for the CLI and the Python bindings.
//
// Decoding is delegated to stb_image (PNG, JPEG, BMP, TGA, GIF, PSD, PNM, ...);
// colour images are converted to a single luma channel by the decoder.
//
#pragma once
#include "lithophane.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Decode an image file at `path` into `img`.
// On failure, returns false and writes a human-readable message to `err`.
bool load_gray_image(const std::string& path, GrayImage& img, std::string& err);

// Decode an encoded image held in memory.
bool decode_gray_image(const std::vector<uint8_t>& bytes, GrayImage& img, std::string& err);

// Read only the dimensions of an encoded image.
bool probe_image_size(const std::vector<uint8_t>& bytes, uint32_t& width, uint32_t& height, std::string& err);
