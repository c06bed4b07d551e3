// test_util.hpp — Shared fixtures for the lithomesh tests.
#pragma once
#include "grid.hpp"
#include "lithophane.hpp"
#include <cmath>
#include <cstdint>

// X = x, Y = y, Z = 0: the flat backing used by most tests.
inline SurfaceFns flat_surface() {
    SurfaceFns f;
    f.x = [](float x, float, float, float) { return x; };
    f.y = [](float, float y, float, float) { return y; };
    f.z = [](float, float, float, float) { return 0.0f; };
    return f;
}

// Half cylinder of radius 20 bending the image columns around the Y axis.
inline SurfaceFns cylinder_surface() {
    SurfaceFns f;
    f.x = [](float x, float, float w, float) { return 20.0f * std::cos(x / w * 3.14159265f); };
    f.y = [](float, float y, float, float) { return y; };
    f.z = [](float x, float, float w, float) { return 20.0f * std::sin(x / w * 3.14159265f); };
    return f;
}

inline GrayImage uniform_image(uint32_t w, uint32_t h, uint8_t g) {
    GrayImage img;
    img.width = w;
    img.height = h;
    img.pixels.assign((size_t)w * h, g);
    return img;
}

inline GrayImage gradient_image(uint32_t w, uint32_t h) {
    GrayImage img = uniform_image(w, h, 0);
    for(uint32_t y = 0; y < h; ++y)
        for(uint32_t x = 0; x < w; ++x)
            img.pixels[(size_t)y * w + x] = (uint8_t)((x * 37 + y * 91) % 256);
    return img;
}
