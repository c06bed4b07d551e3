// lithophane.hpp — Lithophane and preview mesh generation.
//
// High-level flow of generate_lithophane:
// 1) Sample the surface functions on a bordered, full-resolution grid (grid.hpp).
// 2) Estimate one normal per pixel from the border (point_cloud.hpp).
// 3) Triangulate the raw samples (backing), the samples pushed along their
//    normals by a brightness-derived depth (front), and the four walls joining
//    them along the image edges. The result is a closed solid.
//
// Everything is synchronous and single-threaded; a call either returns a full
// mesh or fails and leaves the mesh empty. A call cannot be interrupted once
// started, so callers that need a deadline must enforce it around the call.
//
#pragma once
#include "mesh.hpp"
#include "point_cloud.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Decoded 8-bit grayscale raster, row-major, origin top-left.
struct GrayImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels; // width*height luma values

    uint8_t at(uint32_t x, uint32_t y) const { return pixels[(size_t)y * width + x]; }
};

enum class GenError {
    None,
    DegenerateGeometry, // a cross product collapsed to zero length
    InvalidInput,       // mismatched image size, zero step
};

// Tuning knobs shared by the CLI and the Python bindings.
struct LithophaneOptions {
    float white_depth = 0.5f;   // extrusion for intensity 255
    float black_depth = 3.0f;   // extrusion for intensity 0
    std::string header;         // text for the 80-byte STL header
    int progress_interval = 0;  // emit a progress line every N rows on stderr; <=0 disables
};

// Summary counters; `error` tells the two failure kinds apart.
struct GenerateReport {
    size_t grid_cols = 0;      // bordered grid size that was sampled
    size_t grid_rows = 0;
    size_t vertices = 0;       // surface samples inside the border
    size_t triangles = 0;
    GenError error = GenError::None;
};

// Depth for an 8-bit intensity: white_depth at 255, black_depth at 0, linear between.
inline float pixel_depth(uint8_t gray, float white_depth, float black_depth) {
    return white_depth + (float)(255 - gray) / 255.0f * (black_depth - white_depth);
}

// Expected triangle counts; used to pre-size storage.
size_t lithophane_triangle_count(size_t width, size_t height);
size_t preview_triangle_count(size_t width, size_t height);

// Full closed lithophane of `image` over the surface `fns`.
// Images narrower or shorter than 2 pixels produce an empty mesh (success).
bool generate_lithophane(const SurfaceFns& fns, const GrayImage& image, const LithophaneOptions& opt,
                         Mesh& mesh, GenerateReport& rep, std::string& err);

// Backing, front and side walls for an already estimated point cloud. The image
// must have exactly the point cloud's dimensions.
bool generate_lithophane_mesh(const PointCloud& cloud, const GrayImage& image, const LithophaneOptions& opt,
                              Mesh& mesh, std::string& err);

// Backing surface only, sampled every `step` pixels (edges always included).
// No normals, extrusion or walls. `step` must be >= 1.
bool generate_preview(const SurfaceFns& fns, uint32_t width, uint32_t height, uint32_t step,
                      const LithophaneOptions& opt, Mesh& mesh, GenerateReport& rep, std::string& err);
