// point_cloud.hpp — Border-stripped surface samples with one normal per vertex.
#pragma once
#include "grid.hpp"
#include <string>

// `vertices` and `normals` share the same (cols x rows) shape and index order.
struct PointCloud {
    Grid2<Vec3> vertices;
    Grid2<Vec3> normals;

    size_t width() const { return vertices.cols(); }
    size_t height() const { return vertices.rows(); }
};

// Estimate a normal for every interior vertex of `bordered` and strip the border.
//
// For a vertex v, the four direct neighbours give two finite-difference normals,
// normalize(cross(below - v, right - v)) and normalize(cross(above - v, left - v)),
// whose normalized sum is the vertex normal. "below" is the next row (image y
// grows downwards).
//
// Returns false with a message in `err` if any of those vectors has zero length
// (flat or collinear sampling, or the two estimates cancel); `cloud` is then
// left empty.
bool build_point_cloud(const Grid2<Vec3>& bordered, PointCloud& cloud, std::string& err);
