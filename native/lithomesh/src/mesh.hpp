// mesh.hpp — Triangle-soup container produced by the lithophane generator.
//
// Conventions used across lithomesh:
// - Triangles are stored by value (no shared vertex table); this mirrors the
//   binary STL layout the mesh is eventually written to.
// - Winding is counter-clockwise under the right-hand rule; the stored face
//   normal always equals normalize(cross(v1-v0, v2-v0)).
// - Order of `triangles` is insertion order. It carries no meaning but is kept
//   stable so repeated runs produce byte-identical files.
//
#pragma once
#include "vec3.hpp"
#include <array>
#include <string>
#include <vector>

// Oriented triangle with its unit face normal.
struct Triangle {
    Vec3 normal;
    std::array<Vec3, 3> v;
};

struct Mesh {
    // Free-form text written to the 80-byte STL header (truncated if longer).
    std::string header;
    std::vector<Triangle> triangles;

    // Drop all triangles and the header. Capacity is kept.
    void clear();

    size_t num_triangles() const { return triangles.size(); }
};

// Build the triangle (p0, p1, p2) with normal = normalize(cross(p1-p0, p2-p0)).
// Returns false when the points are collinear or coincident; `out` is then
// left untouched. Every triangle the generator emits goes through here.
bool make_triangle(const Vec3& p0, const Vec3& p1, const Vec3& p2, Triangle& out);
