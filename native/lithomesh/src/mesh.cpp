// mesh.cpp — Small helpers on top of the Mesh container and the triangle builder.

#include "mesh.hpp"

// Reset the container; used by the generators before filling and on failure.
void Mesh::clear() {
    header.clear();
    triangles.clear();
}

bool make_triangle(const Vec3& p0, const Vec3& p1, const Vec3& p2, Triangle& out) {
    Vec3 n;
    if(!normalize(cross(p1 - p0, p2 - p0), n)) return false; // collinear or coincident
    out.normal = n;
    out.v = {p0, p1, p2};
    return true;
}
