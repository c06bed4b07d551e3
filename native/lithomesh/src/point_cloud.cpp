// point_cloud.cpp — Finite-difference normal estimation on the bordered grid.

#include "point_cloud.hpp"
#include <utility>

static std::string degenerate_at(size_t col, size_t row, const char* what) {
    return "degenerate geometry: " + std::string(what) + " has zero length at column "
        + std::to_string(col) + ", row " + std::to_string(row);
}

bool build_point_cloud(const Grid2<Vec3>& g, PointCloud& cloud, std::string& err) {
    cloud.vertices = Grid2<Vec3>();
    cloud.normals = Grid2<Vec3>();
    if(g.cols() < 3 || g.rows() < 3) return true; // nothing inside the border

    const size_t wc = g.cols() - 2, hc = g.rows() - 2;
    Grid2<Vec3> normals(wc, hc);
    for(size_t y = 0; y < hc; ++y) {
        for(size_t x = 0; x < wc; ++x) {
            const Vec3& v = g.at(x + 1, y + 1);
            Vec3 n1, n2, n;
            // lower and right neighbours
            if(!normalize(cross(g.at(x + 1, y + 2) - v, g.at(x + 2, y + 1) - v), n1)) {
                err = degenerate_at(x, y, "lower/right normal"); return false;
            }
            // upper and left neighbours
            if(!normalize(cross(g.at(x + 1, y) - v, g.at(x, y + 1) - v), n2)) {
                err = degenerate_at(x, y, "upper/left normal"); return false;
            }
            if(!normalize(n1 + n2, n)) {
                err = degenerate_at(x, y, "averaged normal"); return false;
            }
            normals.at(x, y) = n;
        }
    }

    cloud.vertices = g.interior();
    cloud.normals = std::move(normals);
    return true;
}
