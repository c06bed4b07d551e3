// grid.cpp — Index sequence generation and surface sampling.

#include "grid.hpp"

std::vector<int64_t> step_indices(uint32_t length, uint32_t step) {
    std::vector<int64_t> v;
    if(length == 0 || step == 0) return v;
    const int64_t len = length, s = step;
    v.reserve((length - 1 + step - 1) / step + 3);
    for(int64_t i = -s; i < len; i += s) v.push_back(i);
    if((length - 1) % step != 0) v.push_back(len - 1); // snap to the true edge
    v.push_back((len - 1) * 2 - v[v.size() - 2]);        // mirrored border sample
    return v;
}

Grid2<Vec3> evaluate_surface(const SurfaceFns& fns, uint32_t width, uint32_t height, uint32_t step) {
    const std::vector<int64_t> xs = step_indices(width, step);
    const std::vector<int64_t> ys = step_indices(height, step);
    const float w = (float)width, h = (float)height;

    Grid2<Vec3> grid;
    grid.reserve(xs.size(), ys.size());
    for(int64_t yi : ys) {
        for(int64_t xi : xs) {
            const float x = (float)xi, y = (float)yi;
            grid.push_back(Vec3{fns.x(x, y, w, h), fns.y(x, y, w, h), fns.z(x, y, w, h)});
        }
    }
    return grid;
}
