// grid.hpp — Sampling of the parametric backing surface.
//
// The surface is described by three scalar functions mapping
// (column, row, image width, image height) to world X, Y and Z. They are
// sampled over the image's index domain plus a one-step border ring; the ring
// only exists so that every real vertex has four neighbours for normal
// estimation (see point_cloud.hpp) and is discarded afterwards.
//
#pragma once
#include "vec3.hpp"
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <vector>

// Coordinate function: (x, y, w, h) -> value. x/y may be negative or past the
// image bounds (border ring, mirrored preview index); w/h are always the full
// image size regardless of step.
using CoordFn = std::function<float(float x, float y, float w, float h)>;

// The three coordinate functions defining the backing surface.
struct SurfaceFns {
    CoordFn x, y, z;
};

// Dense 2D array addressed as (column, row), stored row-major in a flat vector.
template <typename T>
class Grid2 {
public:
    Grid2() = default;
    Grid2(size_t cols, size_t rows) : cols_(cols), rows_(rows), data_(cols * rows) {}

    size_t cols() const { return cols_; }
    size_t rows() const { return rows_; }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    T& at(size_t col, size_t row) { check(col, row); return data_[row * cols_ + col]; }
    const T& at(size_t col, size_t row) const { check(col, row); return data_[row * cols_ + col]; }

    // Append in row-major order; used while a grid is being filled.
    void reserve(size_t cols, size_t rows) { data_.clear(); data_.reserve(cols * rows); cols_ = cols; rows_ = rows; }
    void push_back(const T& v) { data_.push_back(v); }

    const std::vector<T>& data() const { return data_; }

    // Copy of this grid without its outermost ring of cells.
    Grid2 interior() const {
        if(cols_ < 2 || rows_ < 2) return Grid2();
        Grid2 out(cols_ - 2, rows_ - 2);
        for(size_t r = 0; r < out.rows_; ++r)
            for(size_t c = 0; c < out.cols_; ++c)
                out.data_[r * out.cols_ + c] = data_[(r + 1) * cols_ + c + 1];
        return out;
    }

private:
    void check(size_t col, size_t row) const {
        if(col >= cols_ || row >= rows_) throw std::out_of_range("Grid2::at: index outside grid");
    }

    size_t cols_ = 0;
    size_t rows_ = 0;
    std::vector<T> data_;
};

// Sample positions along one axis of length `length` at stride `step` (>= 1).
// Starts one step before the image (-step), always contains length-1, and ends
// with one extra index mirrored around length-1 so the last real sample has a
// neighbour at the same distance as its predecessor.
// Example: length=15, step=4 -> -4 0 4 8 12 14 16. Empty when length or step is 0.
std::vector<int64_t> step_indices(uint32_t length, uint32_t step);

// Evaluate `fns` on the bordered grid step_indices(width) x step_indices(height).
// The result is (EW x EH) with EW/EH the lengths of the two index sequences;
// the outer ring is the border. Evaluation itself cannot fail.
Grid2<Vec3> evaluate_surface(const SurfaceFns& fns, uint32_t width, uint32_t height, uint32_t step);
