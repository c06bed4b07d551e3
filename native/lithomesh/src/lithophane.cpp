// lithophane.cpp — Mesh assembly for the full lithophane and the preview.
//
// Image origin is top left: row 0 is the top edge and rows grow downwards.
// Vertex orders below are fixed so every face of the closed solid points
// outwards; changing one order flips that face.

#include "lithophane.hpp"
#include <cstdio>

namespace {

// Appends triangles to a mesh through make_triangle and remembers the first
// failure so loops can bail out with a useful message.
struct TriangleSink {
    std::vector<Triangle>& out;
    std::string& err;
    const char* stage = "";

    bool add(const Vec3& a, const Vec3& b, const Vec3& c, size_t col, size_t row) {
        Triangle t;
        if(!make_triangle(a, b, c, t)) {
            err = std::string("degenerate geometry: collinear points in ") + stage
                + " at column " + std::to_string(col) + ", row " + std::to_string(row);
            return false;
        }
        out.push_back(t);
        return true;
    }
};

void progress(const LithophaneOptions& opt, const char* stage, size_t row, size_t rows) {
    if(opt.progress_interval <= 0) return;
    if(row + 1 == rows || (row + 1) % (size_t)opt.progress_interval == 0)
        fprintf(stderr, "[lithomesh] %s rows=%zu/%zu\n", stage, row + 1, rows);
}

} // namespace

size_t lithophane_triangle_count(size_t width, size_t height) {
    if(width < 2 || height < 2) return 0;
    // backing + front, then the four walls
    return (width - 1) * (height - 1) * 4 + 4 * (width - 1) + 4 * (height - 1);
}

size_t preview_triangle_count(size_t width, size_t height) {
    if(width < 2 || height < 2) return 0;
    return (width - 1) * (height - 1) * 2;
}

bool generate_lithophane_mesh(const PointCloud& cloud, const GrayImage& image, const LithophaneOptions& opt,
                              Mesh& mesh, std::string& err) {
    mesh.clear();
    const size_t W = cloud.width(), H = cloud.height();
    if(image.width != W || image.height != H) {
        err = "image is " + std::to_string(image.width) + "x" + std::to_string(image.height)
            + " but the point cloud is " + std::to_string(W) + "x" + std::to_string(H);
        return false;
    }
    if(W < 2 || H < 2) { mesh.header = opt.header; return true; }

    std::vector<Triangle> tris;
    tris.reserve(lithophane_triangle_count(W, H));
    TriangleSink sink{tris, err};
    const Grid2<Vec3>& v = cloud.vertices;

    // backing mesh from the raw samples
    sink.stage = "backing mesh";
    for(size_t y = 0; y < H - 1; ++y) {
        for(size_t x = 0; x < W - 1; ++x) {
            if(!sink.add(v.at(x, y), v.at(x + 1, y + 1), v.at(x, y + 1), x, y)) return false;
            if(!sink.add(v.at(x, y), v.at(x + 1, y), v.at(x + 1, y + 1), x, y)) return false;
        }
        progress(opt, "backing", y, H - 1);
    }

    // push every sample along its normal by the pixel's depth
    Grid2<Vec3> p(W, H);
    for(size_t y = 0; y < H; ++y)
        for(size_t x = 0; x < W; ++x) {
            float d = pixel_depth(image.at((uint32_t)x, (uint32_t)y), opt.white_depth, opt.black_depth);
            p.at(x, y) = v.at(x, y) + cloud.normals.at(x, y) * d;
        }

    // front mesh, winding mirrored relative to the backing
    sink.stage = "pixel mesh";
    for(size_t y = 0; y < H - 1; ++y) {
        for(size_t x = 0; x < W - 1; ++x) {
            if(!sink.add(p.at(x, y), p.at(x, y + 1), p.at(x + 1, y + 1), x, y)) return false;
            if(!sink.add(p.at(x, y), p.at(x + 1, y + 1), p.at(x + 1, y), x, y)) return false;
        }
        progress(opt, "front", y, H - 1);
    }

    sink.stage = "top wall";
    for(size_t x = 0; x < W - 1; ++x) {
        if(!sink.add(v.at(x, 0), p.at(x, 0), p.at(x + 1, 0), x, 0)) return false;
        if(!sink.add(v.at(x, 0), p.at(x + 1, 0), v.at(x + 1, 0), x, 0)) return false;
    }

    sink.stage = "bottom wall";
    const size_t b = H - 1;
    for(size_t x = 0; x < W - 1; ++x) {
        if(!sink.add(v.at(x, b), p.at(x + 1, b), p.at(x, b), x, b)) return false;
        if(!sink.add(v.at(x, b), v.at(x + 1, b), p.at(x + 1, b), x, b)) return false;
    }

    sink.stage = "left wall";
    for(size_t y = 0; y < H - 1; ++y) {
        if(!sink.add(v.at(0, y), v.at(0, y + 1), p.at(0, y + 1), 0, y)) return false;
        if(!sink.add(v.at(0, y), p.at(0, y + 1), p.at(0, y), 0, y)) return false;
    }

    sink.stage = "right wall";
    const size_t r = W - 1;
    for(size_t y = 0; y < H - 1; ++y) {
        if(!sink.add(v.at(r, y), p.at(r, y + 1), v.at(r, y + 1), r, y)) return false;
        if(!sink.add(v.at(r, y), p.at(r, y), p.at(r, y + 1), r, y)) return false;
    }

    mesh.header = opt.header;
    mesh.triangles.swap(tris);
    return true;
}

bool generate_lithophane(const SurfaceFns& fns, const GrayImage& image, const LithophaneOptions& opt,
                         Mesh& mesh, GenerateReport& rep, std::string& err) {
    mesh.clear();
    rep = GenerateReport();
    if(image.pixels.size() != (size_t)image.width * image.height) {
        err = "image pixel buffer does not match its dimensions";
        rep.error = GenError::InvalidInput;
        return false;
    }
    if(image.width < 2 || image.height < 2) { mesh.header = opt.header; return true; }

    Grid2<Vec3> grid = evaluate_surface(fns, image.width, image.height, 1);
    rep.grid_cols = grid.cols(); rep.grid_rows = grid.rows();

    PointCloud cloud;
    if(!build_point_cloud(grid, cloud, err)) { rep.error = GenError::DegenerateGeometry; return false; }
    rep.vertices = cloud.vertices.size();

    if(!generate_lithophane_mesh(cloud, image, opt, mesh, err)) {
        mesh.clear();
        rep.error = (cloud.width() != image.width || cloud.height() != image.height)
            ? GenError::InvalidInput : GenError::DegenerateGeometry;
        return false;
    }
    rep.triangles = mesh.num_triangles();
    return true;
}

bool generate_preview(const SurfaceFns& fns, uint32_t width, uint32_t height, uint32_t step,
                      const LithophaneOptions& opt, Mesh& mesh, GenerateReport& rep, std::string& err) {
    mesh.clear();
    rep = GenerateReport();
    if(step == 0) { err = "preview step must be at least 1"; rep.error = GenError::InvalidInput; return false; }
    if(width < 2 || height < 2) { mesh.header = opt.header; return true; }

    Grid2<Vec3> grid = evaluate_surface(fns, width, height, step);
    rep.grid_cols = grid.cols(); rep.grid_rows = grid.rows();
    const Grid2<Vec3> v = grid.interior(); // no normals needed, just drop the border
    rep.vertices = v.size();

    const size_t W = v.cols(), H = v.rows();
    std::vector<Triangle> tris;
    tris.reserve(preview_triangle_count(W, H));
    TriangleSink sink{tris, err, "preview"};
    for(size_t y = 0; y + 1 < H; ++y) {
        for(size_t x = 0; x + 1 < W; ++x) {
            if(!sink.add(v.at(x, y), v.at(x, y + 1), v.at(x + 1, y + 1), x, y)
               || !sink.add(v.at(x, y), v.at(x + 1, y + 1), v.at(x + 1, y), x, y)) {
                mesh.clear();
                rep.error = GenError::DegenerateGeometry;
                return false;
            }
        }
        progress(opt, "preview", y, H - 1);
    }
    mesh.header = opt.header;
    mesh.triangles.swap(tris);
    rep.triangles = mesh.num_triangles();
    return true;
}
