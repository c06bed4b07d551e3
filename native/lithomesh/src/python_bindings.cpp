//======================================================================
// 文件总体说明：
//
// 这个文件通过 pybind11 把 lithomesh 的浮雕（lithophane）生成器暴露给 Python，
// 作为命令行工具之外的“宿主嵌入”入口。
//
// 从 Python 的视角看，模块 lithomesh_py 提供三个函数：
//   - generate_lithophane(x, y, z, image, white_depth, black_depth, header) -> bytes
//   - generate_preview(x, y, z, width, height, step, header)                -> bytes
//   - get_image_dimensions(image)                                          -> (w, h)
// 其中 x/y/z 是表达式文本（变量 x, y, w, h），image 是编码后的图片字节。
// 返回的 bytes 就是完整的二进制 STL。任何失败都抛出 ValueError。
//======================================================================

#include "expr.hpp"
#include "image_io.hpp"
#include "io_stl.hpp"
#include "lithophane.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>
#include <vector>

namespace py = pybind11;

// Python bytes -> std::vector<uint8_t>
static std::vector<uint8_t> to_buffer(const py::bytes& b) {
    std::string s = b;
    return std::vector<uint8_t>(s.begin(), s.end());
}

static py::bytes to_bytes(const std::vector<uint8_t>& v) {
    return py::bytes(reinterpret_cast<const char*>(v.data()), v.size());
}

// 把三个表达式编译成坐标函数；出错时错误信息里带上是哪一个表达式（x/y/z）。
static SurfaceFns compile_surface(const std::string& x, const std::string& y, const std::string& z) {
    SurfaceFns fns;
    std::string err;
    if (!compile_expression(x, fns.x, err)) throw py::value_error("invalid x expression: " + err);
    if (!compile_expression(y, fns.y, err)) throw py::value_error("invalid y expression: " + err);
    if (!compile_expression(z, fns.z, err)) throw py::value_error("invalid z expression: " + err);
    return fns;
}

//======================================================================
// 函数：generate_lithophane
// 作用：解码图片 -> 编译表达式 -> 生成封闭网格 -> 编码为二进制 STL。
// 生成过程只使用 C++ 对象，因此在计算期间释放 GIL。
//======================================================================
static py::bytes py_generate_lithophane(const std::string& x, const std::string& y, const std::string& z,
                                        const py::bytes& image, float white_depth, float black_depth,
                                        const std::string& header) {
    SurfaceFns fns = compile_surface(x, y, z);
    std::vector<uint8_t> encoded = to_buffer(image);

    GrayImage img; Mesh mesh; GenerateReport rep; std::string err;
    LithophaneOptions opt;
    opt.white_depth = white_depth;
    opt.black_depth = black_depth;
    opt.header = header;

    bool ok;
    std::vector<uint8_t> stl;
    {
        py::gil_scoped_release release;
        ok = decode_gray_image(encoded, img, err) && generate_lithophane(fns, img, opt, mesh, rep, err);
        if (ok) stl = encode_stl_binary(mesh);
    }
    if (!ok) throw py::value_error(err);
    return to_bytes(stl);
}

static py::bytes py_generate_preview(const std::string& x, const std::string& y, const std::string& z,
                                     uint32_t width, uint32_t height, uint32_t step, const std::string& header) {
    SurfaceFns fns = compile_surface(x, y, z);

    Mesh mesh; GenerateReport rep; std::string err;
    LithophaneOptions opt;
    opt.header = header;

    bool ok;
    std::vector<uint8_t> stl;
    {
        py::gil_scoped_release release;
        ok = generate_preview(fns, width, height, step, opt, mesh, rep, err);
        if (ok) stl = encode_stl_binary(mesh);
    }
    if (!ok) throw py::value_error(err);
    return to_bytes(stl);
}

static py::tuple py_get_image_dimensions(const py::bytes& image) {
    uint32_t w = 0, h = 0; std::string err;
    if (!probe_image_size(to_buffer(image), w, h, err)) throw py::value_error(err);
    return py::make_tuple(w, h);
}

//======================================================================
// PYBIND11_MODULE：定义名为 lithomesh_py 的 Python 扩展模块
//======================================================================
PYBIND11_MODULE(lithomesh_py, m) {
    m.doc() = "Python bindings for the native lithomesh lithophane generator";
    m.attr("__version__") = LITHOMESH_VERSION;

    m.def("generate_lithophane", &py_generate_lithophane,
          py::arg("x_expression"), py::arg("y_expression"), py::arg("z_expression"),
          py::arg("image"),
          py::arg("white_depth") = 0.5f,
          py::arg("black_depth") = 3.0f,
          py::arg("header") = std::string(),
          R"doc(
Generate a closed lithophane mesh from an encoded image.

Parameters
----------
x_expression, y_expression, z_expression : str
    Surface coordinates as expressions in x, y (pixel column/row) and w, h
    (image width/height).
image : bytes
    Encoded image (PNG, JPEG, ...); converted to grayscale.
white_depth : float
    Thickness for white pixels.
black_depth : float
    Thickness for black pixels.
header : str
    Text stored in the 80-byte STL header.

Returns
-------
bytes
    Binary STL payload.
)doc");

    m.def("generate_preview", &py_generate_preview,
          py::arg("x_expression"), py::arg("y_expression"), py::arg("z_expression"),
          py::arg("width"), py::arg("height"), py::arg("step") = 1u,
          py::arg("header") = std::string(),
          R"doc(
Triangulate only the backing surface of a width x height image, sampling every
`step` pixels (image edges are always included). Returns a binary STL payload.
)doc");

    m.def("get_image_dimensions", &py_get_image_dimensions, py::arg("image"),
          "Return (width, height) of an encoded image without decoding its pixels.");
}
