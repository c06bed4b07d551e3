// io_stl.cpp — Byte-exact binary STL encoding. Values are packed byte by byte
// so the output is identical on little- and big-endian hosts.

#include "io_stl.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>

static inline void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    for(int i = 0; i < 4; ++i) out.push_back((uint8_t)(v >> (8 * i)));
}

static inline void put_f32(std::vector<uint8_t>& out, float f) {
    uint32_t u; std::memcpy(&u, &f, 4); put_u32(out, u);
}

static inline void put_vec(std::vector<uint8_t>& out, const Vec3& v) {
    put_f32(out, v.x); put_f32(out, v.y); put_f32(out, v.z);
}

static inline uint32_t get_u32(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

static inline Vec3 get_vec(const uint8_t* p) {
    float f[3];
    for(int i = 0; i < 3; ++i) { uint32_t u = get_u32(p + 4 * i); std::memcpy(&f[i], &u, 4); }
    return {f[0], f[1], f[2]};
}

std::vector<uint8_t> encode_stl_binary(const Mesh& mesh) {
    std::vector<uint8_t> out;
    out.reserve(kStlHeaderSize + 4 + kStlRecordSize * mesh.triangles.size());
    out.resize(kStlHeaderSize, 0);
    std::memcpy(out.data(), mesh.header.data(), std::min(mesh.header.size(), kStlHeaderSize));
    put_u32(out, (uint32_t)mesh.triangles.size());
    for(const Triangle& t : mesh.triangles) {
        put_vec(out, t.normal);
        for(const Vec3& v : t.v) put_vec(out, v);
        out.push_back(0); out.push_back(0); // attribute byte count
    }
    return out;
}

bool decode_stl_binary(const std::vector<uint8_t>& bytes, Mesh& mesh, std::string& err) {
    mesh.clear();
    if(bytes.size() < kStlHeaderSize + 4) { err = "stl payload too short: " + std::to_string(bytes.size()) + " bytes"; return false; }
    const uint32_t n = get_u32(bytes.data() + kStlHeaderSize);
    const size_t expect = kStlHeaderSize + 4 + kStlRecordSize * (size_t)n;
    if(bytes.size() != expect) {
        err = "stl size mismatch: header says " + std::to_string(n) + " triangles (" + std::to_string(expect)
            + " bytes) but payload has " + std::to_string(bytes.size()) + " bytes";
        return false;
    }
    // header text stops at the first NUL
    const char* h = (const char*)bytes.data();
    mesh.header.assign(h, std::find(h, h + kStlHeaderSize, '\0'));
    mesh.triangles.resize(n);
    const uint8_t* p = bytes.data() + kStlHeaderSize + 4;
    for(uint32_t i = 0; i < n; ++i, p += kStlRecordSize) {
        Triangle& t = mesh.triangles[i];
        t.normal = get_vec(p);
        for(int k = 0; k < 3; ++k) t.v[k] = get_vec(p + 12 * (k + 1));
    }
    return true;
}

bool save_stl_binary(const std::string& path, const Mesh& mesh, std::string& err, bool overwrite) {
    // "x" makes creation exclusive: an existing file is never truncated.
    std::FILE* f = std::fopen(path.c_str(), overwrite ? "wb" : "wbx");
    if(!f) {
        if(!overwrite && std::ifstream(path)) err = "refusing to overwrite existing file: " + path;
        else err = "cannot write: " + path;
        return false;
    }
    const std::vector<uint8_t> bytes = encode_stl_binary(mesh);
    const bool wrote = std::fwrite(bytes.data(), 1, bytes.size(), f) == bytes.size();
    if(std::fclose(f) != 0 || !wrote) {
        std::remove(path.c_str()); // no truncated mesh left behind
        err = "write error: " + path;
        return false;
    }
    return true;
}

bool load_stl_binary(const std::string& path, Mesh& mesh, std::string& err) {
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs) { err = "cannot open: " + path; return false; }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if(!decode_stl_binary(bytes, mesh, err)) { err += " (" + path + ")"; return false; }
    return true;
}
