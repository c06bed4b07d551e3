#include "io_stl.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>

namespace {

Mesh two_triangles() {
    Mesh m;
    m.header = "lithomesh test";
    Triangle a, b;
    make_triangle({0, 0, 0}, {1, 0, 0}, {0, 1, 0}, a);
    make_triangle({0, 0, 1}, {0, 1, 1}, {1, 0, 1.5f}, b);
    m.triangles = {a, b};
    return m;
}

float f32_at(const std::vector<uint8_t>& b, size_t off) {
    uint32_t u = (uint32_t)b[off] | ((uint32_t)b[off + 1] << 8) | ((uint32_t)b[off + 2] << 16) | ((uint32_t)b[off + 3] << 24);
    float f; std::memcpy(&f, &u, 4); return f;
}

std::string temp_path(const char* name) {
    return std::string(::testing::TempDir()) + name;
}

} // namespace

TEST(StlEncode, LayoutIsByteExact) {
    Mesh m = two_triangles();
    std::vector<uint8_t> b = encode_stl_binary(m);
    ASSERT_EQ(b.size(), 84u + 2 * 50u);
    EXPECT_EQ(std::string((const char*)b.data(), 14), "lithomesh test");
    for(size_t i = 14; i < 80; ++i) EXPECT_EQ(b[i], 0) << i;
    EXPECT_EQ(b[80], 2); EXPECT_EQ(b[81], 0); EXPECT_EQ(b[82], 0); EXPECT_EQ(b[83], 0);

    // first record: normal (0,0,1) then v0 v1 v2
    EXPECT_FLOAT_EQ(f32_at(b, 84 + 8), 1.0f);
    EXPECT_FLOAT_EQ(f32_at(b, 84 + 12 + 12), 1.0f); // v1.x
    EXPECT_FLOAT_EQ(f32_at(b, 84 + 12 + 24 + 4), 1.0f); // v2.y
    EXPECT_EQ(b[84 + 48], 0); EXPECT_EQ(b[84 + 49], 0);
    // second record v2.z
    EXPECT_FLOAT_EQ(f32_at(b, 134 + 36 + 8), 1.5f);
    // 1.0f little-endian is 00 00 80 3f
    EXPECT_EQ(b[84 + 8], 0x00); EXPECT_EQ(b[84 + 10], 0x80); EXPECT_EQ(b[84 + 11], 0x3f);
}

TEST(StlEncode, EmptyMeshAndLongHeader) {
    Mesh m;
    m.header = std::string(100, 'h');
    std::vector<uint8_t> b = encode_stl_binary(m);
    ASSERT_EQ(b.size(), 84u);
    EXPECT_EQ(b[79], 'h');
    EXPECT_EQ(b[80], 0);
}

TEST(StlDecode, ReadsWhatWasWritten) {
    Mesh m = two_triangles(), back; std::string err;
    ASSERT_TRUE(decode_stl_binary(encode_stl_binary(m), back, err)) << err;
    EXPECT_EQ(back.header, m.header);
    ASSERT_EQ(back.num_triangles(), 2u);
    EXPECT_FLOAT_EQ(back.triangles[1].v[2].z, 1.5f);
    EXPECT_FLOAT_EQ(back.triangles[0].normal.z, 1.0f);
}

TEST(StlDecode, RejectsTruncatedPayload) {
    std::vector<uint8_t> b = encode_stl_binary(two_triangles());
    b.pop_back();
    Mesh m; std::string err;
    EXPECT_FALSE(decode_stl_binary(b, m, err));
    EXPECT_NE(err.find("size mismatch"), std::string::npos) << err;
    EXPECT_FALSE(decode_stl_binary(std::vector<uint8_t>(10, 0), m, err));
}

TEST(StlFile, SaveRefusesToOverwriteUnlessAsked) {
    const std::string path = temp_path("lithomesh_io_test.stl");
    std::remove(path.c_str());
    Mesh m = two_triangles(); std::string err;
    ASSERT_TRUE(save_stl_binary(path, m, err)) << err;
    EXPECT_FALSE(save_stl_binary(path, m, err));
    EXPECT_NE(err.find("overwrite"), std::string::npos);
    m.triangles.pop_back();
    ASSERT_TRUE(save_stl_binary(path, m, err, true)) << err;

    Mesh back;
    ASSERT_TRUE(load_stl_binary(path, back, err)) << err;
    EXPECT_EQ(back.num_triangles(), 1u);
    std::remove(path.c_str());
}

TEST(StlFile, LoadMissingFileFails) {
    Mesh m; std::string err;
    EXPECT_FALSE(load_stl_binary(temp_path("lithomesh_does_not_exist.stl"), m, err));
    EXPECT_NE(err.find("cannot open"), std::string::npos);
}

TEST(StlFile, RefusedSaveLeavesExistingFileIntact) {
    const std::string path = temp_path("lithomesh_io_keep.stl");
    {
        std::ofstream ofs(path, std::ios::binary);
        ofs << "not an stl";
    }
    Mesh m = two_triangles(); std::string err;
    EXPECT_FALSE(save_stl_binary(path, m, err));
    EXPECT_NE(err.find("refusing to overwrite"), std::string::npos) << err;

    std::ifstream ifs(path, std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "not an stl");
    ifs.close();
    std::remove(path.c_str());
}

TEST(StlFile, UnwritableDirectoryFails) {
    Mesh m = two_triangles(); std::string err;
    EXPECT_FALSE(save_stl_binary(temp_path("lithomesh_no_such_dir/out.stl"), m, err, true));
    EXPECT_NE(err.find("cannot write"), std::string::npos) << err;
}
