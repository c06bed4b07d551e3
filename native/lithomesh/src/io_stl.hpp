// io_stl.hpp — Binary STL reader/writer for lithomesh.
//
// Layout (all little-endian, independent of host byte order):
// - 80-byte header, free text, zero padded;
// - uint32 triangle count;
// - per triangle 50 bytes: normal (3 x f32), v0, v1, v2 (3 x f32 each),
//   uint16 attribute byte count (always written as 0, ignored on read).
//
#pragma once
#include "mesh.hpp"
#include <cstdint>
#include <string>
#include <vector>

constexpr size_t kStlHeaderSize = 80;
constexpr size_t kStlRecordSize = 50;

// Serialize `mesh` into an in-memory STL payload.
std::vector<uint8_t> encode_stl_binary(const Mesh& mesh);

// Parse an in-memory STL payload. The size must be exactly 84 + 50*count.
// On failure, returns false and writes a human-readable message to `err`.
bool decode_stl_binary(const std::vector<uint8_t>& bytes, Mesh& mesh, std::string& err);

// Write `mesh` to `path`. An existing file is only replaced when `overwrite` is set.
// On failure, returns false and writes a human-readable message to `err`.
bool save_stl_binary(const std::string& path, const Mesh& mesh, std::string& err, bool overwrite = false);

// Load a binary STL from `path` into `mesh`.
bool load_stl_binary(const std::string& path, Mesh& mesh, std::string& err);
