// vec3.hpp — Single-precision 3D vector used for positions, offsets and normals.
//
// Floats (not doubles) are used on purpose: the STL payload stores IEEE-754 f32,
// so keeping the whole pipeline in float makes the written file match what
// the generator computed.
//
#pragma once
#include <cmath>

struct Vec3 { float x{}, y{}, z{}; };

inline Vec3 operator-(const Vec3& a, const Vec3& b){ return {a.x-b.x, a.y-b.y, a.z-b.z}; }
inline Vec3 operator+(const Vec3& a, const Vec3& b){ return {a.x+b.x, a.y+b.y, a.z+b.z}; }
inline Vec3 operator*(const Vec3& a, float s){ return {a.x*s, a.y*s, a.z*s}; }

inline Vec3 cross(const Vec3& a, const Vec3& b){ return {a.y*b.z-b.y*a.z, a.z*b.x-b.z*a.x, a.x*b.y-b.x*a.y}; }
inline float dot(const Vec3& a, const Vec3& b){ return a.x*b.x+a.y*b.y+a.z*b.z; }
inline float length(const Vec3& a){ return std::sqrt(dot(a,a)); }

// Scale `v` to unit length. Returns false (and leaves `out` untouched) when `v`
// has zero length, which callers treat as degenerate geometry.
inline bool normalize(const Vec3& v, Vec3& out){
    float L = length(v);
    if(L == 0.0f) return false;
    out = {v.x/L, v.y/L, v.z/L};
    return true;
}
