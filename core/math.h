#pragma once

#include <cmath>

namespace skygrid::core {

constexpr float kPi = 3.14159265358979323846f;

struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vec3() = default;
    constexpr Vec3(float px, float py, float pz) : x(px), y(py), z(pz) {}

    constexpr Vec3 operator+(const Vec3& rhs) const { return Vec3{x + rhs.x, y + rhs.y, z + rhs.z}; }
    constexpr Vec3 operator-(const Vec3& rhs) const { return Vec3{x - rhs.x, y - rhs.y, z - rhs.z}; }
    constexpr Vec3 operator-() const { return Vec3{-x, -y, -z}; }
    constexpr Vec3 operator*(float s) const { return Vec3{x * s, y * s, z * s}; }
    constexpr Vec3 operator/(float s) const { return Vec3{x / s, y / s, z / s}; }

    Vec3& operator+=(const Vec3& rhs) {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }
};

inline constexpr Vec3 operator*(float s, const Vec3& v) {
    return v * s;
}

inline float dot(const Vec3& a, const Vec3& b) {
    return (a.x * b.x) + (a.y * b.y) + (a.z * b.z);
}

inline float length(const Vec3& v) {
    return std::sqrt(dot(v, v));
}

inline Vec3 normalize(const Vec3& v) {
    const float len = length(v);
    if (len <= 0.0f) {
        return Vec3{};
    }
    return v / len;
}

inline Vec3 cross(const Vec3& a, const Vec3& b) {
    return Vec3{
        (a.y * b.z) - (a.z * b.y),
        (a.z * b.x) - (a.x * b.z),
        (a.x * b.y) - (a.y * b.x)};
}

inline float radians(float degrees) {
    return degrees * (kPi / 180.0f);
}

struct Vec4 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float w = 0.0f;

    constexpr Vec4() = default;
    constexpr Vec4(float px, float py, float pz, float pw) : x(px), y(py), z(pz), w(pw) {}
    constexpr Vec4(const Vec3& xyz, float pw) : x(xyz.x), y(xyz.y), z(xyz.z), w(pw) {}
};

// Row-major 4x4 matrix acting on column vectors (v' = M * v).
// Shaders declare the matching uniform blocks row_major so the bytes upload unchanged.
struct Mat4 {
    float m[16] = {
        1.0f, 0.0f, 0.0f, 0.0f,
        0.0f, 1.0f, 0.0f, 0.0f,
        0.0f, 0.0f, 1.0f, 0.0f,
        0.0f, 0.0f, 0.0f, 1.0f};

    static Mat4 identity() { return Mat4{}; }

    static Mat4 zero() {
        Mat4 result{};
        for (float& value : result.m) {
            value = 0.0f;
        }
        return result;
    }

    static Mat4 translation(const Vec3& t) {
        Mat4 result{};
        result(0, 3) = t.x;
        result(1, 3) = t.y;
        result(2, 3) = t.z;
        return result;
    }

    static Mat4 scale(const Vec3& s) {
        Mat4 result{};
        result(0, 0) = s.x;
        result(1, 1) = s.y;
        result(2, 2) = s.z;
        return result;
    }

    static Mat4 rotationY(float angleRadians) {
        Mat4 result{};
        const float c = std::cos(angleRadians);
        const float s = std::sin(angleRadians);
        result(0, 0) = c;
        result(0, 2) = s;
        result(2, 0) = -s;
        result(2, 2) = c;
        return result;
    }

    float& operator()(int row, int col) { return m[(row * 4) + col]; }
    const float& operator()(int row, int col) const { return m[(row * 4) + col]; }
};

inline Mat4 operator*(const Mat4& a, const Mat4& b) {
    Mat4 result = Mat4::zero();
    for (int row = 0; row < 4; ++row) {
        for (int col = 0; col < 4; ++col) {
            float sum = 0.0f;
            for (int k = 0; k < 4; ++k) {
                sum += a(row, k) * b(k, col);
            }
            result(row, col) = sum;
        }
    }
    return result;
}

inline Vec4 operator*(const Mat4& a, const Vec4& v) {
    return Vec4{
        (a(0, 0) * v.x) + (a(0, 1) * v.y) + (a(0, 2) * v.z) + (a(0, 3) * v.w),
        (a(1, 0) * v.x) + (a(1, 1) * v.y) + (a(1, 2) * v.z) + (a(1, 3) * v.w),
        (a(2, 0) * v.x) + (a(2, 1) * v.y) + (a(2, 2) * v.z) + (a(2, 3) * v.w),
        (a(3, 0) * v.x) + (a(3, 1) * v.y) + (a(3, 2) * v.z) + (a(3, 3) * v.w)};
}

inline Vec3 transformPoint(const Mat4& a, const Vec3& p) {
    const Vec4 r = a * Vec4{p, 1.0f};
    if (r.w == 0.0f) {
        return Vec3{r.x, r.y, r.z};
    }
    return Vec3{r.x / r.w, r.y / r.w, r.z / r.w};
}

inline Vec3 transformDirection(const Mat4& a, const Vec3& d) {
    const Vec4 r = a * Vec4{d, 0.0f};
    return Vec3{r.x, r.y, r.z};
}

inline Mat4 transpose(const Mat4& a) {
    Mat4 result{};
    for (int row = 0; row < 4; ++row) {
        for (int col = 0; col < 4; ++col) {
            result(row, col) = a(col, row);
        }
    }
    return result;
}

// Right-handed view matrix looking along `direction` from `eye`.
inline Mat4 lookToRH(const Vec3& eye, const Vec3& direction, const Vec3& up) {
    const Vec3 f = normalize(direction);
    const Vec3 s = normalize(cross(f, up));
    const Vec3 u = cross(s, f);

    Mat4 result{};
    result(0, 0) = s.x;
    result(0, 1) = s.y;
    result(0, 2) = s.z;
    result(1, 0) = u.x;
    result(1, 1) = u.y;
    result(1, 2) = u.z;
    result(2, 0) = -f.x;
    result(2, 1) = -f.y;
    result(2, 2) = -f.z;
    result(0, 3) = -dot(s, eye);
    result(1, 3) = -dot(u, eye);
    result(2, 3) = dot(f, eye);
    return result;
}

// Vulkan reverse-Z perspective with depth range [0, 1], near -> 1, far -> 0.
inline Mat4 perspectiveVulkanReverseZ(float fovYRadians, float aspectRatio, float nearPlane, float farPlane) {
    Mat4 result = Mat4::zero();
    const float f = 1.0f / std::tan(fovYRadians * 0.5f);
    result(0, 0) = f / aspectRatio;
    result(1, 1) = -f;
    result(2, 2) = nearPlane / (farPlane - nearPlane);
    result(2, 3) = (nearPlane * farPlane) / (farPlane - nearPlane);
    result(3, 2) = -1.0f;
    return result;
}

// General inverse; returns identity for singular input.
inline Mat4 inverse(const Mat4& a) {
    const float a00 = a(0, 0), a01 = a(0, 1), a02 = a(0, 2), a03 = a(0, 3);
    const float a10 = a(1, 0), a11 = a(1, 1), a12 = a(1, 2), a13 = a(1, 3);
    const float a20 = a(2, 0), a21 = a(2, 1), a22 = a(2, 2), a23 = a(2, 3);
    const float a30 = a(3, 0), a31 = a(3, 1), a32 = a(3, 2), a33 = a(3, 3);

    const float b00 = a00 * a11 - a01 * a10;
    const float b01 = a00 * a12 - a02 * a10;
    const float b02 = a00 * a13 - a03 * a10;
    const float b03 = a01 * a12 - a02 * a11;
    const float b04 = a01 * a13 - a03 * a11;
    const float b05 = a02 * a13 - a03 * a12;
    const float b06 = a20 * a31 - a21 * a30;
    const float b07 = a20 * a32 - a22 * a30;
    const float b08 = a20 * a33 - a23 * a30;
    const float b09 = a21 * a32 - a22 * a31;
    const float b10 = a21 * a33 - a23 * a31;
    const float b11 = a22 * a33 - a23 * a32;

    const float det = (b00 * b11) - (b01 * b10) + (b02 * b09) + (b03 * b08) - (b04 * b07) + (b05 * b06);
    if (std::abs(det) <= 1e-12f) {
        return Mat4::identity();
    }
    const float invDet = 1.0f / det;

    Mat4 r{};
    r(0, 0) = (a11 * b11 - a12 * b10 + a13 * b09) * invDet;
    r(0, 1) = (a02 * b10 - a01 * b11 - a03 * b09) * invDet;
    r(0, 2) = (a31 * b05 - a32 * b04 + a33 * b03) * invDet;
    r(0, 3) = (a22 * b04 - a21 * b05 - a23 * b03) * invDet;
    r(1, 0) = (a12 * b08 - a10 * b11 - a13 * b07) * invDet;
    r(1, 1) = (a00 * b11 - a02 * b08 + a03 * b07) * invDet;
    r(1, 2) = (a32 * b02 - a30 * b05 - a33 * b01) * invDet;
    r(1, 3) = (a20 * b05 - a22 * b02 + a23 * b01) * invDet;
    r(2, 0) = (a10 * b10 - a11 * b08 + a13 * b06) * invDet;
    r(2, 1) = (a01 * b08 - a00 * b10 - a03 * b06) * invDet;
    r(2, 2) = (a30 * b04 - a31 * b02 + a33 * b00) * invDet;
    r(2, 3) = (a21 * b02 - a20 * b04 - a23 * b00) * invDet;
    r(3, 0) = (a11 * b07 - a10 * b09 - a12 * b06) * invDet;
    r(3, 1) = (a00 * b09 - a01 * b07 + a02 * b06) * invDet;
    r(3, 2) = (a31 * b01 - a30 * b03 - a32 * b00) * invDet;
    r(3, 3) = (a20 * b03 - a21 * b01 + a22 * b00) * invDet;
    return r;
}

} // namespace skygrid::core
