#pragma once
#include "precompiled.hpp"

//------------------------------------------------------------------------------
struct vec3
{
  vec3(float x, float y, float z) : x(x), y(y), z(z) {}
  vec3() : x(0), y(0), z(0) {}

  vec3& operator+=(const vec3& rhs)
  {
    x += rhs.x;
    y += rhs.y;
    z += rhs.z;
    return *this;
  }

  vec3& operator/=(float s)
  {
    float r = 1.0f / s;
    x *= r;
    y *= r;
    z *= r;
    return *this;
  }

  float x, y, z;
};

inline bool operator==(const vec3& a, const vec3& b)
{
  return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline bool operator!=(const vec3& a, const vec3& b)
{
  return !(a == b);
}

inline float Length(const vec3& v)
{
  return sqrtf(v.x*v.x + v.y*v.y + v.z*v.z);
}

inline float LengthSq(const vec3& v)
{
  return v.x*v.x + v.y*v.y + v.z*v.z;
}

inline vec3 operator-(const vec3& a, const vec3& b)
{
  return vec3{ a.x - b.x, a.y - b.y, a.z - b.z };
}

inline vec3 operator+(const vec3& a, const vec3& b)
{
  return vec3{ a.x + b.x, a.y + b.y, a.z + b.z };
}

inline vec3 operator-(const vec3& v)
{
  return vec3{ -v.x, -v.y, -v.z };
}

inline vec3 operator/(const vec3& a, float s)
{
  float r = 1.0f / s;
  return vec3{ a.x * r, a.y * r, a.z * r };
}

inline vec3 operator*(float s, const vec3& v)
{
  return vec3{ s * v.x, s * v.y, s * v.z };
}

inline vec3 operator*(const vec3& v, float s)
{
  return vec3{ s * v.x, s * v.y, s * v.z };
}

// component-wise
inline vec3 Mul(const vec3& a, const vec3& b)
{
  return vec3{ a.x * b.x, a.y * b.y, a.z * b.z };
}

inline vec3 Normalize(const vec3& v)
{
  float len = Length(v);
  if (len == 0)
    return vec3{ 0,0,0 };

  float r = 1 / len;
  return vec3{v.x * r, v.y * r, v.z * r};
}

inline float Dot(const vec3& a, const vec3& b)
{
  return a.x * b.x + a.y * b.y + a.z * b.z;
}

inline vec3 Cross(const vec3& a, const vec3& b)
{
  return vec3(
    (a.y * b.z) - (a.z * b.y),
    (a.z * b.x) - (a.x * b.z),
    (a.x * b.y) - (a.y * b.x));
}

inline vec3 Min(const vec3& lhs, const vec3& rhs)
{
  return vec3{min(lhs.x, rhs.x), min(lhs.y, rhs.y), min(lhs.z, rhs.z)};
}

inline vec3 Max(const vec3& lhs, const vec3& rhs)
{
  return vec3{ max(lhs.x, rhs.x), max(lhs.y, rhs.y), max(lhs.z, rhs.z) };
}

inline bool IsFinite(const vec3& v)
{
  return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

//------------------------------------------------------------------------------
// Euler rotation orders. "XYZ" rotates around X first, then Y, then Z.
enum class RotationOrder
{
  XYZ,
  XZY,
  YXZ,
  YZX,
  ZXY,
  ZYX,
};

//------------------------------------------------------------------------------
// Affine transform. v1, v2, v3 are the images of the x, y and z axes, off is
// the translation. Points transform as off + v1 * x + v2 * y + v3 * z.
struct Matrix
{
  Matrix() : off(0, 0, 0), v1(1, 0, 0), v2(0, 1, 0), v3(0, 0, 1) {}
  Matrix(const vec3& off, const vec3& v1, const vec3& v2, const vec3& v3) : off(off), v1(v1), v2(v2), v3(v3) {}

  vec3 off;
  vec3 v1, v2, v3;
};

inline bool operator==(const Matrix& a, const Matrix& b)
{
  return a.off == b.off && a.v1 == b.v1 && a.v2 == b.v2 && a.v3 == b.v3;
}

inline vec3 TransformVector(const Matrix& m, const vec3& v)
{
  return m.v1 * v.x + m.v2 * v.y + m.v3 * v.z;
}

inline vec3 operator*(const Matrix& m, const vec3& v)
{
  return m.off + TransformVector(m, v);
}

inline Matrix operator*(const Matrix& a, const Matrix& b)
{
  return Matrix(a * b.off, TransformVector(a, b.v1), TransformVector(a, b.v2), TransformVector(a, b.v3));
}

inline bool IsFinite(const Matrix& m)
{
  return IsFinite(m.off) && IsFinite(m.v1) && IsFinite(m.v2) && IsFinite(m.v3);
}

inline Matrix MatrixTranslate(const vec3& t)
{
  return Matrix(t, vec3(1, 0, 0), vec3(0, 1, 0), vec3(0, 0, 1));
}

inline Matrix MatrixScale(const vec3& s)
{
  return Matrix(vec3(0, 0, 0), vec3(s.x, 0, 0), vec3(0, s.y, 0), vec3(0, 0, s.z));
}

inline Matrix MatrixRotX(float angle)
{
  float c = cosf(angle), s = sinf(angle);
  return Matrix(vec3(0, 0, 0), vec3(1, 0, 0), vec3(0, c, s), vec3(0, -s, c));
}

inline Matrix MatrixRotY(float angle)
{
  float c = cosf(angle), s = sinf(angle);
  return Matrix(vec3(0, 0, 0), vec3(c, 0, -s), vec3(0, 1, 0), vec3(s, 0, c));
}

inline Matrix MatrixRotZ(float angle)
{
  float c = cosf(angle), s = sinf(angle);
  return Matrix(vec3(0, 0, 0), vec3(c, s, 0), vec3(-s, c, 0), vec3(0, 0, 1));
}

//------------------------------------------------------------------------------
inline Matrix MatrixFromEuler(const vec3& rot, RotationOrder order)
{
  const Matrix x = MatrixRotX(rot.x);
  const Matrix y = MatrixRotY(rot.y);
  const Matrix z = MatrixRotZ(rot.z);

  // the first axis in the order is applied first, so it sits rightmost
  switch (order)
  {
    case RotationOrder::XYZ: return z * y * x;
    case RotationOrder::XZY: return y * z * x;
    case RotationOrder::YXZ: return z * x * y;
    case RotationOrder::YZX: return x * z * y;
    case RotationOrder::ZXY: return y * x * z;
    case RotationOrder::ZYX: return x * y * z;
  }

  return z * y * x;
}

//------------------------------------------------------------------------------
inline bool Invert(const Matrix& m, Matrix* out)
{
  vec3 r1 = Cross(m.v2, m.v3);
  vec3 r2 = Cross(m.v3, m.v1);
  vec3 r3 = Cross(m.v1, m.v2);
  float det = Dot(m.v1, r1);
  if (det == 0 || !std::isfinite(det))
    return false;

  r1 /= det;
  r2 /= det;
  r3 /= det;

  Matrix res;
  res.v1 = vec3(r1.x, r2.x, r3.x);
  res.v2 = vec3(r1.y, r2.y, r3.y);
  res.v3 = vec3(r1.z, r2.z, r3.z);
  res.off = -TransformVector(res, m.off);
  *out = res;
  return true;
}

//------------------------------------------------------------------------------
inline float DegToRad(float deg)
{
  return deg * 3.14159265358979323846f / 180.0f;
}
