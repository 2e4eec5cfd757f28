#pragma once
#include "exporter_types.hpp"

struct ImTransform;

//-----------------------------------------------------------------------------
void CopyTransform(const Matrix& mtx, ImTransform* xform);
void CopyMatrix(const Matrix& mtx, float* out);
Matrix MatrixFromArray(const float* in);

// decomposes the rotation part of 'mtx' into XYZ euler angles (radians)
vec3 MatrixToEulerXYZ(const Matrix& mtx);

string ReplaceAll(const string& str, char toReplace, char replaceWith);
bool ReadTextFile(const string& filename, string* out);
bool FileExists(const string& filename);
vector<string> SplitString(const string& str, char delim);

//-----------------------------------------------------------------------------
// FNV-1a
inline u32 FnvHash(const void* data, size_t len, u32 d = 0x811c9dc5)
{
  const u8* ptr = (const u8*)data;
  for (size_t i = 0; i < len; ++i)
  {
    d ^= ptr[i];
    d *= 0x01000193;
  }
  return d;
}
