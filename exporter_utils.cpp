#include "exporter_utils.hpp"
#include "im_scene.hpp"

//-----------------------------------------------------------------------------
string ReplaceAll(const string& str, char toReplace, char replaceWith)
{
  string res(str);
  size_t writeOfs = 0;
  for (size_t i = 0; i < res.size(); ++i)
  {
    if (res[i] == toReplace)
    {
      if (replaceWith)
      {
        res[writeOfs] = replaceWith;
        writeOfs++;
      }
    }
    else
    {
      res[writeOfs++] = str[i];
    }
  }

  res.resize(writeOfs);
  return res;
}

//-----------------------------------------------------------------------------
vector<string> SplitString(const string& str, char delim)
{
  vector<string> res;
  size_t start = 0;
  while (start <= str.size())
  {
    size_t end = str.find(delim, start);
    if (end == string::npos)
      end = str.size();

    if (end > start)
      res.push_back(str.substr(start, end - start));
    start = end + 1;
  }
  return res;
}

//-----------------------------------------------------------------------------
bool ReadTextFile(const string& filename, string* out)
{
  FILE* f = fopen(filename.c_str(), "rb");
  if (!f)
    return false;

  string res;
  char buf[4096];
  size_t len;
  while ((len = fread(buf, 1, sizeof(buf), f)) > 0)
    res.append(buf, len);

  bool ok = !ferror(f);
  fclose(f);
  if (ok)
    *out = res;
  return ok;
}

//-----------------------------------------------------------------------------
bool FileExists(const string& filename)
{
  struct stat s;
  return stat(filename.c_str(), &s) == 0;
}

//-----------------------------------------------------------------------------
vec3 MatrixToEulerXYZ(const Matrix& mtx)
{
  vec3 x = Normalize(mtx.v1);
  vec3 y = Normalize(mtx.v2);
  vec3 z = Normalize(mtx.v3);

  // R = Rz * Ry * Rx, so the first column is (cy*cz, cy*sz, -sy)
  float sy = -x.z;
  sy = max(-1.0f, min(1.0f, sy));
  float ry = asinf(sy);

  float rx, rz;
  if (fabsf(sy) < 0.9999f)
  {
    rx = atan2f(y.z, z.z);
    rz = atan2f(x.y, x.x);
  }
  else
  {
    // gimbal lock, fold z into x
    rx = atan2f(-z.y, y.y);
    rz = 0;
  }

  return vec3(rx, ry, rz);
}

//-----------------------------------------------------------------------------
void CopyTransform(const Matrix& mtx, ImTransform* xform)
{
  xform->mtx = mtx;
  xform->pos = mtx.off;
  xform->rot = MatrixToEulerXYZ(mtx);
  xform->scale = vec3(Length(mtx.v1), Length(mtx.v2), Length(mtx.v3));
}

//-----------------------------------------------------------------------------
void CopyMatrix(const Matrix& mtx, float* out)
{
  out[0] = mtx.v1.x;
  out[1] = mtx.v1.y;
  out[2] = mtx.v1.z;
  out[3] = mtx.v2.x;
  out[4] = mtx.v2.y;
  out[5] = mtx.v2.z;
  out[6] = mtx.v3.x;
  out[7] = mtx.v3.y;
  out[8] = mtx.v3.z;
  out[9] = mtx.off.x;
  out[10] = mtx.off.y;
  out[11] = mtx.off.z;
}

//-----------------------------------------------------------------------------
Matrix MatrixFromArray(const float* in)
{
  return Matrix(vec3(in[9], in[10], in[11]), vec3(in[0], in[1], in[2]), vec3(in[3], in[4], in[5]), vec3(in[6], in[7], in[8]));
}
