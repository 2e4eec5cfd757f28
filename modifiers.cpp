#include "modifiers.hpp"
#include "export_mesh.hpp"
#include "exporter_utils.hpp"
#include "im_scene.hpp"

//-----------------------------------------------------------------------------
static void AppendGeometry(const ImMeshData& src, const Matrix& mtx, bool flipWinding, ImMeshData* dst)
{
  int ofs = (int)dst->vertices.size();
  for (const vec3& v : src.vertices)
    dst->vertices.push_back(mtx * v);

  for (const ImMeshFace& f : src.faces)
  {
    ImMeshFace face;
    face.a = f.a + ofs;
    face.b = (flipWinding ? f.c : f.b) + ofs;
    face.c = (flipWinding ? f.b : f.c) + ofs;
    dst->faces.push_back(face);
  }
}

//-----------------------------------------------------------------------------
bool IsSupportedModifier(const HostModifier& modifier)
{
  switch (modifier.type)
  {
    case HostModifier::Type::Mirror:
    case HostModifier::Type::Array: return true;
    case HostModifier::Type::Other: return false;
  }
  return false;
}

//-----------------------------------------------------------------------------
void ApplyMirror(const HostModifier& modifier, ImMeshData* data)
{
  static const vec3 reflections[] = {vec3(-1, 1, 1), vec3(1, -1, 1), vec3(1, 1, -1)};

  for (int axis = 0; axis < 3; ++axis)
  {
    if (!modifier.mirrorAxis[axis])
      continue;

    ImMeshData current;
    current.vertices = data->vertices;
    current.faces = data->faces;
    AppendGeometry(current, MatrixScale(reflections[axis]), true, data);
  }
}

//-----------------------------------------------------------------------------
void ApplyArray(const HostModifier& modifier, ImMeshData* data)
{
  int count = max(1, modifier.count);

  ImAABB aabb;
  for (const vec3& v : data->vertices)
    aabb = aabb.Extend(v);

  vec3 step(0, 0, 0);
  if (modifier.useRelativeOffset)
    step += Mul(modifier.relativeOffset, aabb.Size());
  if (modifier.useConstantOffset)
    step += modifier.constantOffset;

  ImMeshData base;
  base.vertices.swap(data->vertices);
  base.faces.swap(data->faces);

  for (int i = 0; i < count; ++i)
    AppendGeometry(base, MatrixTranslate(step * (float)i), false, data);
}

//-----------------------------------------------------------------------------
string ModifierStackKey(u32 baseMeshId, const vector<HostModifier>& stack)
{
  char buf[256];
  snprintf(buf, sizeof(buf), "mesh:%u", baseMeshId);
  string res = buf;

  for (const HostModifier& m : stack)
  {
    switch (m.type)
    {
      case HostModifier::Type::Mirror:
        snprintf(buf, sizeof(buf), "|mirror:%d%d%d", m.mirrorAxis[0], m.mirrorAxis[1], m.mirrorAxis[2]);
        break;

      case HostModifier::Type::Array:
      {
        vec3 rel = m.useRelativeOffset ? m.relativeOffset : vec3(0, 0, 0);
        vec3 cst = m.useConstantOffset ? m.constantOffset : vec3(0, 0, 0);
        snprintf(buf,
            sizeof(buf),
            "|array:%d:%.9g,%.9g,%.9g:%.9g,%.9g,%.9g",
            max(1, m.count),
            rel.x,
            rel.y,
            rel.z,
            cst.x,
            cst.y,
            cst.z);
        break;
      }

      case HostModifier::Type::Other: buf[0] = 0; break;
    }
    res += buf;
  }

  return res;
}

//-----------------------------------------------------------------------------
void ApplyModifierStack(const ImMeshData& base, const vector<HostModifier>& stack, ImMeshData* out)
{
  out->source = base.source;
  out->vertices = base.vertices;
  out->faces = base.faces;

  for (const HostModifier& m : stack)
  {
    switch (m.type)
    {
      case HostModifier::Type::Mirror: ApplyMirror(m, out); break;
      case HostModifier::Type::Array: ApplyArray(m, out); break;
      case HostModifier::Type::Other: break;
    }
  }

  CalcVertexNormals(out);
  CalcBoundingVolumes(out);
}
