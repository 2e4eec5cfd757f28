#include "native_scene.hpp"
#include "scene_validator.hpp"

//-----------------------------------------------------------------------------
Matrix WorldTransform(const NativeSceneData& data, u32 node)
{
  Matrix res;
  size_t depth = 0;
  while (node != INVALID_HANDLE && node < data.nodes.size() && depth++ <= data.nodes.size())
  {
    res = data.nodes[node].transform * res;
    node = data.nodes[node].parent;
  }
  return res;
}

//-----------------------------------------------------------------------------
NativeScene::NativeScene(const string& name)
{
  _data.name = name;
}

//-----------------------------------------------------------------------------
u32 NativeScene::Reject(const char* fmt, ...)
{
  char buf[512];
  va_list arg;
  va_start(arg, fmt);
  vsnprintf(buf, sizeof(buf), fmt, arg);
  va_end(arg);

  _lastError = buf;
  return INVALID_HANDLE;
}

//-----------------------------------------------------------------------------
u32 NativeScene::CreateMeshResource(
    const string& name, const vector<vec3>& positions, const vector<vec3>& normals, const vector<u32>& indices)
{
  if (!normals.empty() && normals.size() != positions.size())
  {
    return Reject("mesh '%s': %d normals for %d positions",
        name.c_str(),
        (int)normals.size(),
        (int)positions.size());
  }

  if (indices.size() % 3 != 0)
    return Reject("mesh '%s': index count %d is not a multiple of 3", name.c_str(), (int)indices.size());

  for (size_t i = 0; i < indices.size(); ++i)
  {
    if (indices[i] >= positions.size())
    {
      return Reject("mesh '%s': index %u at %d is out of range (%d vertices)",
          name.c_str(),
          indices[i],
          (int)i,
          (int)positions.size());
    }
  }

  for (size_t i = 0; i < positions.size(); ++i)
  {
    if (!IsFinite(positions[i]))
      return Reject("mesh '%s': vertex %d is not finite", name.c_str(), (int)i);
  }

  NativeMesh mesh;
  mesh.name = name;
  mesh.positions = positions;
  mesh.normals = normals;
  mesh.indices = indices;
  _data.meshes.push_back(std::move(mesh));
  return (u32)_data.meshes.size() - 1;
}

//-----------------------------------------------------------------------------
u32 NativeScene::CreateEffectResource(const string& name, const string& vertexShader, const string& fragmentShader)
{
  if (vertexShader.empty() || fragmentShader.empty())
    return Reject("effect '%s': missing shader source", name.c_str());

  _data.effects.push_back(NativeEffect{name, vertexShader, fragmentShader});
  return (u32)_data.effects.size() - 1;
}

//-----------------------------------------------------------------------------
u32 NativeScene::CreateNode(const NodeDesc& desc)
{
  if (desc.parent != INVALID_HANDLE && desc.parent >= _data.nodes.size())
    return Reject("node '%s': unknown parent %u", desc.name.c_str(), desc.parent);

  NativeNode node;
  node.name = desc.name;
  node.kind = desc.kind;
  node.parent = desc.parent;

  switch (desc.kind)
  {
    case NodeKind::Mesh:
      if (desc.mesh >= _data.meshes.size())
        return Reject("node '%s': unknown mesh %u", desc.name.c_str(), desc.mesh);
      if (desc.effect >= _data.effects.size())
        return Reject("node '%s': unknown effect %u", desc.name.c_str(), desc.effect);
      node.mesh = desc.mesh;
      node.effect = desc.effect;
      break;

    case NodeKind::Camera:
      if (!(desc.camera.verticalFov > 0) || !(desc.camera.nearPlane > 0) || !(desc.camera.farPlane > desc.camera.nearPlane))
        return Reject("node '%s': invalid camera frustum", desc.name.c_str());
      node.camera = desc.camera;
      break;

    case NodeKind::Node: break;
  }

  _data.nodes.push_back(std::move(node));
  return (u32)_data.nodes.size() - 1;
}

//-----------------------------------------------------------------------------
bool NativeScene::SetTransform(u32 node, const Matrix& local)
{
  if (node >= _data.nodes.size())
  {
    Reject("unknown node %u", node);
    return false;
  }

  _data.nodes[node].transform = local;
  return true;
}

//-----------------------------------------------------------------------------
bool NativeScene::Validate(ValidationReport* report)
{
  return ValidateScene(_data, report);
}

//-----------------------------------------------------------------------------
bool NativeScene::Save(const string& path)
{
  _saveStats = SceneFileStats();
  return SaveSceneFile(_data, path, _compressIndices, &_saveStats, &_lastError);
}
