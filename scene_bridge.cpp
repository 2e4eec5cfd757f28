#include "scene_bridge.hpp"
#include "exporter.hpp"
#include "scene_backend.hpp"

namespace
{
  //-----------------------------------------------------------------------------
  const ImMesh* FirstUser(const ImScene& scene, const ImMeshData* data)
  {
    for (const ImMesh* mesh : scene.meshes)
    {
      if (mesh->meshData == data)
        return mesh;
    }
    return nullptr;
  }

  //-----------------------------------------------------------------------------
  void FlattenIndices(const ImMeshData& data, vector<u32>* indices)
  {
    indices->clear();
    indices->reserve(data.faces.size() * 3);
    for (const ImMeshFace& face : data.faces)
    {
      for (int i = 0; i < 3; ++i)
        indices->push_back((u32)face.vtx[i]);
    }
  }
}

//-----------------------------------------------------------------------------
bool BridgeScene(const ImScene& scene, SceneBackend* backend, ExportInstance* instance)
{
  unordered_map<const ImMeshData*, u32> meshHandles;
  unordered_map<const ImEffect*, u32> effectHandles;
  unordered_map<const ImBaseObject*, u32> nodeHandles;

  vector<u32> indices;
  for (const unique_ptr<ImMeshData>& data : scene.meshPool)
  {
    FlattenIndices(*data, &indices);
    u32 handle = backend->CreateMeshResource(data->name, data->vertices, data->normals, indices);
    if (handle == INVALID_HANDLE)
    {
      const ImMesh* user = FirstUser(scene, data.get());
      return instance->SetError(ExportError::NativeResourceRejected,
          "Mesh '%s' (used by '%s') was rejected: %s",
          data->name.c_str(),
          user ? user->name.c_str() : "<none>",
          backend->LastError().c_str());
    }
    meshHandles[data.get()] = handle;
  }

  for (const unique_ptr<ImEffect>& effect : scene.effectPool)
  {
    u32 handle = backend->CreateEffectResource(effect->name, effect->vertexShader, effect->fragmentShader);
    if (handle == INVALID_HANDLE)
    {
      return instance->SetError(ExportError::NativeResourceRejected,
          "Effect '%s' was rejected: %s",
          effect->name.c_str(),
          backend->LastError().c_str());
    }
    effectHandles[effect.get()] = handle;
  }

  bool res = true;
  scene.Traverse([&](ImBaseObject* obj) {
    if (!res)
      return;

    NodeDesc desc;
    desc.name = obj->name;
    desc.parent = obj->parent ? nodeHandles[obj->parent] : INVALID_HANDLE;

    switch (obj->type)
    {
      case ImBaseObject::Type::Null: desc.kind = NodeKind::Node; break;

      case ImBaseObject::Type::Mesh:
      {
        const ImMesh* mesh = (const ImMesh*)obj;
        desc.kind = NodeKind::Mesh;
        auto itMesh = meshHandles.find(mesh->meshData);
        auto itEffect = effectHandles.find(mesh->effect);
        desc.mesh = itMesh == meshHandles.end() ? INVALID_HANDLE : itMesh->second;
        desc.effect = itEffect == effectHandles.end() ? INVALID_HANDLE : itEffect->second;
        break;
      }

      case ImBaseObject::Type::Camera:
      {
        const ImCamera* camera = (const ImCamera*)obj;
        desc.kind = NodeKind::Camera;
        desc.camera.verticalFov = camera->verticalFov;
        desc.camera.aspectRatio = camera->aspectRatio;
        desc.camera.nearPlane = camera->nearPlane;
        desc.camera.farPlane = camera->farPlane;
        desc.camera.viewportWidth = camera->viewportWidth;
        desc.camera.viewportHeight = camera->viewportHeight;
        break;
      }
    }

    u32 handle = backend->CreateNode(desc);
    if (handle == INVALID_HANDLE)
    {
      res = instance->SetError(ExportError::NativeResourceRejected,
          "Node '%s' was rejected: %s",
          obj->name.c_str(),
          backend->LastError().c_str());
      return;
    }
    nodeHandles[obj] = handle;

    if (!backend->SetTransform(handle, obj->xformLocal.mtx))
    {
      res = instance->SetError(ExportError::NativeResourceRejected,
          "Transform of node '%s' was rejected: %s",
          obj->name.c_str(),
          backend->LastError().c_str());
    }
  });

  if (res)
  {
    instance->Log(2,
        "Bridged %d meshes, %d effects, %d nodes\n",
        (int)meshHandles.size(),
        (int)effectHandles.size(),
        (int)nodeHandles.size());
  }

  return res;
}
