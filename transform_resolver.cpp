#include "transform_resolver.hpp"
#include "exporter.hpp"
#include "exporter_utils.hpp"
#include "modifiers.hpp"

//-----------------------------------------------------------------------------
Matrix ComposeLocalMatrix(const HostObject* obj)
{
  Matrix t = MatrixTranslate(obj->GetLocation());
  Matrix r = MatrixFromEuler(obj->GetRotation(), obj->GetRotationOrder());
  Matrix s = MatrixScale(obj->GetScale());
  return obj->GetParentInverse() * t * r * s;
}

//-----------------------------------------------------------------------------
bool ResolveTransforms(ExportInstance* instance)
{
  ImScene* scene = instance->scene;

  scene->Traverse([&](ImBaseObject* obj) {
    Matrix local = obj->hostObj ? obj->carry * ComposeLocalMatrix(obj->hostObj) : obj->carry;
    Matrix global = obj->parent ? obj->parent->xformGlobal.mtx * local : local;

    // left for validation to reject
    if (!IsFinite(local) || !IsFinite(global))
      instance->Log(1, "Object '%s' has a non-finite transform\n", obj->name.c_str());

    CopyTransform(local, &obj->xformLocal);
    CopyTransform(global, &obj->xformGlobal);
  });

  return true;
}

//-----------------------------------------------------------------------------
bool ResolveModifiers(ExportInstance* instance)
{
  ImScene* scene = instance->scene;

  for (ImMesh* mesh : scene->meshes)
  {
    if (!mesh->hostObj || !mesh->meshData)
      continue;

    mesh->modifiers.clear();
    const HostObject* obj = mesh->hostObj;
    for (int i = 0; i < obj->GetModifierCount(); ++i)
    {
      const HostModifier* m = obj->GetModifier(i);
      if (!m || !m->enabled)
        continue;

      if (!IsSupportedModifier(*m))
      {
        instance->Warn("Unsupported modifier '%s' on '%s' is not applied", m->name.c_str(), mesh->name.c_str());
        continue;
      }
      mesh->modifiers.push_back(*m);
    }

    if (mesh->modifiers.empty())
      continue;

    // never touch the shared base entry, other nodes may still point at it
    const ImMeshData* base = mesh->meshData;
    string key = ModifierStackKey(base->id, mesh->modifiers);

    ImMeshData* data = scene->FindMeshData(key);
    if (!data)
    {
      unique_ptr<ImMeshData> modified = make_unique<ImMeshData>();
      modified->name = base->name + "." + mesh->name;
      modified->key = key;
      ApplyModifierStack(*base, mesh->modifiers, modified.get());
      data = scene->AddMeshData(std::move(modified));
      instance->Log(2,
          "Regenerated mesh '%s' (%d verts, %d faces)\n",
          data->name.c_str(),
          (int)data->vertices.size(),
          (int)data->faces.size());
    }
    mesh->meshData = data;
  }

  int pruned = scene->PruneMeshPool();
  if (pruned > 0)
    instance->Log(2, "Pruned %d unreferenced mesh entries\n", pruned);

  pruned = scene->PruneEffectPool();
  if (pruned > 0)
    instance->Log(2, "Pruned %d unreferenced effects\n", pruned);

  return true;
}
