#include "im_scene.hpp"

//-----------------------------------------------------------------------------
ImBaseObject::ImBaseObject(Type type, const HostObject* hostObj, ImBaseObject* parent)
  : type(type)
  , hostObj(hostObj)
  , parent(parent)
  , name(hostObj ? hostObj->GetName() : string())
{
}

//-----------------------------------------------------------------------------
ImBaseObject* ImScene::FindObject(const string& objName) const
{
  for (const unique_ptr<ImBaseObject>& obj : objects)
  {
    if (obj->name == objName)
      return obj.get();
  }
  return nullptr;
}

//-----------------------------------------------------------------------------
ImMeshData* ImScene::FindMeshData(const HostMesh* mesh) const
{
  auto it = hostToMeshData.find(mesh);
  return it == hostToMeshData.end() ? nullptr : it->second;
}

//-----------------------------------------------------------------------------
ImMeshData* ImScene::FindMeshData(const string& key) const
{
  for (const unique_ptr<ImMeshData>& data : meshPool)
  {
    if (!data->key.empty() && data->key == key)
      return data.get();
  }
  return nullptr;
}

//-----------------------------------------------------------------------------
ImEffect* ImScene::FindEffect(const string& vertexShader, const string& fragmentShader) const
{
  for (const unique_ptr<ImEffect>& effect : effectPool)
  {
    if (effect->vertexShader == vertexShader && effect->fragmentShader == fragmentShader)
      return effect.get();
  }
  return nullptr;
}

//-----------------------------------------------------------------------------
ImMeshData* ImScene::AddMeshData(unique_ptr<ImMeshData> data)
{
  data->id = (u32)meshPool.size();
  if (data->source && data->key.empty())
    hostToMeshData[data->source] = data.get();
  meshPool.push_back(std::move(data));
  return meshPool.back().get();
}

//-----------------------------------------------------------------------------
ImEffect* ImScene::AddEffect(unique_ptr<ImEffect> effect)
{
  effect->id = (u32)effectPool.size();
  effectPool.push_back(std::move(effect));
  return effectPool.back().get();
}

//-----------------------------------------------------------------------------
int ImScene::PruneMeshPool()
{
  unordered_set<const ImMeshData*> used;
  for (ImMesh* mesh : meshes)
    used.insert(mesh->meshData);

  size_t before = meshPool.size();
  meshPool.erase(remove_if(meshPool.begin(),
                     meshPool.end(),
                     [&](const unique_ptr<ImMeshData>& data) { return used.count(data.get()) == 0; }),
      meshPool.end());

  for (auto it = hostToMeshData.begin(); it != hostToMeshData.end();)
  {
    if (used.count(it->second) == 0)
      it = hostToMeshData.erase(it);
    else
      ++it;
  }

  for (size_t i = 0; i < meshPool.size(); ++i)
    meshPool[i]->id = (u32)i;

  return (int)(before - meshPool.size());
}

//-----------------------------------------------------------------------------
int ImScene::PruneEffectPool()
{
  unordered_set<const ImEffect*> used;
  for (ImMesh* mesh : meshes)
    used.insert(mesh->effect);

  size_t before = effectPool.size();
  effectPool.erase(remove_if(effectPool.begin(),
                       effectPool.end(),
                       [&](const unique_ptr<ImEffect>& effect) { return used.count(effect.get()) == 0; }),
      effectPool.end());

  for (size_t i = 0; i < effectPool.size(); ++i)
    effectPool[i]->id = (u32)i;

  return (int)(before - effectPool.size());
}

//-----------------------------------------------------------------------------
void ImScene::Traverse(const function<void(ImBaseObject*)>& fn) const
{
  function<void(ImBaseObject*)> visit = [&](ImBaseObject* obj) {
    fn(obj);
    for (ImBaseObject* child : obj->children)
      visit(child);
  };

  for (ImBaseObject* root : roots)
    visit(root);
}

//-----------------------------------------------------------------------------
string ImScene::DescribeScene() const
{
  string res = "scene: " + name + "\n";

  function<void(const ImBaseObject*, int)> describe = [&](const ImBaseObject* obj, int depth) {
    res += string(depth * 2 + 2, ' ');
    switch (obj->type)
    {
      case ImBaseObject::Type::Null: res += "[null] "; break;
      case ImBaseObject::Type::Mesh: res += "[mesh] "; break;
      case ImBaseObject::Type::Camera: res += "[camera] "; break;
    }
    res += obj->name;

    if (obj->type == ImBaseObject::Type::Mesh)
    {
      const ImMesh* mesh = (const ImMesh*)obj;
      if (mesh->meshData)
      {
        char buf[128];
        snprintf(buf,
            sizeof(buf),
            " (%s: %d verts, %d faces)",
            mesh->meshData->name.c_str(),
            (int)mesh->meshData->vertices.size(),
            (int)mesh->meshData->faces.size());
        res += buf;
      }
    }
    res += "\n";

    for (const ImBaseObject* child : obj->children)
      describe(child, depth + 1);
  };

  for (const ImBaseObject* root : roots)
    describe(root, 0);

  return res;
}
