#include "memory_host_scene.hpp"

//-----------------------------------------------------------------------------
const char* HostObjectTypeName(HostObjectType type)
{
  switch (type)
  {
    case HostObjectType::Mesh: return "MESH";
    case HostObjectType::Empty: return "EMPTY";
    case HostObjectType::Camera: return "CAMERA";
    case HostObjectType::Light: return "LIGHT";
    case HostObjectType::Curve: return "CURVE";
    case HostObjectType::Surface: return "SURFACE";
    case HostObjectType::Text: return "TEXT";
    case HostObjectType::Meta: return "META";
    case HostObjectType::Armature: return "ARMATURE";
    case HostObjectType::Unknown: return "UNKNOWN";
  }
  return "UNKNOWN";
}

//-----------------------------------------------------------------------------
MemoryHostObject::MemoryHostObject(MemoryHostScene* scene, const string& name, HostObjectType type)
  : scene(scene)
  , name(name)
  , type(type)
{
}

//-----------------------------------------------------------------------------
const HostModifier* MemoryHostObject::GetModifier(int idx) const
{
  if (idx < 0 || idx >= (int)modifiers.size())
    return nullptr;
  return &modifiers[idx];
}

//-----------------------------------------------------------------------------
bool MemoryHostObject::IsExcludedFrom(int layer) const
{
  // objects that aren't linked anywhere live in the scene collection
  if (collections.empty())
    return false;

  for (int c : collections)
  {
    if (!scene->IsCollectionExcluded(c, layer))
      return false;
  }
  return true;
}

//-----------------------------------------------------------------------------
MemoryHostObject* MemoryHostObject::SetLocation(const vec3& v)
{
  location = v;
  return this;
}

//-----------------------------------------------------------------------------
MemoryHostObject* MemoryHostObject::SetRotation(const vec3& v, RotationOrder order)
{
  rotation = v;
  rotationOrder = order;
  return this;
}

//-----------------------------------------------------------------------------
MemoryHostObject* MemoryHostObject::SetScale(const vec3& v)
{
  scale = v;
  return this;
}

//-----------------------------------------------------------------------------
MemoryHostObject* MemoryHostObject::SetParentInverse(const Matrix& m)
{
  parentInverse = m;
  return this;
}

//-----------------------------------------------------------------------------
MemoryHostObject* MemoryHostObject::SetMesh(const HostMesh* m)
{
  mesh = m;
  return this;
}

//-----------------------------------------------------------------------------
MemoryHostObject* MemoryHostObject::SetCamera(const HostCamera& cam)
{
  camera = make_unique<HostCamera>(cam);
  return this;
}

//-----------------------------------------------------------------------------
MemoryHostObject* MemoryHostObject::AddModifier(const HostModifier& modifier)
{
  modifiers.push_back(modifier);
  return this;
}

//-----------------------------------------------------------------------------
MemoryHostScene::MemoryHostScene(const string& name) : name(name)
{
  viewLayers.push_back(HostViewLayer{"ViewLayer", true});
}

//-----------------------------------------------------------------------------
const HostViewLayer* MemoryHostScene::GetViewLayer(int idx) const
{
  if (idx < 0 || idx >= (int)viewLayers.size())
    return nullptr;
  return &viewLayers[idx];
}

//-----------------------------------------------------------------------------
int MemoryHostScene::AddViewLayer(const string& layerName, bool use)
{
  viewLayers.push_back(HostViewLayer{layerName, use});
  return (int)viewLayers.size() - 1;
}

//-----------------------------------------------------------------------------
MemoryHostObject* MemoryHostScene::AddObject(const string& objName, HostObjectType type, MemoryHostObject* parent)
{
  objects.push_back(make_unique<MemoryHostObject>(this, objName, type));
  MemoryHostObject* obj = objects.back().get();

  vector<MemoryHostObject*>& siblings = parent ? parent->children : roots;
  if (!siblings.empty())
    siblings.back()->next = obj;
  siblings.push_back(obj);
  return obj;
}

//-----------------------------------------------------------------------------
MemoryHostObject* MemoryHostScene::AddMeshObject(const string& objName, const HostMesh* mesh, MemoryHostObject* parent)
{
  return AddObject(objName, HostObjectType::Mesh, parent)->SetMesh(mesh);
}

//-----------------------------------------------------------------------------
MemoryHostObject* MemoryHostScene::FindObject(const string& objName)
{
  for (const unique_ptr<MemoryHostObject>& obj : objects)
  {
    if (obj->name == objName)
      return obj.get();
  }
  return nullptr;
}

//-----------------------------------------------------------------------------
HostMesh* MemoryHostScene::AddMesh(const string& meshName)
{
  meshes.push_back(make_unique<HostMesh>());
  meshes.back()->name = meshName;
  return meshes.back().get();
}

//-----------------------------------------------------------------------------
int MemoryHostScene::AddCollection(const string& collectionName, bool excluded)
{
  collections.push_back(Collection{collectionName, excluded, {}});
  return (int)collections.size() - 1;
}

//-----------------------------------------------------------------------------
void MemoryHostScene::ExcludeFromLayer(int collection, int layer)
{
  if (collection >= 0 && collection < (int)collections.size())
    collections[collection].excludedLayers.push_back(layer);
}

//-----------------------------------------------------------------------------
void MemoryHostScene::LinkToCollection(MemoryHostObject* obj, int collection)
{
  obj->collections.push_back(collection);
}

//-----------------------------------------------------------------------------
bool MemoryHostScene::IsCollectionExcluded(int collection, int layer) const
{
  if (collection < 0 || collection >= (int)collections.size())
    return false;

  const Collection& c = collections[collection];
  return c.excluded || std::find(c.excludedLayers.begin(), c.excludedLayers.end(), layer) != c.excludedLayers.end();
}

//-----------------------------------------------------------------------------
void MakeCubeMesh(HostMesh* mesh, float h)
{
  mesh->vertices = {
      vec3(-h, -h, -h),
      vec3(+h, -h, -h),
      vec3(+h, +h, -h),
      vec3(-h, +h, -h),
      vec3(-h, -h, +h),
      vec3(+h, -h, +h),
      vec3(+h, +h, +h),
      vec3(-h, +h, +h),
  };

  // counter clockwise when seen from outside
  mesh->polygons = {
      HostPolygon{{0, 3, 2, 1}},
      HostPolygon{{4, 5, 6, 7}},
      HostPolygon{{0, 1, 5, 4}},
      HostPolygon{{2, 3, 7, 6}},
      HostPolygon{{1, 2, 6, 5}},
      HostPolygon{{0, 4, 7, 3}},
  };
}
