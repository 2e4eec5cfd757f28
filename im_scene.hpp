#pragma once
#include "exporter_types.hpp"
#include "host_scene.hpp"

//------------------------------------------------------------------------------
struct ImSphere
{
  vec3 center;
  float radius = 0;
};

//------------------------------------------------------------------------------
struct ImAABB
{
  ImAABB(const vec3& minValue, const vec3& maxValue) : minValue(minValue), maxValue(maxValue)
  {
  }
  ImAABB() : minValue{+FLT_MAX, +FLT_MAX, +FLT_MAX}, maxValue{-FLT_MAX, -FLT_MAX, -FLT_MAX}
  {
  }

  ImAABB Extend(const vec3& v) const
  {
    return ImAABB(Min(minValue, v), Max(maxValue, v));
  }

  bool IsEmpty() const
  {
    return minValue.x > maxValue.x;
  }

  vec3 Size() const
  {
    return IsEmpty() ? vec3(0, 0, 0) : maxValue - minValue;
  }

  vec3 minValue;
  vec3 maxValue;
};

//------------------------------------------------------------------------------
struct ImMeshFace
{
  union
  {
    struct
    {
      int a, b, c;
    };
    int vtx[3];
  };
};

//------------------------------------------------------------------------------
struct ImTransform
{
  Matrix mtx;
  vec3 pos;
  vec3 rot;
  vec3 scale;
};

//------------------------------------------------------------------------------
// Entry in the mesh pool. Shared between every ImMesh that references the same
// host mesh with the same effective modifier stack.
struct ImMeshData
{
  string name;
  u32 id = ~0u;
  const HostMesh* source = nullptr;
  // host mesh id + serialized modifier stack. empty for unmodified meshes.
  string key;

  vector<vec3> vertices;
  vector<vec3> normals;
  vector<ImMeshFace> faces;

  ImSphere boundingSphere;
  ImAABB aabb;
};

//------------------------------------------------------------------------------
struct ImEffect
{
  string name;
  u32 id = ~0u;
  string vertexShader;
  string fragmentShader;
};

//------------------------------------------------------------------------------
struct ImBaseObject
{
  enum class Type
  {
    Null,
    Mesh,
    Camera,
  };

  ImBaseObject(Type type, const HostObject* hostObj, ImBaseObject* parent);
  virtual ~ImBaseObject() {}

  Type type;
  const HostObject* hostObj = nullptr;
  ImBaseObject* parent = nullptr;

  // product of the local matrices of skipped ancestors between this object
  // and its exported parent
  Matrix carry;
  ImTransform xformLocal;
  ImTransform xformGlobal;
  string name;
  u32 id = ~0u;

  vector<ImBaseObject*> children;
};

//------------------------------------------------------------------------------
struct ImNullObject : public ImBaseObject
{
  ImNullObject(const HostObject* hostObj, ImBaseObject* parent) : ImBaseObject(Type::Null, hostObj, parent) {}
};

//------------------------------------------------------------------------------
struct ImCamera : public ImBaseObject
{
  ImCamera(const HostObject* hostObj, ImBaseObject* parent) : ImBaseObject(Type::Camera, hostObj, parent) {}

  float verticalFov = 0;
  float aspectRatio = 1;
  float nearPlane = 0, farPlane = 0;
  int viewportWidth = 0, viewportHeight = 0;
};

//------------------------------------------------------------------------------
struct ImMesh : public ImBaseObject
{
  ImMesh(const HostObject* hostObj, ImBaseObject* parent) : ImBaseObject(Type::Mesh, hostObj, parent) {}

  ImMeshData* meshData = nullptr;
  ImEffect* effect = nullptr;
  // modifiers that are enabled at export time, in authoring order
  vector<HostModifier> modifiers;
};

//------------------------------------------------------------------------------
struct ImScene
{
  ImBaseObject* FindObject(const string& name) const;
  ImMeshData* FindMeshData(const HostMesh* mesh) const;
  ImMeshData* FindMeshData(const string& key) const;
  ImEffect* FindEffect(const string& vertexShader, const string& fragmentShader) const;

  template <typename T>
  T* AddObject(unique_ptr<T> obj);
  ImMeshData* AddMeshData(unique_ptr<ImMeshData> data);
  ImEffect* AddEffect(unique_ptr<ImEffect> effect);

  // drops pool entries nothing points at, and renumbers the survivors
  int PruneMeshPool();
  int PruneEffectPool();

  // visits every object depth first, parents before children
  void Traverse(const function<void(ImBaseObject*)>& fn) const;
  int NodeCount() const { return (int)objects.size(); }
  string DescribeScene() const;

  string name;

  // owning storage, in traversal order
  vector<unique_ptr<ImBaseObject>> objects;
  vector<unique_ptr<ImMeshData>> meshPool;
  vector<unique_ptr<ImEffect>> effectPool;

  vector<ImBaseObject*> roots;
  vector<ImMesh*> meshes;
  vector<ImCamera*> cameras;
  vector<ImNullObject*> nullObjects;

  unordered_map<const HostMesh*, ImMeshData*> hostToMeshData;

  u32 nextObjectId = 1;
};

//------------------------------------------------------------------------------
template <typename T>
T* ImScene::AddObject(unique_ptr<T> obj)
{
  T* res = obj.get();
  res->id = nextObjectId++;

  if (res->parent)
    res->parent->children.push_back(res);
  else
    roots.push_back(res);

  switch (res->type)
  {
    case ImBaseObject::Type::Null: nullObjects.push_back((ImNullObject*)res); break;
    case ImBaseObject::Type::Mesh: meshes.push_back((ImMesh*)res); break;
    case ImBaseObject::Type::Camera: cameras.push_back((ImCamera*)res); break;
  }

  objects.push_back(std::move(obj));
  return res;
}
