#pragma once
#include "host_scene.hpp"

class MemoryHostScene;

//------------------------------------------------------------------------------
// Host object that lives entirely in memory. Used to feed the exporter from
// the fixture scenes and from tests.
class MemoryHostObject : public HostObject
{
public:
  MemoryHostObject(MemoryHostScene* scene, const string& name, HostObjectType type);

  const string& GetName() const override { return name; }
  HostObjectType GetType() const override { return type; }

  const HostObject* GetDown() const override { return children.empty() ? nullptr : children.front(); }
  const HostObject* GetNext() const override { return next; }

  vec3 GetLocation() const override { return location; }
  vec3 GetRotation() const override { return rotation; }
  RotationOrder GetRotationOrder() const override { return rotationOrder; }
  vec3 GetScale() const override { return scale; }
  Matrix GetParentInverse() const override { return parentInverse; }

  const HostMesh* GetMesh() const override { return mesh; }
  const HostCamera* GetCamera() const override { return camera.get(); }

  int GetModifierCount() const override { return (int)modifiers.size(); }
  const HostModifier* GetModifier(int idx) const override;

  bool IsExcludedFrom(int layer) const override;

  MemoryHostObject* SetLocation(const vec3& v);
  MemoryHostObject* SetRotation(const vec3& v, RotationOrder order = RotationOrder::XYZ);
  MemoryHostObject* SetScale(const vec3& v);
  MemoryHostObject* SetParentInverse(const Matrix& m);
  MemoryHostObject* SetMesh(const HostMesh* m);
  MemoryHostObject* SetCamera(const HostCamera& cam);
  MemoryHostObject* AddModifier(const HostModifier& modifier);

  MemoryHostScene* scene;
  string name;
  HostObjectType type;
  MemoryHostObject* next = nullptr;
  vector<MemoryHostObject*> children;

  vec3 location = vec3(0, 0, 0);
  vec3 rotation = vec3(0, 0, 0);
  RotationOrder rotationOrder = RotationOrder::XYZ;
  vec3 scale = vec3(1, 1, 1);
  Matrix parentInverse;

  const HostMesh* mesh = nullptr;
  unique_ptr<HostCamera> camera;
  vector<HostModifier> modifiers;
  vector<int> collections;
};

//------------------------------------------------------------------------------
class MemoryHostScene : public HostScene
{
public:
  explicit MemoryHostScene(const string& name = "Scene");

  const string& GetName() const override { return name; }
  const HostObject* GetFirstObject() const override { return roots.empty() ? nullptr : roots.front(); }
  int GetViewLayerCount() const override { return (int)viewLayers.size(); }
  const HostViewLayer* GetViewLayer(int idx) const override;

  MemoryHostObject* AddObject(const string& name, HostObjectType type, MemoryHostObject* parent = nullptr);
  MemoryHostObject* AddMeshObject(const string& name, const HostMesh* mesh, MemoryHostObject* parent = nullptr);
  MemoryHostObject* FindObject(const string& name);

  HostMesh* AddMesh(const string& name);

  // the scene starts out with one enabled layer, "ViewLayer"
  int AddViewLayer(const string& name, bool use = true);

  // 'excluded' excludes the collection from every layer
  int AddCollection(const string& name, bool excluded = false);
  void ExcludeFromLayer(int collection, int layer);
  void LinkToCollection(MemoryHostObject* obj, int collection);
  bool IsCollectionExcluded(int collection, int layer) const;

  struct Collection
  {
    string name;
    bool excluded;
    vector<int> excludedLayers;
  };

  string name;
  vector<unique_ptr<MemoryHostObject>> objects;
  vector<MemoryHostObject*> roots;
  vector<unique_ptr<HostMesh>> meshes;
  vector<Collection> collections;
  vector<HostViewLayer> viewLayers;
};

//------------------------------------------------------------------------------
// Unit cube with 8 shared vertices and 6 quads, centered at the origin.
void MakeCubeMesh(HostMesh* mesh, float halfSize = 1.0f);
