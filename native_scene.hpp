#pragma once
#include "scene_backend.hpp"
#include "scene_file.hpp"

//------------------------------------------------------------------------------
struct NativeNode
{
  string name;
  NodeKind kind = NodeKind::Node;
  u32 parent = INVALID_HANDLE;
  u32 mesh = INVALID_HANDLE;
  u32 effect = INVALID_HANDLE;
  Matrix transform;
  CameraParams camera;
};

//------------------------------------------------------------------------------
struct NativeMesh
{
  string name;
  vector<vec3> positions;
  vector<vec3> normals;
  vector<u32> indices;
};

//------------------------------------------------------------------------------
struct NativeEffect
{
  string name;
  string vertexShader;
  string fragmentShader;
};

//------------------------------------------------------------------------------
// The scene as the target framework stores it: flat arrays, parents and
// resources referenced by index.
struct NativeSceneData
{
  string name;
  vector<NativeNode> nodes;
  vector<NativeMesh> meshes;
  vector<NativeEffect> effects;
};

// parent world * local, walking up at most nodes.size() levels
Matrix WorldTransform(const NativeSceneData& data, u32 node);

//------------------------------------------------------------------------------
class NativeScene : public SceneBackend
{
public:
  explicit NativeScene(const string& name = "scene");

  u32 CreateMeshResource(const string& name,
      const vector<vec3>& positions,
      const vector<vec3>& normals,
      const vector<u32>& indices) override;
  u32 CreateEffectResource(const string& name, const string& vertexShader, const string& fragmentShader) override;
  u32 CreateNode(const NodeDesc& desc) override;
  bool SetTransform(u32 node, const Matrix& local) override;

  bool Validate(ValidationReport* report) override;
  bool Save(const string& path) override;

  const string& LastError() const override { return _lastError; }

  void SetCompressIndices(bool value) { _compressIndices = value; }
  const SceneFileStats& LastSaveStats() const { return _saveStats; }

  const NativeSceneData& Data() const { return _data; }
  NativeSceneData* MutableData() { return &_data; }

private:
  u32 Reject(const char* fmt, ...);

  NativeSceneData _data;
  string _lastError;
  bool _compressIndices = true;
  SceneFileStats _saveStats;
};
