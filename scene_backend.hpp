#pragma once
#include "exporter_types.hpp"

struct ValidationReport;

static const u32 INVALID_HANDLE = ~0u;

//------------------------------------------------------------------------------
enum class NodeKind : u8
{
  Node = 0,
  Mesh = 1,
  Camera = 2,
};

//------------------------------------------------------------------------------
struct CameraParams
{
  float verticalFov = 0;
  float aspectRatio = 1;
  float nearPlane = 0;
  float farPlane = 0;
  s32 viewportWidth = 0;
  s32 viewportHeight = 0;
};

//------------------------------------------------------------------------------
struct NodeDesc
{
  string name;
  NodeKind kind = NodeKind::Node;
  u32 parent = INVALID_HANDLE;
  // only used by mesh nodes
  u32 mesh = INVALID_HANDLE;
  u32 effect = INVALID_HANDLE;
  // only used by camera nodes
  CameraParams camera;
};

//------------------------------------------------------------------------------
// What the exporter needs from the target framework. Every Create call returns
// INVALID_HANDLE when the framework rejects the input, with the reason in
// LastError().
class SceneBackend
{
public:
  virtual ~SceneBackend() {}

  virtual u32 CreateMeshResource(
      const string& name, const vector<vec3>& positions, const vector<vec3>& normals, const vector<u32>& indices) = 0;
  virtual u32 CreateEffectResource(const string& name, const string& vertexShader, const string& fragmentShader) = 0;
  virtual u32 CreateNode(const NodeDesc& desc) = 0;
  virtual bool SetTransform(u32 node, const Matrix& local) = 0;

  virtual bool Validate(ValidationReport* report) = 0;
  virtual bool Save(const string& path) = 0;

  virtual const string& LastError() const = 0;
};
