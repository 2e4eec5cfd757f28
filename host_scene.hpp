#pragma once
#include "exporter_types.hpp"

// Read-only view of the modeling application's scene. The exporter never
// mutates anything reachable from here.

//------------------------------------------------------------------------------
enum class HostObjectType
{
  Mesh,
  Empty,
  Camera,
  Light,
  Curve,
  Surface,
  Text,
  Meta,
  Armature,
  Unknown,
};

const char* HostObjectTypeName(HostObjectType type);

//------------------------------------------------------------------------------
struct HostPolygon
{
  vector<int> indices;
};

//------------------------------------------------------------------------------
struct HostMesh
{
  string name;
  vector<vec3> vertices;
  vector<HostPolygon> polygons;
};

//------------------------------------------------------------------------------
struct HostModifier
{
  enum class Type
  {
    Mirror,
    Array,
    Other,
  };

  string name;
  Type type = Type::Other;
  // false if the modifier is not applied at export time
  bool enabled = true;

  // mirror
  bool mirrorAxis[3] = {true, false, false};

  // array
  int count = 2;
  bool useRelativeOffset = true;
  vec3 relativeOffset = vec3(1, 0, 0);
  bool useConstantOffset = false;
  vec3 constantOffset = vec3(0, 0, 0);
};

//------------------------------------------------------------------------------
struct HostCamera
{
  enum class Projection
  {
    Perspective,
    Orthographic,
    Panoramic,
  };

  enum class SensorFit
  {
    Auto,
    Horizontal,
    Vertical,
  };

  Projection projection = Projection::Perspective;
  SensorFit sensorFit = SensorFit::Auto;
  // field of view along the fitted sensor axis, radians
  float fov = 0.6911f;
  float verticalFov = 0.4711f;
  float nearPlane = 0.1f;
  float farPlane = 100.0f;
  int resolutionX = 1920;
  int resolutionY = 1080;
  float pixelAspectX = 1.0f;
  float pixelAspectY = 1.0f;
};

//------------------------------------------------------------------------------
class HostObject
{
public:
  virtual ~HostObject() {}

  virtual const string& GetName() const = 0;
  virtual HostObjectType GetType() const = 0;

  // hierarchy
  virtual const HostObject* GetDown() const = 0;
  virtual const HostObject* GetNext() const = 0;

  // transform relative to the parent, before parenting is applied
  virtual vec3 GetLocation() const = 0;
  virtual vec3 GetRotation() const = 0;
  virtual RotationOrder GetRotationOrder() const = 0;
  virtual vec3 GetScale() const = 0;
  // inverse of the parent's world matrix at the time of parenting
  virtual Matrix GetParentInverse() const = 0;

  // nullptr when the object has no data of that kind
  virtual const HostMesh* GetMesh() const = 0;
  virtual const HostCamera* GetCamera() const = 0;

  virtual int GetModifierCount() const = 0;
  virtual const HostModifier* GetModifier(int idx) const = 0;

  // true when every collection the object is linked to is excluded in 'layer'
  virtual bool IsExcludedFrom(int layer) const = 0;
};

//------------------------------------------------------------------------------
struct HostViewLayer
{
  string name;
  // disabled layers don't contribute any objects
  bool use = true;
};

//------------------------------------------------------------------------------
class HostScene
{
public:
  virtual ~HostScene() {}

  virtual const string& GetName() const = 0;
  virtual const HostObject* GetFirstObject() const = 0;

  // a scene without layers behaves as a single enabled layer 0
  virtual int GetViewLayerCount() const = 0;
  virtual const HostViewLayer* GetViewLayer(int idx) const = 0;
};
