#include "export_camera.hpp"
#include "exporter.hpp"

static const float DEFAULT_NEAR_PLANE = 0.1f;
static const float DEFAULT_FAR_PLANE = 100.0f;

//-----------------------------------------------------------------------------
float CalcVerticalFov(const HostCamera& camera, float width, float height)
{
  float aspect = width / height;

  // the camera's fov covers the fitted axis. when that is the horizontal one,
  // derive the vertical fov from the aspect ratio
  bool horizontalFit = width >= height ? camera.sensorFit != HostCamera::SensorFit::Vertical
                                       : camera.sensorFit == HostCamera::SensorFit::Horizontal;
  if (horizontalFit)
    return 2.0f * atanf(tanf(camera.fov * 0.5f) / aspect);

  return camera.verticalFov;
}

//-----------------------------------------------------------------------------
ImCamera* ExportCamera(const HostObject* obj, ImBaseObject* parent, const Matrix& carry, ExportInstance* instance)
{
  const HostCamera* hostCamera = obj->GetCamera();
  if (!hostCamera || hostCamera->projection != HostCamera::Projection::Perspective)
    return nullptr;

  unique_ptr<ImCamera> camera = make_unique<ImCamera>(obj, parent);
  camera->carry = carry;

  float width = hostCamera->pixelAspectX * hostCamera->resolutionX;
  float height = hostCamera->pixelAspectY * hostCamera->resolutionY;
  if (width <= 0 || height <= 0)
  {
    instance->Log(1, "Camera '%s' has an empty render resolution, assuming square\n", obj->GetName().c_str());
    width = height = 1;
  }

  camera->aspectRatio = width / height;
  camera->verticalFov = CalcVerticalFov(*hostCamera, width, height);
  camera->viewportWidth = (int)width;
  camera->viewportHeight = (int)height;
  camera->nearPlane = hostCamera->nearPlane > 0 ? hostCamera->nearPlane : DEFAULT_NEAR_PLANE;
  camera->farPlane = hostCamera->farPlane > camera->nearPlane ? hostCamera->farPlane : DEFAULT_FAR_PLANE;

  instance->Log(2,
      "  Camera '%s': fovV %.4f, aspect %.4f, near %.3f, far %.3f\n",
      obj->GetName().c_str(),
      camera->verticalFov,
      camera->aspectRatio,
      camera->nearPlane,
      camera->farPlane);

  return instance->scene->AddObject(std::move(camera));
}
