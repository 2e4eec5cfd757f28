#pragma once
#include "im_scene.hpp"

struct ExportInstance;

//-----------------------------------------------------------------------------
// Only perspective cameras are exported; returns nullptr for other projections.
ImCamera* ExportCamera(const HostObject* obj, ImBaseObject* parent, const Matrix& carry, ExportInstance* instance);

// Vertical field of view of a perspective camera rendered at width x height
float CalcVerticalFov(const HostCamera& camera, float width, float height);
