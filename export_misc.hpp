#pragma once
#include "im_scene.hpp"

struct ExportInstance;

//-----------------------------------------------------------------------------
ImNullObject* ExportNullObject(const HostObject* obj, ImBaseObject* parent, const Matrix& carry, ExportInstance* instance);

// Returns the pool effect for the named object: its custom GLSL pair when the
// object is listed in options.customGlslObjects and both files load, otherwise
// the default effect.
ImEffect* ExportEffect(const string& objName, ExportInstance* instance);

void DefaultShaders(string* vertexShader, string* fragmentShader);
