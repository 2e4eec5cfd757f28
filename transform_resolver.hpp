#pragma once
#include "exporter_types.hpp"

class HostObject;
struct ExportInstance;

//-----------------------------------------------------------------------------
// parentInverse * T * R * S of a single host object
Matrix ComposeLocalMatrix(const HostObject* obj);

// Fills xformLocal/xformGlobal of every object in instance->scene, parents
// before children. local = carry * ComposeLocalMatrix(host), global = parent * local
bool ResolveTransforms(ExportInstance* instance);

// Bakes the export-time modifier stack of every mesh into regenerated pool
// entries, then drops pool entries that are no longer referenced.
bool ResolveModifiers(ExportInstance* instance);
