#pragma once
#include "im_scene.hpp"

struct ExportInstance;

//-----------------------------------------------------------------------------
// Creates the ImMesh node for 'obj' and links it to its pool entry, converting
// the host mesh the first time it is seen.
ImMesh* ExportMesh(const HostObject* obj, ImBaseObject* parent, const Matrix& carry, ExportInstance* instance);

ImMeshData* ExportMeshData(const HostMesh* hostMesh, const string& ownerName, ExportInstance* instance);

// fan triangulation of every polygon
void ConvertHostMesh(const HostMesh& hostMesh, ImMeshData* data, ExportInstance* instance);

void CalcVertexNormals(ImMeshData* data);
void CalcBoundingVolumes(ImMeshData* data);
