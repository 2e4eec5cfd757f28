#pragma once
#include "host_scene.hpp"

struct ImMeshData;

//-----------------------------------------------------------------------------
// Appends a reflected copy of the current geometry for each enabled axis, in
// X, Y, Z order. The copies get reversed winding so they still face outwards.
void ApplyMirror(const HostModifier& modifier, ImMeshData* data);

// Replaces the geometry with 'count' copies, copy i offset by
// i * (relativeOffset * bbox size + constantOffset)
void ApplyArray(const HostModifier& modifier, ImMeshData* data);

bool IsSupportedModifier(const HostModifier& modifier);

// Deduplication key for a base mesh with a modifier stack applied to it.
// Two nodes with the same base mesh and equal keys share the regenerated mesh.
string ModifierStackKey(u32 baseMeshId, const vector<HostModifier>& stack);

// Copies 'base' into 'out' and applies every modifier in order. Normals and
// bounding volumes are recomputed.
void ApplyModifierStack(const ImMeshData& base, const vector<HostModifier>& stack, ImMeshData* out);
