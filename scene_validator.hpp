#pragma once
#include "exporter_types.hpp"

struct NativeSceneData;

//------------------------------------------------------------------------------
struct ValidationReport
{
  void AddIssue(const char* fmt, ...);
  bool Ok() const { return issues.empty(); }
  string ToString() const;

  vector<string> issues;
};

//------------------------------------------------------------------------------
// Consistency pass run before a scene is written:
//  - parents in range and no cyclic parentage
//  - mesh/effect references resolve, and no resource is left unreferenced
//  - every mesh has vertices, a whole number of in-range triangles, and one
//    normal per vertex
//  - every transform is finite
bool ValidateScene(const NativeSceneData& data, ValidationReport* report);
