#pragma once
#include "native_scene.hpp"

struct JsonWriter;

//------------------------------------------------------------------------------
// Human readable description of a native scene, used by --dump and --inspect.
struct JsonExporter
{
  JsonExporter(const NativeSceneData& data) : data(data)
  {
  }

  string Export();
  bool ExportToFile(const string& filename, string* error);

  void ExportSceneInfo(JsonWriter* w);
  void ExportNodes(JsonWriter* w);
  void ExportMeshes(JsonWriter* w);
  void ExportEffects(JsonWriter* w);

  const NativeSceneData& data;
};
