#include "json_exporter.hpp"
#include "json_writer.hpp"

static unordered_map<int, string> nodeKindToString = {
    {(int)NodeKind::Node, "node"},
    {(int)NodeKind::Mesh, "mesh"},
    {(int)NodeKind::Camera, "camera"},
};

//------------------------------------------------------------------------------
static void EmitVec3(const string& key, const vec3& v, JsonWriter* w)
{
  w->EmitArray(key, {v.x, v.y, v.z});
}

//------------------------------------------------------------------------------
void JsonExporter::ExportSceneInfo(JsonWriter* w)
{
  w->Emit("name", data.name);
  w->Emit("nodeCount", (int)data.nodes.size());
  w->Emit("meshCount", (int)data.meshes.size());
  w->Emit("effectCount", (int)data.effects.size());
}

//------------------------------------------------------------------------------
void JsonExporter::ExportNodes(JsonWriter* w)
{
  JsonWriter::JsonScope s(w, "nodes", JsonWriter::CompoundType::Array);

  for (u32 i = 0; i < data.nodes.size(); ++i)
  {
    const NativeNode& node = data.nodes[i];
    w->MaybeAddDelimiter();
    w->res += w->Indent();
    JsonWriter::JsonScope obj(w, JsonWriter::CompoundType::Object);

    w->Emit("name", node.name);
    w->Emit("kind", nodeKindToString[(int)node.kind]);
    w->Emit("parent", node.parent == INVALID_HANDLE ? -1 : (int)node.parent);

    {
      JsonWriter::JsonScope t(w, "transform", JsonWriter::CompoundType::Object);
      EmitVec3("v1", node.transform.v1, w);
      EmitVec3("v2", node.transform.v2, w);
      EmitVec3("v3", node.transform.v3, w);
      EmitVec3("off", node.transform.off, w);
    }

    EmitVec3("worldPos", WorldTransform(data, i).off, w);

    switch (node.kind)
    {
      case NodeKind::Mesh:
        w->Emit("mesh", node.mesh);
        w->Emit("effect", node.effect);
        break;

      case NodeKind::Camera:
      {
        JsonWriter::JsonScope c(w, "camera", JsonWriter::CompoundType::Object);
        w->Emit("fovV", node.camera.verticalFov);
        w->Emit("aspectRatio", node.camera.aspectRatio);
        w->Emit("nearPlane", node.camera.nearPlane);
        w->Emit("farPlane", node.camera.farPlane);
        w->EmitArray("viewport", {(int)node.camera.viewportWidth, (int)node.camera.viewportHeight});
        break;
      }

      case NodeKind::Node: break;
    }
  }
}

//------------------------------------------------------------------------------
void JsonExporter::ExportMeshes(JsonWriter* w)
{
  JsonWriter::JsonScope s(w, "meshes", JsonWriter::CompoundType::Array);

  for (const NativeMesh& mesh : data.meshes)
  {
    w->MaybeAddDelimiter();
    w->res += w->Indent();
    JsonWriter::JsonScope obj(w, JsonWriter::CompoundType::Object);

    w->Emit("name", mesh.name);
    w->Emit("vertexCount", (int)mesh.positions.size());
    w->Emit("triangleCount", (int)mesh.indices.size() / 3);

    vec3 minValue(+FLT_MAX, +FLT_MAX, +FLT_MAX);
    vec3 maxValue(-FLT_MAX, -FLT_MAX, -FLT_MAX);
    for (const vec3& v : mesh.positions)
    {
      minValue = Min(minValue, v);
      maxValue = Max(maxValue, v);
    }

    if (!mesh.positions.empty())
    {
      JsonWriter::JsonScope b(w, "bounds", JsonWriter::CompoundType::Object);
      EmitVec3("min", minValue, w);
      EmitVec3("max", maxValue, w);
    }
  }
}

//------------------------------------------------------------------------------
void JsonExporter::ExportEffects(JsonWriter* w)
{
  JsonWriter::JsonScope s(w, "effects", JsonWriter::CompoundType::Array);

  for (const NativeEffect& effect : data.effects)
  {
    w->MaybeAddDelimiter();
    w->res += w->Indent();
    JsonWriter::JsonScope obj(w, JsonWriter::CompoundType::Object);

    w->Emit("name", effect.name);
    w->Emit("vertexShader", effect.vertexShader);
    w->Emit("fragmentShader", effect.fragmentShader);
  }
}

//------------------------------------------------------------------------------
string JsonExporter::Export()
{
  JsonWriter w;
  {
    JsonWriter::JsonScope s(&w, JsonWriter::CompoundType::Object);
    ExportSceneInfo(&w);
    ExportNodes(&w);
    ExportMeshes(&w);
    ExportEffects(&w);
  }
  w.res += "\n";
  return w.res;
}

//------------------------------------------------------------------------------
bool JsonExporter::ExportToFile(const string& filename, string* error)
{
  string json = Export();

  FILE* f = fopen(filename.c_str(), "wb");
  if (!f)
  {
    *error = "unable to open " + filename + ": " + strerror(errno);
    return false;
  }

  bool ok = fwrite(json.data(), 1, json.size(), f) == json.size();
  ok &= fclose(f) == 0;
  if (!ok)
    *error = "unable to write " + filename;
  return ok;
}
