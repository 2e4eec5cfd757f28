//-----------------------------------------------------------------------------
// sgx scene-graph exporter
//-----------------------------------------------------------------------------

#include "exporter.hpp"
#include "exporter_utils.hpp"
#include "native_scene.hpp"
#include "scene_backend.hpp"
#include "scene_bridge.hpp"
#include "scene_traverser.hpp"
#include "scene_validator.hpp"
#include "transform_resolver.hpp"

//-----------------------------------------------------------------------------
namespace
{
  //------------------------------------------------------------------------------
  string VFormat(const char* fmt, va_list args)
  {
    va_list copy;
    va_copy(copy, args);
    const int len = vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);

    if (len <= 0)
      return string();

    string res(len + 1, '\0');
    vsnprintf(&res[0], len + 1, fmt, args);
    res.resize(len);
    return res;
  }

  //------------------------------------------------------------------------------
  string StripNewline(const string& str)
  {
    size_t len = str.size();
    while (len > 0 && (str[len - 1] == '\n' || str[len - 1] == '\r'))
      --len;
    return str.substr(0, len);
  }
}

//-----------------------------------------------------------------------------
const char* ExportErrorName(ExportError err)
{
  switch (err)
  {
    case ExportError::None: return "none";
    case ExportError::InvalidScene: return "invalid scene";
    case ExportError::NativeResourceRejected: return "native resource rejected";
    case ExportError::ValidationFailed: return "validation failed";
    case ExportError::SerializationFailed: return "serialization failed";
  }
  return "unknown";
}

//-----------------------------------------------------------------------------
void ExportInstance::Reset()
{
  scene = nullptr;
  stats = SceneStats();
  warnings.clear();
  errorKind = ExportError::None;
  error.clear();
}

//-----------------------------------------------------------------------------
void ExportInstance::Log(int level, const char* fmt, ...) const
{
  va_list arg;
  va_start(arg, fmt);
  string buf = VFormat(fmt, arg);
  va_end(arg);

  if (level <= options.loglevel)
    fputs(buf.c_str(), stderr);

  if (options.logfile)
    fputs(buf.c_str(), options.logfile);
}

//-----------------------------------------------------------------------------
void ExportInstance::Warn(const char* fmt, ...)
{
  va_list arg;
  va_start(arg, fmt);
  string buf = VFormat(fmt, arg);
  va_end(arg);

  warnings.push_back(StripNewline(buf));
  Log(1, "WARNING: %s\n", warnings.back().c_str());
}

//-----------------------------------------------------------------------------
bool ExportInstance::SetError(ExportError kind, const char* fmt, ...)
{
  va_list arg;
  va_start(arg, fmt);
  string buf = StripNewline(VFormat(fmt, arg));
  va_end(arg);

  // keep the root cause if several steps fail
  if (errorKind == ExportError::None)
  {
    errorKind = kind;
    error = buf;
  }

  Log(0, "ERROR (%s): %s\n", ExportErrorName(kind), buf.c_str());
  return false;
}

//-----------------------------------------------------------------------------
bool ExportScene(const HostScene& host, SceneBackend* backend, const string& path, ExportInstance* instance)
{
  instance->Reset();

  if (path.empty())
    return instance->SetError(ExportError::InvalidScene, "No output path given");

  if (!backend)
    return instance->SetError(ExportError::InvalidScene, "No native backend given");

  ImScene scene;
  scene.name = host.GetName();
  instance->scene = &scene;

  bool res = TraverseScene(host, instance) && ResolveModifiers(instance) && ResolveTransforms(instance);

  if (res)
  {
    instance->Log(3, "%s", scene.DescribeScene().c_str());
    res = BridgeScene(scene, backend, instance);
  }

  if (res)
  {
    ValidationReport report;
    if (!backend->Validate(&report))
    {
      res = instance->SetError(ExportError::ValidationFailed,
          "Scene '%s' failed validation:\n%s",
          scene.name.c_str(),
          report.ToString().c_str());
    }
  }

  if (res)
  {
    if (!backend->Save(path))
    {
      res = instance->SetError(
          ExportError::SerializationFailed, "Unable to save '%s': %s", path.c_str(), backend->LastError().c_str());
    }
  }

  if (res)
  {
    instance->stats.nullObjectCount = (int)scene.nullObjects.size();
    instance->stats.cameraCount = (int)scene.cameras.size();
    instance->stats.meshCount = (int)scene.meshes.size();
    instance->stats.meshResourceCount = (int)scene.meshPool.size();
    instance->stats.effectResourceCount = (int)scene.effectPool.size();
    instance->Log(2, "Exported '%s' to %s\n", scene.name.c_str(), path.c_str());
  }

  instance->scene = nullptr;
  return res;
}

//-----------------------------------------------------------------------------
bool ExportScene(const HostScene& host, const string& path, ExportInstance* instance)
{
  NativeScene native(host.GetName());
  native.SetCompressIndices(instance->options.compressIndices);

  if (!ExportScene(host, &native, path, instance))
    return false;

  const SceneFileStats& fileStats = native.LastSaveStats();
  instance->stats.nodeSize = fileStats.nodeSize;
  instance->stats.meshSize = fileStats.meshSize;
  instance->stats.effectSize = fileStats.effectSize;
  instance->stats.stringSize = fileStats.stringSize;
  instance->stats.dataSize = fileStats.fileSize;
  return true;
}
