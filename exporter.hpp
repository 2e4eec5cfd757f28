#pragma once
#include "im_scene.hpp"

class SceneBackend;

//------------------------------------------------------------------------------
enum class ExportError
{
  None,
  InvalidScene,
  NativeResourceRejected,
  ValidationFailed,
  SerializationFailed,
};

const char* ExportErrorName(ExportError err);

//------------------------------------------------------------------------------
struct Options
{
  string outputDirectory = ".";
  FILE* logfile = nullptr;
  bool compressIndices = true;
  int loglevel = 1;
  bool force = false;
  bool dump = false;
  // objects named in customGlslObjects load <shaderDir>/<name>.vert and .frag
  string shaderDir;
  vector<string> customGlslObjects;
};

//------------------------------------------------------------------------------
struct SceneStats
{
  int nullObjectCount = 0;
  int cameraCount = 0;
  int meshCount = 0;
  int skippedCount = 0;
  int meshResourceCount = 0;
  int effectResourceCount = 0;

  int nodeSize = 0;
  int meshSize = 0;
  int effectSize = 0;
  int stringSize = 0;
  int dataSize = 0;
};

//------------------------------------------------------------------------------
struct ExportInstance
{
  void Reset();
  void Log(int level, const char* fmt, ...) const;
  // recoverable problem. logged at level 1 and kept in 'warnings'
  void Warn(const char* fmt, ...);
  // records the first fatal error. always returns false.
  bool SetError(ExportError kind, const char* fmt, ...);

  ImScene* scene = nullptr;
  Options options;
  SceneStats stats;
  vector<string> warnings;
  ExportError errorKind = ExportError::None;
  string error;
};

//------------------------------------------------------------------------------
// Runs the whole pipeline: host -> IR -> backend -> validate -> save.
// Nothing is written to 'path' unless every step succeeds.
bool ExportScene(const HostScene& host, SceneBackend* backend, const string& path, ExportInstance* instance);

// Same as above, using a NativeScene configured from instance->options.
bool ExportScene(const HostScene& host, const string& path, ExportInstance* instance);
