#include "deferred_writer.hpp"
#include "exporter_utils.hpp"
#include "native_scene.hpp"
#include "scene_file.hpp"

#include <unistd.h>

namespace
{
  //------------------------------------------------------------------------------
  // Interned names, in order of first use. Index 0 is the scene name.
  struct StringTable
  {
    u32 Add(const string& str)
    {
      auto it = lookup.find(str);
      if (it != lookup.end())
        return it->second;

      u32 idx = (u32)strings.size();
      strings.push_back(str);
      lookup[str] = idx;
      return idx;
    }

    vector<string> strings;
    unordered_map<string, u32> lookup;
  };

  //------------------------------------------------------------------------------
  bool FitsIn16Bits(const vector<u32>& indices)
  {
    for (u32 idx : indices)
    {
      if (idx > 0xffff)
        return false;
    }
    return true;
  }

  //------------------------------------------------------------------------------
  // Owns a uniquely named <dest>.XXXXXX beside the destination until it is
  // renamed over it. Anything that leaves scope without a commit removes the
  // temp file.
  class TempFile
  {
  public:
    TempFile(const string& dest) : _path(dest + ".XXXXXX") {}

    ~TempFile()
    {
      Close();
      if (_created && !_committed)
        remove(_path.c_str());
    }

    bool Open()
    {
      int fd = mkstemp(&_path[0]);
      if (fd == -1)
        return false;
      _created = true;

      // mkstemp creates the file as 0600
      if (fchmod(fd, 0644) == 0)
        _f = fdopen(fd, "wb");

      if (!_f)
      {
        close(fd);
        return false;
      }
      return true;
    }

    bool Write(const vector<u8>& buf)
    {
      return fwrite(buf.data(), 1, buf.size(), _f) == buf.size();
    }

    bool Close()
    {
      if (!_f)
        return true;

      bool ok = fflush(_f) == 0;
      ok &= fclose(_f) == 0;
      _f = nullptr;
      return ok;
    }

    bool CommitTo(const string& dest)
    {
      if (rename(_path.c_str(), dest.c_str()) != 0)
        return false;
      _committed = true;
      return true;
    }

    const string& Path() const { return _path; }

  private:
    string _path;
    FILE* _f = nullptr;
    bool _created = false;
    bool _committed = false;
  };

  //------------------------------------------------------------------------------
  bool Fail(string* error, const string& msg)
  {
    if (error)
      *error = msg;
    return false;
  }
}

//------------------------------------------------------------------------------
void WriteSceneBuffer(const NativeSceneData& data, bool compressIndices, vector<u8>* out, SceneFileStats* stats)
{
  StringTable strings;
  strings.Add(data.name);
  for (const NativeEffect& effect : data.effects)
    strings.Add(effect.name);
  for (const NativeMesh& mesh : data.meshes)
    strings.Add(mesh.name);
  for (const NativeNode& node : data.nodes)
    strings.Add(node.name);

  DeferredWriter w;

  // header
  w.WriteU32(SCENE_FILE_MAGIC);
  w.WriteU32(SCENE_FILE_VERSION);
  w.WriteU32(0);
  w.WriteU32((u32)data.nodes.size());
  w.WriteU32((u32)data.meshes.size());
  w.WriteU32((u32)data.effects.size());
  u32 stringOffset = w.CreatePatch();
  u32 effectOffset = w.CreatePatch();
  u32 meshOffset = w.CreatePatch();
  u32 nodeOffset = w.CreatePatch();
  u32 payloadSize = w.CreatePatch();
  u32 checksum = w.CreatePatch();

  // strings
  u32 sectionStart = w.Pos();
  w.PatchOffset(stringOffset);
  w.WriteU32((u32)strings.strings.size());
  for (const string& str : strings.strings)
    w.WriteString(str);
  w.Align(4);
  int stringSize = w.Pos() - sectionStart;

  // effects
  sectionStart = w.Pos();
  w.PatchOffset(effectOffset);
  for (const NativeEffect& effect : data.effects)
  {
    w.WriteU32(strings.Add(effect.name));
    w.WriteString(effect.vertexShader);
    w.WriteString(effect.fragmentShader);
    w.Align(4);
  }
  int effectSize = w.Pos() - sectionStart;

  // meshes
  sectionStart = w.Pos();
  w.PatchOffset(meshOffset);
  for (const NativeMesh& mesh : data.meshes)
  {
    bool use16 = compressIndices && FitsIn16Bits(mesh.indices);

    w.WriteU32(strings.Add(mesh.name));
    w.WriteU32((u32)mesh.positions.size());
    w.WriteU32((u32)mesh.normals.size());
    w.WriteU32((u32)mesh.indices.size());
    w.WriteU32(use16 ? 2 : 4);

    for (const vec3& v : mesh.positions)
      w.WriteVec3(v);
    for (const vec3& n : mesh.normals)
      w.WriteVec3(n);

    for (u32 idx : mesh.indices)
    {
      if (use16)
        w.WriteU16((u16)idx);
      else
        w.WriteU32(idx);
    }
    w.Align(4);
  }
  int meshSize = w.Pos() - sectionStart;

  // nodes
  sectionStart = w.Pos();
  w.PatchOffset(nodeOffset);
  for (const NativeNode& node : data.nodes)
  {
    w.WriteU32(strings.Add(node.name));
    w.WriteU32(node.parent);
    w.WriteU32((u32)node.kind);
    w.WriteU32(node.mesh);
    w.WriteU32(node.effect);

    float mtx[12];
    CopyMatrix(node.transform, mtx);
    for (float f : mtx)
      w.WriteF32(f);

    w.WriteF32(node.camera.verticalFov);
    w.WriteF32(node.camera.aspectRatio);
    w.WriteF32(node.camera.nearPlane);
    w.WriteF32(node.camera.farPlane);
    w.WriteS32(node.camera.viewportWidth);
    w.WriteS32(node.camera.viewportHeight);
  }
  int nodeSize = w.Pos() - sectionStart;

  const vector<u8>& buf = w.Data();
  w.Patch(payloadSize, w.Pos() - SCENE_FILE_HEADER_SIZE);
  w.Patch(checksum, FnvHash(buf.data() + SCENE_FILE_HEADER_SIZE, buf.size() - SCENE_FILE_HEADER_SIZE));

  if (stats)
  {
    stats->stringSize = stringSize;
    stats->effectSize = effectSize;
    stats->meshSize = meshSize;
    stats->nodeSize = nodeSize;
    stats->fileSize = (int)buf.size();
  }

  out->swap(*w.MutableData());
}

//------------------------------------------------------------------------------
bool SaveSceneFile(
    const NativeSceneData& data, const string& path, bool compressIndices, SceneFileStats* stats, string* error)
{
  if (path.empty())
    return Fail(error, "empty output path");

  vector<u8> buf;
  WriteSceneBuffer(data, compressIndices, &buf, stats);

  TempFile tmp(path);
  if (!tmp.Open())
    return Fail(error, "unable to open " + tmp.Path() + ": " + strerror(errno));

  if (!tmp.Write(buf))
    return Fail(error, "unable to write " + tmp.Path() + ": " + strerror(errno));

  if (!tmp.Close())
    return Fail(error, "unable to flush " + tmp.Path() + ": " + strerror(errno));

  // the file has to load back to exactly what was written
  NativeSceneData loaded;
  string loadError;
  if (!LoadSceneFile(tmp.Path(), &loaded, &loadError))
    return Fail(error, "verification of " + tmp.Path() + " failed: " + loadError);

  vector<u8> reloaded;
  WriteSceneBuffer(loaded, compressIndices, &reloaded, nullptr);
  if (reloaded != buf)
    return Fail(error, "verification of " + tmp.Path() + " failed: contents differ after reload");

  if (!tmp.CommitTo(path))
    return Fail(error, "unable to rename " + tmp.Path() + " to " + path + ": " + strerror(errno));

  return true;
}
