#include "exporter_utils.hpp"
#include "native_scene.hpp"
#include "scene_file.hpp"

namespace
{
  //------------------------------------------------------------------------------
  // Bounds checked little endian reader. Once a read fails every following
  // read fails too, so callers only need to check Ok() at the end of a block.
  class BufferReader
  {
  public:
    BufferReader(const vector<u8>& buf, u32 ofs = 0) : _buf(buf), _ofs(ofs) {}

    bool Ok() const { return _ok; }
    u32 Pos() const { return _ofs; }

    bool Seek(u32 ofs)
    {
      if (ofs > _buf.size())
        _ok = false;
      else
        _ofs = ofs;
      return _ok;
    }

    u16 ReadU16()
    {
      if (!Require(2))
        return 0;
      u16 res = (u16)(_buf[_ofs] | (_buf[_ofs + 1] << 8));
      _ofs += 2;
      return res;
    }

    u32 ReadU32()
    {
      if (!Require(4))
        return 0;
      u32 res = 0;
      for (int i = 0; i < 4; ++i)
        res |= (u32)_buf[_ofs + i] << (i * 8);
      _ofs += 4;
      return res;
    }

    s32 ReadS32() { return (s32)ReadU32(); }

    float ReadF32()
    {
      u32 bits = ReadU32();
      float res;
      memcpy(&res, &bits, sizeof(res));
      return res;
    }

    vec3 ReadVec3()
    {
      float x = ReadF32();
      float y = ReadF32();
      float z = ReadF32();
      return vec3(x, y, z);
    }

    string ReadString()
    {
      u32 len = ReadU32();
      if (!Require(len))
        return string();
      string res((const char*)&_buf[_ofs], len);
      _ofs += len;
      return res;
    }

    void Align(u32 alignment)
    {
      u32 pad = (alignment - _ofs % alignment) % alignment;
      if (Require(pad))
        _ofs += pad;
    }

    // true if 'count' elements of 'elemSize' bytes can still be read
    bool HasRoom(u32 count, u32 elemSize)
    {
      if ((u64)count * elemSize > _buf.size() - _ofs)
        _ok = false;
      return _ok;
    }

  private:
    bool Require(u32 len)
    {
      if (!_ok || (u64)_ofs + len > _buf.size())
        _ok = false;
      return _ok;
    }

    const vector<u8>& _buf;
    u32 _ofs;
    bool _ok = true;
  };

  //------------------------------------------------------------------------------
  bool Fail(string* error, const char* fmt, ...)
  {
    if (error)
    {
      char buf[256];
      va_list arg;
      va_start(arg, fmt);
      vsnprintf(buf, sizeof(buf), fmt, arg);
      va_end(arg);
      *error = buf;
    }
    return false;
  }

  //------------------------------------------------------------------------------
  bool LookupString(const vector<string>& strings, u32 idx, string* out)
  {
    if (idx >= strings.size())
      return false;
    *out = strings[idx];
    return true;
  }
}

//------------------------------------------------------------------------------
bool ParseSceneBuffer(const vector<u8>& buf, NativeSceneData* out, string* error)
{
  if (buf.size() < SCENE_FILE_HEADER_SIZE)
    return Fail(error, "file too small (%d bytes)", (int)buf.size());

  BufferReader r(buf);
  SceneFileHeader header;
  header.magic = r.ReadU32();
  header.version = r.ReadU32();
  header.flags = r.ReadU32();
  header.nodeCount = r.ReadU32();
  header.meshCount = r.ReadU32();
  header.effectCount = r.ReadU32();
  header.stringOffset = r.ReadU32();
  header.effectOffset = r.ReadU32();
  header.meshOffset = r.ReadU32();
  header.nodeOffset = r.ReadU32();
  header.payloadSize = r.ReadU32();
  header.checksum = r.ReadU32();

  if (header.magic != SCENE_FILE_MAGIC)
    return Fail(error, "bad magic 0x%08x", header.magic);

  if (header.version != SCENE_FILE_VERSION)
    return Fail(error, "unsupported version %u", header.version);

  if (header.payloadSize != buf.size() - SCENE_FILE_HEADER_SIZE)
    return Fail(error, "payload size %u doesn't match file size %d", header.payloadSize, (int)buf.size());

  u32 checksum = FnvHash(buf.data() + SCENE_FILE_HEADER_SIZE, buf.size() - SCENE_FILE_HEADER_SIZE);
  if (checksum != header.checksum)
    return Fail(error, "checksum mismatch (0x%08x, expected 0x%08x)", checksum, header.checksum);

  if (header.stringOffset < SCENE_FILE_HEADER_SIZE || header.effectOffset < header.stringOffset
      || header.meshOffset < header.effectOffset || header.nodeOffset < header.meshOffset
      || header.nodeOffset > buf.size())
    return Fail(error, "section offsets out of order");

  NativeSceneData data;

  // strings
  vector<string> strings;
  r.Seek(header.stringOffset);
  u32 stringCount = r.ReadU32();
  if (!r.HasRoom(stringCount, 4))
    return Fail(error, "string count %u out of range", stringCount);
  strings.reserve(stringCount);
  for (u32 i = 0; i < stringCount && r.Ok(); ++i)
    strings.push_back(r.ReadString());
  if (!r.Ok() || strings.empty())
    return Fail(error, "truncated string table");
  data.name = strings[0];

  // effects
  r.Seek(header.effectOffset);
  if (!r.HasRoom(header.effectCount, 12))
    return Fail(error, "effect count %u out of range", header.effectCount);
  for (u32 i = 0; i < header.effectCount; ++i)
  {
    NativeEffect effect;
    u32 nameIdx = r.ReadU32();
    effect.vertexShader = r.ReadString();
    effect.fragmentShader = r.ReadString();
    r.Align(4);
    if (!r.Ok())
      return Fail(error, "truncated effect %u", i);
    if (!LookupString(strings, nameIdx, &effect.name))
      return Fail(error, "effect %u has invalid name %u", i, nameIdx);
    data.effects.push_back(std::move(effect));
  }

  // meshes
  r.Seek(header.meshOffset);
  if (!r.HasRoom(header.meshCount, 20))
    return Fail(error, "mesh count %u out of range", header.meshCount);
  for (u32 i = 0; i < header.meshCount; ++i)
  {
    NativeMesh mesh;
    u32 nameIdx = r.ReadU32();
    u32 vertexCount = r.ReadU32();
    u32 normalCount = r.ReadU32();
    u32 indexCount = r.ReadU32();
    u32 indexSize = r.ReadU32();
    if (!r.Ok())
      return Fail(error, "truncated mesh %u", i);
    if (!LookupString(strings, nameIdx, &mesh.name))
      return Fail(error, "mesh %u has invalid name %u", i, nameIdx);
    if (indexSize != 2 && indexSize != 4)
      return Fail(error, "mesh '%s' has invalid index size %u", mesh.name.c_str(), indexSize);
    if (!r.HasRoom(vertexCount, 12) || !r.HasRoom(normalCount, 12) || !r.HasRoom(indexCount, indexSize))
      return Fail(error, "mesh '%s' is truncated", mesh.name.c_str());

    mesh.positions.reserve(vertexCount);
    for (u32 j = 0; j < vertexCount; ++j)
      mesh.positions.push_back(r.ReadVec3());

    mesh.normals.reserve(normalCount);
    for (u32 j = 0; j < normalCount; ++j)
      mesh.normals.push_back(r.ReadVec3());

    mesh.indices.reserve(indexCount);
    for (u32 j = 0; j < indexCount; ++j)
      mesh.indices.push_back(indexSize == 2 ? r.ReadU16() : r.ReadU32());
    r.Align(4);

    if (!r.Ok())
      return Fail(error, "mesh '%s' is truncated", mesh.name.c_str());
    data.meshes.push_back(std::move(mesh));
  }

  // nodes
  r.Seek(header.nodeOffset);
  if (!r.HasRoom(header.nodeCount, 23 * 4))
    return Fail(error, "node count %u out of range", header.nodeCount);
  for (u32 i = 0; i < header.nodeCount; ++i)
  {
    NativeNode node;
    u32 nameIdx = r.ReadU32();
    node.parent = r.ReadU32();
    u32 kind = r.ReadU32();
    node.mesh = r.ReadU32();
    node.effect = r.ReadU32();

    float mtx[12];
    for (float& f : mtx)
      f = r.ReadF32();
    node.transform = MatrixFromArray(mtx);

    node.camera.verticalFov = r.ReadF32();
    node.camera.aspectRatio = r.ReadF32();
    node.camera.nearPlane = r.ReadF32();
    node.camera.farPlane = r.ReadF32();
    node.camera.viewportWidth = r.ReadS32();
    node.camera.viewportHeight = r.ReadS32();

    if (!r.Ok())
      return Fail(error, "truncated node %u", i);
    if (!LookupString(strings, nameIdx, &node.name))
      return Fail(error, "node %u has invalid name %u", i, nameIdx);
    if (kind > (u32)NodeKind::Camera)
      return Fail(error, "node '%s' has unknown kind %u", node.name.c_str(), kind);
    node.kind = (NodeKind)kind;

    data.nodes.push_back(std::move(node));
  }

  if (r.Pos() != buf.size())
    return Fail(error, "%d trailing bytes", (int)(buf.size() - r.Pos()));

  *out = std::move(data);
  return true;
}

//------------------------------------------------------------------------------
bool LoadSceneFile(const string& path, NativeSceneData* out, string* error)
{
  FILE* f = fopen(path.c_str(), "rb");
  if (!f)
    return Fail(error, "unable to open %s: %s", path.c_str(), strerror(errno));

  vector<u8> buf;
  u8 chunk[16 * 1024];
  size_t len;
  while ((len = fread(chunk, 1, sizeof(chunk), f)) > 0)
    buf.insert(buf.end(), chunk, chunk + len);

  bool readError = ferror(f) != 0;
  fclose(f);

  if (readError)
    return Fail(error, "unable to read %s", path.c_str());

  return ParseSceneBuffer(buf, out, error);
}
