#include "deferred_writer.hpp"

//------------------------------------------------------------------------------
void DeferredWriter::WriteU8(u8 value)
{
  _buf.push_back(value);
}

//------------------------------------------------------------------------------
void DeferredWriter::WriteU16(u16 value)
{
  _buf.push_back((u8)(value & 0xff));
  _buf.push_back((u8)((value >> 8) & 0xff));
}

//------------------------------------------------------------------------------
void DeferredWriter::WriteU32(u32 value)
{
  for (int i = 0; i < 4; ++i)
    _buf.push_back((u8)((value >> (i * 8)) & 0xff));
}

//------------------------------------------------------------------------------
void DeferredWriter::WriteS32(s32 value)
{
  WriteU32((u32)value);
}

//------------------------------------------------------------------------------
void DeferredWriter::WriteF32(float value)
{
  u32 bits;
  memcpy(&bits, &value, sizeof(bits));
  WriteU32(bits);
}

//------------------------------------------------------------------------------
void DeferredWriter::WriteVec3(const vec3& v)
{
  WriteF32(v.x);
  WriteF32(v.y);
  WriteF32(v.z);
}

//------------------------------------------------------------------------------
void DeferredWriter::WriteBytes(const void* data, size_t len)
{
  const u8* ptr = (const u8*)data;
  _buf.insert(_buf.end(), ptr, ptr + len);
}

//------------------------------------------------------------------------------
void DeferredWriter::WriteString(const string& str)
{
  WriteU32((u32)str.size());
  WriteBytes(str.data(), str.size());
}

//------------------------------------------------------------------------------
void DeferredWriter::Align(u32 alignment)
{
  while (_buf.size() % alignment)
    _buf.push_back(0);
}

//------------------------------------------------------------------------------
u32 DeferredWriter::CreatePatch()
{
  u32 ofs = Pos();
  WriteU32(0);
  return ofs;
}

//------------------------------------------------------------------------------
void DeferredWriter::Patch(u32 ofs, u32 value)
{
  for (int i = 0; i < 4; ++i)
    _buf[ofs + i] = (u8)((value >> (i * 8)) & 0xff);
}

//------------------------------------------------------------------------------
void DeferredWriter::PatchOffset(u32 ofs)
{
  Patch(ofs, Pos());
}
