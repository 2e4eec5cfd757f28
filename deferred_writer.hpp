#pragma once
#include "exporter_types.hpp"

//------------------------------------------------------------------------------
// Little endian buffer writer. Values that aren't known up front (section
// offsets, sizes) are reserved with CreatePatch and filled in with Patch.
class DeferredWriter
{
public:
  void WriteU8(u8 value);
  void WriteU16(u16 value);
  void WriteU32(u32 value);
  void WriteS32(s32 value);
  void WriteF32(float value);
  void WriteVec3(const vec3& v);
  void WriteBytes(const void* data, size_t len);
  // u32 length followed by the raw bytes
  void WriteString(const string& str);
  void Align(u32 alignment);

  u32 CreatePatch();
  void Patch(u32 ofs, u32 value);
  // patches 'ofs' with the current position
  void PatchOffset(u32 ofs);

  u32 Pos() const { return (u32)_buf.size(); }
  const vector<u8>& Data() const { return _buf; }
  vector<u8>* MutableData() { return &_buf; }

private:
  vector<u8> _buf;
};
