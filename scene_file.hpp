#pragma once
#include "exporter_types.hpp"

struct NativeSceneData;

// On-disk layout of a .sgx file. All values little endian.
//
//   header    SceneFileHeader (12 x u32)
//   strings   u32 count, { u32 len, bytes }
//   effects   { u32 name, u32 len, vertex bytes, u32 len, fragment bytes }
//   meshes    { u32 name, u32 vertexCount, u32 normalCount, u32 indexCount, u32 indexSize,
//               positions f32 x 3, normals f32 x 3, indices u16 or u32 (padded to 4) }
//   nodes     { u32 name, u32 parent, u32 kind, u32 mesh, u32 effect, f32 x 12 matrix,
//               f32 fovV, f32 aspect, f32 near, f32 far, s32 viewport w, s32 viewport h }
//
// Section offsets are relative to the start of the file. The checksum is FNV-1a
// over everything after the header.

static const u32 SCENE_FILE_MAGIC = 0x31584753; // 'SGX1'
static const u32 SCENE_FILE_VERSION = 1;

//------------------------------------------------------------------------------
struct SceneFileHeader
{
  u32 magic = SCENE_FILE_MAGIC;
  u32 version = SCENE_FILE_VERSION;
  u32 flags = 0;
  u32 nodeCount = 0;
  u32 meshCount = 0;
  u32 effectCount = 0;
  u32 stringOffset = 0;
  u32 effectOffset = 0;
  u32 meshOffset = 0;
  u32 nodeOffset = 0;
  u32 payloadSize = 0;
  u32 checksum = 0;
};

static const u32 SCENE_FILE_HEADER_SIZE = 12 * sizeof(u32);

//------------------------------------------------------------------------------
struct SceneFileStats
{
  int stringSize = 0;
  int effectSize = 0;
  int meshSize = 0;
  int nodeSize = 0;
  int fileSize = 0;
};

// Serializes 'data'. Identical input gives identical bytes.
void WriteSceneBuffer(const NativeSceneData& data, bool compressIndices, vector<u8>* out, SceneFileStats* stats);

// Writes to a unique <path>.XXXXXX, loads it back, and renames it over 'path'. On failure
// the temp file is removed and 'path' is left as it was.
bool SaveSceneFile(
    const NativeSceneData& data, const string& path, bool compressIndices, SceneFileStats* stats, string* error);

bool ParseSceneBuffer(const vector<u8>& buf, NativeSceneData* out, string* error);
bool LoadSceneFile(const string& path, NativeSceneData* out, string* error);
