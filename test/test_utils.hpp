#pragma once
#include "exporter.hpp"
#include "exporter_utils.hpp"
#include "fixture_scenes.hpp"
#include "memory_host_scene.hpp"
#include "native_scene.hpp"
#include "scene_backend.hpp"
#include "scene_traverser.hpp"
#include "scene_validator.hpp"
#include "transform_resolver.hpp"

#include <dirent.h>
#include <ftw.h>
#include <gtest/gtest.h>

#ifndef SGX_TEST_SHADER_DIR
#define SGX_TEST_SHADER_DIR "shaders"
#endif

//------------------------------------------------------------------------------
// Scratch directory under /tmp, removed with everything in it on destruction.
class TempDir
{
public:
  TempDir()
  {
    char tmpl[] = "/tmp/sgx_test_XXXXXX";
    if (const char* p = mkdtemp(tmpl))
      _path = p;
  }

  ~TempDir()
  {
    if (!_path.empty())
      nftw(_path.c_str(), RemoveEntry, 16, FTW_DEPTH | FTW_PHYS);
  }

  const string& Path() const { return _path; }
  string File(const string& name) const { return _path + "/" + name; }

private:
  static int RemoveEntry(const char* path, const struct stat*, int, struct FTW*)
  {
    return remove(path);
  }

  string _path;
};

//------------------------------------------------------------------------------
// Backend that records every call and accepts everything unless told not to.
class RecordingBackend : public SceneBackend
{
public:
  u32 CreateMeshResource(const string& name,
      const vector<vec3>& positions,
      const vector<vec3>& normals,
      const vector<u32>& indices) override
  {
    if (name == rejectMesh)
    {
      _lastError = "mesh rejected by test";
      return INVALID_HANDLE;
    }
    meshNames.push_back(name);
    vertexCounts.push_back((int)positions.size());
    normalCounts.push_back((int)normals.size());
    indexCounts.push_back((int)indices.size());
    return (u32)meshNames.size() - 1;
  }

  u32 CreateEffectResource(const string& name, const string& vertexShader, const string& fragmentShader) override
  {
    effectNames.push_back(name);
    fragmentShaders.push_back(fragmentShader);
    return (u32)effectNames.size() - 1;
  }

  u32 CreateNode(const NodeDesc& desc) override
  {
    if (desc.name == rejectNode)
    {
      _lastError = "node rejected by test";
      return INVALID_HANDLE;
    }
    nodes.push_back(desc);
    return (u32)nodes.size() - 1;
  }

  bool SetTransform(u32 node, const Matrix& local) override
  {
    transforms.push_back(make_pair(node, local));
    return true;
  }

  bool Validate(ValidationReport* report) override
  {
    validateCalls++;
    if (!validateResult)
      report->AddIssue("validation failed by test");
    return validateResult;
  }

  bool Save(const string& path) override
  {
    saveCalls++;
    savedPath = path;
    if (!saveResult)
      _lastError = "save failed by test";
    return saveResult;
  }

  const string& LastError() const override { return _lastError; }

  vector<string> meshNames;
  vector<int> vertexCounts;
  vector<int> normalCounts;
  vector<int> indexCounts;
  vector<string> effectNames;
  vector<string> fragmentShaders;
  vector<NodeDesc> nodes;
  vector<pair<u32, Matrix>> transforms;

  string rejectMesh;
  string rejectNode;
  bool validateResult = true;
  bool saveResult = true;
  int validateCalls = 0;
  int saveCalls = 0;
  string savedPath;

private:
  string _lastError;
};

//------------------------------------------------------------------------------
inline void SilenceLog(ExportInstance* instance)
{
  instance->options.loglevel = -1;
}

//------------------------------------------------------------------------------
// Runs traversal, modifier and transform resolution into 'scene'.
inline bool BuildIr(const HostScene& host, ImScene* scene, ExportInstance* instance)
{
  scene->name = host.GetName();
  instance->scene = scene;
  return TraverseScene(host, instance) && ResolveModifiers(instance) && ResolveTransforms(instance);
}

//------------------------------------------------------------------------------
inline void BuildFixture(const char* name, MemoryHostScene* host, Options* options)
{
  const FixtureScene* fixture = FindFixture(name);
  ASSERT_TRUE(fixture != nullptr) << name;
  fixture->build(host, options);
}

//------------------------------------------------------------------------------
inline bool ReadFileBytes(const string& path, vector<u8>* out)
{
  string str;
  if (!ReadTextFile(path, &str))
    return false;
  out->assign(str.begin(), str.end());
  return true;
}

//------------------------------------------------------------------------------
// Sorted names of the entries in 'path', without . and ..
inline vector<string> ListDir(const string& path)
{
  vector<string> res;
  DIR* d = opendir(path.c_str());
  if (!d)
    return res;

  while (const dirent* e = readdir(d))
  {
    string name = e->d_name;
    if (name != "." && name != "..")
      res.push_back(name);
  }
  closedir(d);
  std::sort(res.begin(), res.end());
  return res;
}

//------------------------------------------------------------------------------
inline const NativeNode* FindNode(const NativeSceneData& data, const string& name, u32* idx = nullptr)
{
  for (u32 i = 0; i < data.nodes.size(); ++i)
  {
    if (data.nodes[i].name == name)
    {
      if (idx)
        *idx = i;
      return &data.nodes[i];
    }
  }
  return nullptr;
}

#define EXPECT_VEC3_NEAR(a, b, eps)                                                                                    \
  do                                                                                                                   \
  {                                                                                                                    \
    const vec3 va_ = (a);                                                                                              \
    const vec3 vb_ = (b);                                                                                              \
    EXPECT_NEAR(va_.x, vb_.x, eps);                                                                                    \
    EXPECT_NEAR(va_.y, vb_.y, eps);                                                                                    \
    EXPECT_NEAR(va_.z, vb_.z, eps);                                                                                    \
  } while (false)
