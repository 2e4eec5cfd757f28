#include "scene_validator.hpp"
#include "native_scene.hpp"

//-----------------------------------------------------------------------------
void ValidationReport::AddIssue(const char* fmt, ...)
{
  char buf[512];
  va_list arg;
  va_start(arg, fmt);
  vsnprintf(buf, sizeof(buf), fmt, arg);
  va_end(arg);

  issues.push_back(buf);
}

//-----------------------------------------------------------------------------
string ValidationReport::ToString() const
{
  string res;
  for (const string& issue : issues)
    res += "  - " + issue + "\n";
  return res;
}

//-----------------------------------------------------------------------------
static void ValidateHierarchy(const NativeSceneData& data, ValidationReport* report)
{
  u32 numNodes = (u32)data.nodes.size();
  for (u32 i = 0; i < numNodes; ++i)
  {
    const NativeNode& node = data.nodes[i];
    if (node.parent != INVALID_HANDLE && node.parent >= numNodes)
      report->AddIssue("node '%s' has parent %u out of range", node.name.c_str(), node.parent);
  }

  // 0 = unvisited, 1 = on the current path, 2 = known to reach a root
  vector<u8> state(numNodes, 0);
  for (u32 i = 0; i < numNodes; ++i)
  {
    vector<u32> path;
    u32 cur = i;
    while (cur != INVALID_HANDLE && cur < numNodes && state[cur] == 0)
    {
      state[cur] = 1;
      path.push_back(cur);
      cur = data.nodes[cur].parent;
    }

    if (cur != INVALID_HANDLE && cur < numNodes && state[cur] == 1)
      report->AddIssue("node '%s' is part of a parent cycle", data.nodes[cur].name.c_str());

    for (u32 n : path)
      state[n] = 2;
  }
}

//-----------------------------------------------------------------------------
static void ValidateReferences(const NativeSceneData& data, ValidationReport* report)
{
  vector<int> meshRefs(data.meshes.size(), 0);
  vector<int> effectRefs(data.effects.size(), 0);

  for (const NativeNode& node : data.nodes)
  {
    if (node.kind != NodeKind::Mesh)
      continue;

    if (node.mesh >= data.meshes.size())
      report->AddIssue("node '%s' references missing mesh %u", node.name.c_str(), node.mesh);
    else
      meshRefs[node.mesh]++;

    if (node.effect >= data.effects.size())
      report->AddIssue("node '%s' references missing effect %u", node.name.c_str(), node.effect);
    else
      effectRefs[node.effect]++;
  }

  for (size_t i = 0; i < meshRefs.size(); ++i)
  {
    if (meshRefs[i] == 0)
      report->AddIssue("mesh '%s' is not used by any node", data.meshes[i].name.c_str());
  }

  for (size_t i = 0; i < effectRefs.size(); ++i)
  {
    if (effectRefs[i] == 0)
      report->AddIssue("effect '%s' is not used by any node", data.effects[i].name.c_str());
  }
}

//-----------------------------------------------------------------------------
static void ValidateMeshes(const NativeSceneData& data, ValidationReport* report)
{
  for (const NativeMesh& mesh : data.meshes)
  {
    const char* name = mesh.name.c_str();
    if (mesh.positions.empty())
    {
      report->AddIssue("mesh '%s' has no vertices", name);
      continue;
    }

    if (mesh.indices.size() % 3 != 0)
      report->AddIssue("mesh '%s' has %d indices, not a multiple of 3", name, (int)mesh.indices.size());

    for (u32 idx : mesh.indices)
    {
      if (idx >= mesh.positions.size())
      {
        report->AddIssue("mesh '%s' has index %u out of range", name, idx);
        break;
      }
    }

    if (mesh.normals.size() != mesh.positions.size())
    {
      report->AddIssue(
          "mesh '%s' has %d normals for %d vertices", name, (int)mesh.normals.size(), (int)mesh.positions.size());
    }
  }
}

//-----------------------------------------------------------------------------
bool ValidateScene(const NativeSceneData& data, ValidationReport* report)
{
  size_t before = report->issues.size();

  ValidateHierarchy(data, report);
  ValidateReferences(data, report);
  ValidateMeshes(data, report);

  for (const NativeNode& node : data.nodes)
  {
    if (!IsFinite(node.transform))
      report->AddIssue("node '%s' has a non-finite transform", node.name.c_str());
  }

  return report->issues.size() == before;
}
