#include "export_mesh.hpp"
#include "export_misc.hpp"
#include "exporter.hpp"
#include "exporter_utils.hpp"

//-----------------------------------------------------------------------------
static bool IsValidFace(const ImMeshFace& face, int vertexCount)
{
  for (int i = 0; i < 3; ++i)
  {
    if (face.vtx[i] < 0 || face.vtx[i] >= vertexCount)
      return false;
  }
  return true;
}

//-----------------------------------------------------------------------------
void CalcVertexNormals(ImMeshData* data)
{
  int vertexCount = (int)data->vertices.size();
  data->normals.assign(vertexCount, vec3(0, 0, 0));

  // area weighted sum of the face normals around each vertex
  for (const ImMeshFace& face : data->faces)
  {
    if (!IsValidFace(face, vertexCount))
      continue;

    const vec3& a = data->vertices[face.a];
    const vec3& b = data->vertices[face.b];
    const vec3& c = data->vertices[face.c];
    vec3 n = Cross(b - a, c - a);
    for (int i = 0; i < 3; ++i)
      data->normals[face.vtx[i]] += n;
  }

  for (vec3& n : data->normals)
    n = Normalize(n);
}

//-----------------------------------------------------------------------------
void CalcBoundingVolumes(ImMeshData* data)
{
  data->aabb = ImAABB();
  data->boundingSphere = ImSphere();

  int vertexCount = (int)data->vertices.size();
  if (vertexCount == 0)
    return;

  vec3 center(0, 0, 0);
  for (const vec3& v : data->vertices)
  {
    data->aabb = data->aabb.Extend(v);
    center += v;
  }
  center /= (float)vertexCount;

  float radius = 0;
  for (const vec3& v : data->vertices)
    radius = max(radius, LengthSq(center - v));

  data->boundingSphere.center = center;
  data->boundingSphere.radius = sqrtf(radius);
}

//-----------------------------------------------------------------------------
void ConvertHostMesh(const HostMesh& hostMesh, ImMeshData* data, ExportInstance* instance)
{
  data->vertices = hostMesh.vertices;
  data->faces.clear();

  int degenerate = 0;
  for (const HostPolygon& poly : hostMesh.polygons)
  {
    int numVerts = (int)poly.indices.size();
    if (numVerts < 3)
    {
      degenerate++;
      continue;
    }

    for (int i = 1; i < numVerts - 1; ++i)
    {
      ImMeshFace face;
      face.a = poly.indices[0];
      face.b = poly.indices[i];
      face.c = poly.indices[i + 1];
      data->faces.push_back(face);
    }
  }

  if (degenerate > 0)
    instance->Log(1, "Mesh '%s': skipped %d polygons with less than 3 vertices\n", hostMesh.name.c_str(), degenerate);

  CalcVertexNormals(data);
  CalcBoundingVolumes(data);
}

//-----------------------------------------------------------------------------
ImMeshData* ExportMeshData(const HostMesh* hostMesh, const string& ownerName, ExportInstance* instance)
{
  ImScene* scene = instance->scene;

  if (hostMesh)
  {
    if (ImMeshData* existing = scene->FindMeshData(hostMesh))
    {
      instance->Log(2, "  Sharing mesh '%s'\n", existing->name.c_str());
      return existing;
    }
  }

  unique_ptr<ImMeshData> data = make_unique<ImMeshData>();
  data->source = hostMesh;

  if (hostMesh)
  {
    data->name = hostMesh->name.empty() ? ownerName : hostMesh->name;
    ConvertHostMesh(*hostMesh, data.get(), instance);
  }
  else
  {
    data->name = ownerName;
    instance->Log(1, "Mesh object '%s' has no mesh data\n", ownerName.c_str());
  }

  instance->Log(2,
      "  Converted mesh '%s' (%d verts, %d faces)\n",
      data->name.c_str(),
      (int)data->vertices.size(),
      (int)data->faces.size());

  return scene->AddMeshData(std::move(data));
}

//-----------------------------------------------------------------------------
ImMesh* ExportMesh(const HostObject* obj, ImBaseObject* parent, const Matrix& carry, ExportInstance* instance)
{
  unique_ptr<ImMesh> mesh = make_unique<ImMesh>(obj, parent);
  mesh->carry = carry;
  mesh->meshData = ExportMeshData(obj->GetMesh(), obj->GetName(), instance);
  mesh->effect = ExportEffect(obj->GetName(), instance);

  return instance->scene->AddObject(std::move(mesh));
}
