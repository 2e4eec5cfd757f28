#include "test_utils.hpp"
#include "export_misc.hpp"

namespace
{
  //------------------------------------------------------------------------------
  // One triangle mesh, one effect, one mesh node under a root node.
  NativeSceneData MakeValidScene()
  {
    NativeSceneData data;
    data.name = "scene";

    NativeMesh mesh;
    mesh.name = "Tri";
    mesh.positions = {vec3(0, 0, 0), vec3(1, 0, 0), vec3(0, 1, 0)};
    mesh.normals = {vec3(0, 0, 1), vec3(0, 0, 1), vec3(0, 0, 1)};
    mesh.indices = {0, 1, 2};
    data.meshes.push_back(mesh);

    NativeEffect effect;
    effect.name = "default";
    DefaultShaders(&effect.vertexShader, &effect.fragmentShader);
    data.effects.push_back(effect);

    NativeNode root;
    root.name = "Root";
    data.nodes.push_back(root);

    NativeNode node;
    node.name = "TriNode";
    node.kind = NodeKind::Mesh;
    node.parent = 0;
    node.mesh = 0;
    node.effect = 0;
    data.nodes.push_back(node);
    return data;
  }

  //------------------------------------------------------------------------------
  bool HasIssue(const ValidationReport& report, const char* text)
  {
    for (const string& issue : report.issues)
    {
      if (issue.find(text) != string::npos)
        return true;
    }
    return false;
  }
}

//------------------------------------------------------------------------------
TEST(SceneValidatorTest, ValidSceneHasNoIssues)
{
  ValidationReport report;
  EXPECT_TRUE(ValidateScene(MakeValidScene(), &report));
  EXPECT_TRUE(report.Ok());
}

//------------------------------------------------------------------------------
TEST(SceneValidatorTest, ParentCycleIsReported)
{
  NativeSceneData data = MakeValidScene();
  data.nodes[0].parent = 1;

  ValidationReport report;
  EXPECT_FALSE(ValidateScene(data, &report));
  EXPECT_TRUE(HasIssue(report, "cycle"));
}

//------------------------------------------------------------------------------
TEST(SceneValidatorTest, ParentOutOfRangeIsReported)
{
  NativeSceneData data = MakeValidScene();
  data.nodes[1].parent = 7;

  ValidationReport report;
  EXPECT_FALSE(ValidateScene(data, &report));
  EXPECT_TRUE(HasIssue(report, "'TriNode' has parent 7 out of range"));
}

//------------------------------------------------------------------------------
TEST(SceneValidatorTest, UnreferencedResourcesAreReported)
{
  NativeSceneData data = MakeValidScene();
  data.meshes.push_back(data.meshes[0]);
  data.meshes.back().name = "Orphan";
  data.effects.push_back(data.effects[0]);
  data.effects.back().name = "OrphanEffect";

  ValidationReport report;
  EXPECT_FALSE(ValidateScene(data, &report));
  EXPECT_TRUE(HasIssue(report, "mesh 'Orphan' is not used"));
  EXPECT_TRUE(HasIssue(report, "effect 'OrphanEffect' is not used"));
}

//------------------------------------------------------------------------------
TEST(SceneValidatorTest, MissingReferencesAreReported)
{
  NativeSceneData data = MakeValidScene();
  data.nodes[1].effect = 3;

  ValidationReport report;
  EXPECT_FALSE(ValidateScene(data, &report));
  EXPECT_TRUE(HasIssue(report, "missing effect 3"));
}

//------------------------------------------------------------------------------
TEST(SceneValidatorTest, MeshWithoutVerticesIsReported)
{
  NativeSceneData data = MakeValidScene();
  data.meshes[0].positions.clear();
  data.meshes[0].normals.clear();
  data.meshes[0].indices.clear();

  ValidationReport report;
  EXPECT_FALSE(ValidateScene(data, &report));
  EXPECT_TRUE(HasIssue(report, "mesh 'Tri' has no vertices"));
}

//------------------------------------------------------------------------------
TEST(SceneValidatorTest, BrokenIndexBuffersAreReported)
{
  NativeSceneData data = MakeValidScene();
  data.meshes[0].indices = {0, 1, 2, 0};

  ValidationReport report;
  EXPECT_FALSE(ValidateScene(data, &report));
  EXPECT_TRUE(HasIssue(report, "not a multiple of 3"));

  data.meshes[0].indices = {0, 1, 3};
  report = ValidationReport();
  EXPECT_FALSE(ValidateScene(data, &report));
  EXPECT_TRUE(HasIssue(report, "index 3 out of range"));
}

//------------------------------------------------------------------------------
TEST(SceneValidatorTest, NormalCountMismatchIsReported)
{
  NativeSceneData data = MakeValidScene();
  data.meshes[0].normals.pop_back();

  ValidationReport report;
  EXPECT_FALSE(ValidateScene(data, &report));
  EXPECT_TRUE(HasIssue(report, "2 normals for 3 vertices"));
}

//------------------------------------------------------------------------------
TEST(SceneValidatorTest, NonFiniteTransformIsReported)
{
  NativeSceneData data = MakeValidScene();
  data.nodes[1].transform.off.y = INFINITY;

  ValidationReport report;
  EXPECT_FALSE(ValidateScene(data, &report));
  EXPECT_TRUE(HasIssue(report, "'TriNode' has a non-finite transform"));
  EXPECT_NE(report.ToString().find("  - node 'TriNode'"), string::npos);
}

//------------------------------------------------------------------------------
TEST(NativeSceneTest, CreateMeshResourceRejectsBadInput)
{
  NativeScene native;
  vector<vec3> tri = {vec3(0, 0, 0), vec3(1, 0, 0), vec3(0, 1, 0)};

  EXPECT_EQ(native.CreateMeshResource("A", tri, {vec3(0, 0, 1)}, {0, 1, 2}), INVALID_HANDLE);
  EXPECT_NE(native.LastError().find("normals"), string::npos);

  EXPECT_EQ(native.CreateMeshResource("B", tri, {}, {0, 1}), INVALID_HANDLE);
  EXPECT_EQ(native.CreateMeshResource("C", tri, {}, {0, 1, 3}), INVALID_HANDLE);

  vector<vec3> bad = tri;
  bad[1].x = NAN;
  EXPECT_EQ(native.CreateMeshResource("D", bad, {}, {0, 1, 2}), INVALID_HANDLE);
  EXPECT_NE(native.LastError().find("not finite"), string::npos);

  EXPECT_EQ(native.CreateMeshResource("E", tri, {}, {0, 1, 2}), 0u);
  EXPECT_EQ(native.CreateMeshResource("Empty", {}, {}, {}), 1u);
  EXPECT_EQ(native.Data().meshes.size(), 2u);
}

//------------------------------------------------------------------------------
TEST(NativeSceneTest, CreateNodeChecksReferences)
{
  NativeScene native;
  NodeDesc desc;
  desc.name = "Orphan";
  desc.parent = 0;
  EXPECT_EQ(native.CreateNode(desc), INVALID_HANDLE);
  EXPECT_NE(native.LastError().find("unknown parent"), string::npos);

  desc.parent = INVALID_HANDLE;
  desc.kind = NodeKind::Mesh;
  EXPECT_EQ(native.CreateNode(desc), INVALID_HANDLE);
  EXPECT_NE(native.LastError().find("unknown mesh"), string::npos);

  desc.kind = NodeKind::Camera;
  desc.camera.verticalFov = 0.5f;
  desc.camera.nearPlane = 1.0f;
  desc.camera.farPlane = 0.5f;
  EXPECT_EQ(native.CreateNode(desc), INVALID_HANDLE);
  EXPECT_NE(native.LastError().find("frustum"), string::npos);

  desc.camera.farPlane = 10.0f;
  EXPECT_EQ(native.CreateNode(desc), 0u);

  EXPECT_EQ(native.CreateEffectResource("NoSource", "", "void main() {}"), INVALID_HANDLE);
  EXPECT_FALSE(native.SetTransform(5, Matrix()));
  EXPECT_TRUE(native.SetTransform(0, MatrixTranslate(vec3(1, 2, 3))));
  EXPECT_VEC3_NEAR(native.Data().nodes[0].transform.off, vec3(1, 2, 3), 0);
}

//------------------------------------------------------------------------------
TEST(NativeSceneTest, WorldTransformWalksParents)
{
  NativeSceneData data = MakeValidScene();
  data.nodes[0].transform = MatrixTranslate(vec3(0, 0, 1));
  data.nodes[1].transform = MatrixTranslate(vec3(2, 0, 0));
  EXPECT_VEC3_NEAR(WorldTransform(data, 1).off, vec3(2, 0, 1), 0);

  // a cycle terminates instead of looping forever
  data.nodes[0].parent = 1;
  WorldTransform(data, 1);
}
