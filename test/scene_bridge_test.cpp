#include "test_utils.hpp"
#include "scene_bridge.hpp"

namespace
{
  //------------------------------------------------------------------------------
  class SceneBridgeTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      SilenceLog(&instance);
    }

    void Build(const char* fixture)
    {
      BuildFixture(fixture, &host, &instance.options);
      ASSERT_TRUE(BuildIr(host, &scene, &instance));
    }

    MemoryHostScene host;
    ImScene scene;
    ExportInstance instance;
    RecordingBackend backend;
  };
}

//------------------------------------------------------------------------------
TEST_F(SceneBridgeTest, OneResourcePerPoolEntryAndOneNodePerObject)
{
  Build("shared_mesh");
  ASSERT_TRUE(BridgeScene(scene, &backend, &instance));

  ASSERT_EQ(backend.meshNames.size(), 1u);
  EXPECT_EQ(backend.meshNames[0], "SharedCube");
  EXPECT_EQ(backend.vertexCounts[0], 8);
  EXPECT_EQ(backend.normalCounts[0], 8);
  EXPECT_EQ(backend.indexCounts[0], 36);
  EXPECT_EQ(backend.effectNames.size(), 1u);

  ASSERT_EQ(backend.nodes.size(), 5u);
  EXPECT_EQ(backend.transforms.size(), 5u);

  EXPECT_EQ(backend.nodes[0].name, "Group");
  EXPECT_TRUE(backend.nodes[0].kind == NodeKind::Node);
  EXPECT_EQ(backend.nodes[0].parent, INVALID_HANDLE);

  for (size_t i = 1; i < backend.nodes.size(); ++i)
  {
    const NodeDesc& desc = backend.nodes[i];
    EXPECT_TRUE(desc.kind == NodeKind::Mesh);
    EXPECT_EQ(desc.parent, 0u);
    EXPECT_EQ(desc.mesh, 0u);
    EXPECT_EQ(desc.effect, 0u);
  }

  // transforms are local to the parent node
  EXPECT_EQ(backend.transforms[2].first, 2u);
  EXPECT_VEC3_NEAR(backend.transforms[2].second.off, vec3(2, 0, 0), 1e-6f);
}

//------------------------------------------------------------------------------
TEST_F(SceneBridgeTest, CameraParametersArePassedThrough)
{
  Build("default_scene");
  ASSERT_TRUE(BridgeScene(scene, &backend, &instance));

  const NodeDesc* camera = nullptr;
  for (const NodeDesc& desc : backend.nodes)
  {
    if (desc.kind == NodeKind::Camera)
      camera = &desc;
  }

  ASSERT_TRUE(camera != nullptr);
  EXPECT_EQ(camera->name, "Camera");
  EXPECT_NEAR(camera->camera.aspectRatio, scene.cameras[0]->aspectRatio, 0);
  EXPECT_NEAR(camera->camera.verticalFov, scene.cameras[0]->verticalFov, 0);
  EXPECT_EQ(camera->camera.viewportWidth, 1920);
  EXPECT_EQ(camera->camera.viewportHeight, 1080);
}

//------------------------------------------------------------------------------
TEST_F(SceneBridgeTest, RejectedMeshNamesMeshAndUser)
{
  Build("cube");
  backend.rejectMesh = "CubeMesh";

  EXPECT_FALSE(BridgeScene(scene, &backend, &instance));
  EXPECT_EQ(instance.errorKind, ExportError::NativeResourceRejected);
  EXPECT_NE(instance.error.find("Mesh 'CubeMesh' (used by 'Cube')"), string::npos);
  EXPECT_NE(instance.error.find("mesh rejected by test"), string::npos);
  EXPECT_TRUE(backend.nodes.empty());
}

//------------------------------------------------------------------------------
TEST_F(SceneBridgeTest, RejectedNodeStopsBridging)
{
  Build("shared_mesh");
  backend.rejectNode = "Cube.001";

  EXPECT_FALSE(BridgeScene(scene, &backend, &instance));
  EXPECT_EQ(instance.errorKind, ExportError::NativeResourceRejected);
  EXPECT_NE(instance.error.find("Node 'Cube.001'"), string::npos);
  // Group and Cube.000 made it through, nothing after the failure
  EXPECT_EQ(backend.nodes.size(), 2u);
}

//------------------------------------------------------------------------------
TEST_F(SceneBridgeTest, NativeSceneRejectsOutOfRangeIndex)
{
  Build("cube");
  scene.meshPool[0]->faces[3].c = 42;

  NativeScene native;
  EXPECT_FALSE(BridgeScene(scene, &native, &instance));
  EXPECT_EQ(instance.errorKind, ExportError::NativeResourceRejected);
  EXPECT_NE(instance.error.find("out of range"), string::npos);
}
