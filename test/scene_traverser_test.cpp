#include "test_utils.hpp"
#include "export_camera.hpp"

namespace
{
  //------------------------------------------------------------------------------
  class SceneTraverserTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      SilenceLog(&instance);
    }

    MemoryHostScene host;
    ImScene scene;
    ExportInstance instance;
  };
}

//------------------------------------------------------------------------------
TEST_F(SceneTraverserTest, UnsupportedObjectsAreSkippedWithOneWarningEach)
{
  BuildFixture("mixed_unsupported", &host, &instance.options);
  ASSERT_TRUE(BuildIr(host, &scene, &instance));

  EXPECT_EQ(instance.warnings.size(), 6u);
  EXPECT_EQ(instance.stats.skippedCount, 6);
  EXPECT_EQ(instance.errorKind, ExportError::None);

  ASSERT_EQ(scene.NodeCount(), 3);
  EXPECT_EQ(scene.objects[0]->name, "Cube");
  EXPECT_EQ(scene.objects[1]->name, "CubeOnCurve");
  EXPECT_EQ(scene.objects[2]->name, "Camera");

  bool lightWarned = false;
  for (const string& w : instance.warnings)
    lightWarned |= w.find("'Light'") != string::npos && w.find("LIGHT") != string::npos;
  EXPECT_TRUE(lightWarned);

  EXPECT_TRUE(scene.FindObject("OrthoCamera") == nullptr);
  EXPECT_TRUE(scene.FindObject("Light") == nullptr);
  EXPECT_EQ(scene.objects[0]->hostObj, host.FindObject("Cube"));
}

//------------------------------------------------------------------------------
TEST_F(SceneTraverserTest, ChildOfSkippedObjectInheritsItsTransform)
{
  BuildFixture("mixed_unsupported", &host, &instance.options);
  ASSERT_TRUE(BuildIr(host, &scene, &instance));

  ImBaseObject* obj = scene.FindObject("CubeOnCurve");
  ASSERT_TRUE(obj != nullptr);
  EXPECT_TRUE(obj->parent == nullptr);
  EXPECT_VEC3_NEAR(obj->carry.off, vec3(0, 2, 0), 1e-6f);
  EXPECT_VEC3_NEAR(obj->xformGlobal.pos, vec3(0, 2, 1), 1e-6f);
}

//------------------------------------------------------------------------------
TEST_F(SceneTraverserTest, ExcludedCollectionSkipsObjectButNotVisibleChild)
{
  BuildFixture("layers_one_collection_excluded", &host, &instance.options);
  ASSERT_TRUE(BuildIr(host, &scene, &instance));

  EXPECT_TRUE(scene.FindObject("CubeHidden") == nullptr);
  EXPECT_TRUE(instance.warnings.empty());
  EXPECT_EQ(instance.stats.skippedCount, 1);

  ImBaseObject* child = scene.FindObject("CubeHiddenChild");
  ASSERT_TRUE(child != nullptr);
  EXPECT_TRUE(child->parent == nullptr);
  EXPECT_VEC3_NEAR(child->xformGlobal.pos, vec3(3, 0, 3), 1e-6f);

  ImBaseObject* visible = scene.FindObject("CubeVisible");
  ASSERT_TRUE(visible != nullptr);
  EXPECT_VEC3_NEAR(visible->xformGlobal.pos, vec3(-3, 0, 0), 1e-6f);
}

//------------------------------------------------------------------------------
TEST_F(SceneTraverserTest, ObjectLinkedToNoCollectionIsExported)
{
  host.AddCollection("Hidden", true);
  host.AddMeshObject("Loose", nullptr);
  ASSERT_TRUE(BuildIr(host, &scene, &instance));
  EXPECT_TRUE(scene.FindObject("Loose") != nullptr);
}

//------------------------------------------------------------------------------
TEST_F(SceneTraverserTest, DisabledViewLayerContributesNothing)
{
  BuildFixture("layers_one_disabled", &host, &instance.options);
  ASSERT_TRUE(BuildIr(host, &scene, &instance));

  EXPECT_TRUE(instance.warnings.empty());
  EXPECT_EQ(instance.stats.skippedCount, 1);
  ASSERT_EQ(scene.NodeCount(), 3);
  EXPECT_EQ(scene.objects[0]->name, "Cube");
  EXPECT_EQ(scene.objects[1]->name, "CubeInCollection2");
  EXPECT_EQ(scene.objects[2]->name, "Camera");
  EXPECT_TRUE(scene.FindObject("CubeInDisabledLayer") == nullptr);
  EXPECT_EQ(scene.meshPool.size(), 1u);
}

//------------------------------------------------------------------------------
TEST_F(SceneTraverserTest, ObjectVisibleInAnyEnabledLayerIsExported)
{
  host.AddViewLayer("Second");
  int collection = host.AddCollection("Collection");
  host.ExcludeFromLayer(collection, 0);

  MemoryHostObject* obj = host.AddMeshObject("OnlyInSecond", nullptr);
  host.LinkToCollection(obj, collection);
  ASSERT_TRUE(BuildIr(host, &scene, &instance));
  EXPECT_TRUE(scene.FindObject("OnlyInSecond") != nullptr);

  // excluded from every layer now
  MemoryHostScene other;
  ImScene otherScene;
  int c = other.AddCollection("Collection");
  int otherSecond = other.AddViewLayer("Second");
  other.ExcludeFromLayer(c, 0);
  other.ExcludeFromLayer(c, otherSecond);
  other.LinkToCollection(other.AddMeshObject("Hidden", nullptr), c);
  ASSERT_TRUE(BuildIr(other, &otherScene, &instance));
  EXPECT_EQ(otherScene.NodeCount(), 0);
}

//------------------------------------------------------------------------------
TEST_F(SceneTraverserTest, SceneWithoutEnabledLayerExportsNothing)
{
  host.viewLayers[0].use = false;
  host.AddMeshObject("Cube", nullptr);
  ASSERT_TRUE(BuildIr(host, &scene, &instance));

  EXPECT_EQ(scene.NodeCount(), 0);
  ASSERT_EQ(instance.warnings.size(), 1u);
  EXPECT_NE(instance.warnings[0].find("no enabled view layer"), string::npos);
}

//------------------------------------------------------------------------------
TEST_F(SceneTraverserTest, SharedMeshIsConvertedOnce)
{
  BuildFixture("shared_mesh", &host, &instance.options);
  ASSERT_TRUE(BuildIr(host, &scene, &instance));

  EXPECT_EQ(scene.meshes.size(), 4u);
  EXPECT_EQ(scene.nullObjects.size(), 1u);
  ASSERT_EQ(scene.meshPool.size(), 1u);
  EXPECT_EQ(scene.effectPool.size(), 1u);
  EXPECT_EQ(scene.meshPool[0]->name, "SharedCube");

  ImBaseObject* group = scene.FindObject("Group");
  ASSERT_TRUE(group != nullptr);
  EXPECT_EQ(group->children.size(), 4u);
  for (ImMesh* mesh : scene.meshes)
  {
    EXPECT_EQ(mesh->parent, group);
    EXPECT_EQ(mesh->meshData, scene.meshPool[0].get());
  }

  EXPECT_VEC3_NEAR(scene.FindObject("Cube.003")->xformGlobal.pos, vec3(6, 0, 1), 1e-6f);
  EXPECT_VEC3_NEAR(scene.FindObject("Cube.003")->xformLocal.pos, vec3(6, 0, 0), 1e-6f);
}

//------------------------------------------------------------------------------
TEST_F(SceneTraverserTest, CubeIsFanTriangulatedWithUnitNormals)
{
  BuildFixture("cube", &host, &instance.options);
  ASSERT_TRUE(BuildIr(host, &scene, &instance));

  ASSERT_EQ(scene.meshPool.size(), 1u);
  const ImMeshData& data = *scene.meshPool[0];
  EXPECT_EQ(data.vertices.size(), 8u);
  EXPECT_EQ(data.faces.size(), 12u);
  ASSERT_EQ(data.normals.size(), 8u);

  // every corner normal points away from the center
  for (size_t i = 0; i < data.vertices.size(); ++i)
  {
    EXPECT_NEAR(Length(data.normals[i]), 1.0f, 1e-5f);
    EXPECT_GT(Dot(data.normals[i], data.vertices[i]), 0.0f);
  }

  EXPECT_VEC3_NEAR(data.aabb.minValue, vec3(-1, -1, -1), 0);
  EXPECT_VEC3_NEAR(data.aabb.maxValue, vec3(1, 1, 1), 0);
  EXPECT_NEAR(data.boundingSphere.radius, sqrtf(3.0f), 1e-5f);
}

//------------------------------------------------------------------------------
TEST_F(SceneTraverserTest, DegeneratePolygonsAreDropped)
{
  HostMesh* mesh = host.AddMesh("Broken");
  mesh->vertices = {vec3(0, 0, 0), vec3(1, 0, 0), vec3(0, 1, 0)};
  mesh->polygons = {HostPolygon{{0, 1}}, HostPolygon{{0, 1, 2}}, HostPolygon{{}}};
  host.AddMeshObject("Broken", mesh);

  ASSERT_TRUE(BuildIr(host, &scene, &instance));
  ASSERT_EQ(scene.meshPool.size(), 1u);
  EXPECT_EQ(scene.meshPool[0]->faces.size(), 1u);
}

//------------------------------------------------------------------------------
TEST_F(SceneTraverserTest, MeshObjectWithoutDataGetsEmptyEntry)
{
  host.AddMeshObject("NoData", nullptr);
  ASSERT_TRUE(BuildIr(host, &scene, &instance));

  ASSERT_EQ(scene.meshPool.size(), 1u);
  EXPECT_EQ(scene.meshPool[0]->name, "NoData");
  EXPECT_TRUE(scene.meshPool[0]->vertices.empty());
  EXPECT_TRUE(scene.meshPool[0]->aabb.IsEmpty());
}

//------------------------------------------------------------------------------
TEST_F(SceneTraverserTest, SiblingCycleStopsAtRepeatedObject)
{
  MemoryHostObject* a = host.AddObject("A", HostObjectType::Empty);
  MemoryHostObject* b = host.AddObject("B", HostObjectType::Empty);
  b->next = a;

  ASSERT_TRUE(BuildIr(host, &scene, &instance));
  EXPECT_EQ(scene.NodeCount(), 2);
  ASSERT_EQ(instance.warnings.size(), 1u);
  EXPECT_NE(instance.warnings[0].find("cycle"), string::npos);
}

//------------------------------------------------------------------------------
TEST_F(SceneTraverserTest, ChildPointingBackAtParentIsNotVisitedTwice)
{
  MemoryHostObject* a = host.AddObject("A", HostObjectType::Empty);
  MemoryHostObject* c = host.AddObject("C", HostObjectType::Empty, a);
  c->next = a;

  ASSERT_TRUE(BuildIr(host, &scene, &instance));
  EXPECT_EQ(scene.NodeCount(), 2);
  EXPECT_EQ(instance.warnings.size(), 1u);
  EXPECT_EQ(scene.FindObject("C")->parent, scene.FindObject("A"));
}

//------------------------------------------------------------------------------
TEST_F(SceneTraverserTest, PerspectiveCameraGetsVerticalFovFromAspect)
{
  BuildFixture("default_scene", &host, &instance.options);
  ASSERT_TRUE(BuildIr(host, &scene, &instance));

  ASSERT_EQ(scene.cameras.size(), 1u);
  const ImCamera* camera = scene.cameras[0];
  HostCamera ref;
  EXPECT_NEAR(camera->aspectRatio, 1920.0f / 1080.0f, 1e-6f);
  EXPECT_NEAR(camera->verticalFov, 2 * atanf(tanf(ref.fov / 2) * 1080.0f / 1920.0f), 1e-5f);
  EXPECT_EQ(camera->viewportWidth, 1920);
  EXPECT_EQ(camera->viewportHeight, 1080);
  EXPECT_NEAR(camera->nearPlane, 0.1f, 1e-6f);
  EXPECT_NEAR(camera->farPlane, 100.0f, 1e-6f);

  // the light in the default scene is not exported
  EXPECT_EQ(instance.warnings.size(), 1u);
}

//------------------------------------------------------------------------------
TEST_F(SceneTraverserTest, CameraWithEmptyResolutionIsSquare)
{
  HostCamera cam;
  cam.resolutionX = 0;
  cam.nearPlane = 0;
  cam.farPlane = -1;
  host.AddObject("Camera", HostObjectType::Camera)->SetCamera(cam);

  ASSERT_TRUE(BuildIr(host, &scene, &instance));
  ASSERT_EQ(scene.cameras.size(), 1u);
  EXPECT_NEAR(scene.cameras[0]->aspectRatio, 1.0f, 1e-6f);
  EXPECT_NEAR(scene.cameras[0]->nearPlane, 0.1f, 1e-6f);
  EXPECT_NEAR(scene.cameras[0]->farPlane, 100.0f, 1e-6f);
}

//------------------------------------------------------------------------------
TEST(CalcVerticalFovTest, SensorFit)
{
  HostCamera cam;
  cam.fov = 1.0f;
  cam.verticalFov = 0.5f;

  // landscape, auto fit: fov is horizontal
  EXPECT_NEAR(CalcVerticalFov(cam, 200, 100), 2 * atanf(tanf(0.5f) / 2), 1e-6f);
  // portrait, auto fit: the vertical fov is used as is
  EXPECT_NEAR(CalcVerticalFov(cam, 100, 200), 0.5f, 1e-6f);

  cam.sensorFit = HostCamera::SensorFit::Vertical;
  EXPECT_NEAR(CalcVerticalFov(cam, 200, 100), 0.5f, 1e-6f);

  cam.sensorFit = HostCamera::SensorFit::Horizontal;
  EXPECT_NEAR(CalcVerticalFov(cam, 100, 200), 2 * atanf(tanf(0.5f) * 2), 1e-6f);
}

//------------------------------------------------------------------------------
TEST_F(SceneTraverserTest, CustomGlslIsLoadedForListedObjects)
{
  BuildFixture("cube_custom_glsl", &host, &instance.options);
  instance.options.shaderDir = SGX_TEST_SHADER_DIR;
  ASSERT_TRUE(BuildIr(host, &scene, &instance));

  EXPECT_TRUE(instance.warnings.empty());
  ASSERT_EQ(scene.effectPool.size(), 2u);
  EXPECT_EQ(scene.meshPool.size(), 1u);

  const ImMesh* red = (const ImMesh*)scene.FindObject("CubeRed");
  const ImMesh* white = (const ImMesh*)scene.FindObject("CubeWhite");
  ASSERT_TRUE(red && white);
  EXPECT_EQ(red->effect->name, "CubeRed");
  EXPECT_NE(red->effect->fragmentShader.find("vec4(1.0, 0.0, 0.0, 1.0)"), string::npos);
  EXPECT_EQ(white->effect->name, "default");
  EXPECT_EQ(red->meshData, white->meshData);
}

//------------------------------------------------------------------------------
TEST_F(SceneTraverserTest, MissingCustomGlslFallsBackToDefault)
{
  BuildFixture("cube_custom_glsl", &host, &instance.options);
  instance.options.shaderDir = "/nonexistent/sgx/shaders";
  ASSERT_TRUE(BuildIr(host, &scene, &instance));

  EXPECT_EQ(instance.warnings.size(), 1u);
  ASSERT_EQ(scene.effectPool.size(), 1u);
  EXPECT_EQ(scene.effectPool[0]->name, "default");
}
