#include "fixture_scenes.hpp"
#include "exporter.hpp"
#include "exporter_utils.hpp"
#include "json_exporter.hpp"
#include "scene_file.hpp"

namespace
{
  //------------------------------------------------------------------------------
  string MakeCanonical(const string& str)
  {
    // convert back slashes to forward
    return ReplaceAll(str, '\\', '/');
  }

  //------------------------------------------------------------------------------
  void LogTimestamp(const ExportInstance& instance, const char* banner)
  {
    time_t t = time(0);
    struct tm* now = localtime(&t);
    instance.Log(1,
        "==] %s [%.*s] %.4d:%.2d:%.2d-%.2d:%.2d:%.2d ]==\n",
        banner,
        (int)(45 - strlen(banner)),
        "=============================================",
        now->tm_year + 1900,
        now->tm_mon + 1,
        now->tm_mday,
        now->tm_hour,
        now->tm_min,
        now->tm_sec);
  }

  //------------------------------------------------------------------------------
  void LogStats(const ExportInstance& instance)
  {
    const SceneStats& stats = instance.stats;
    instance.Log(2,
        "--> stats: \n"
        "    null objects: %d\n"
        "    cameras: %d\n"
        "    meshes: %d (%d mesh resources, %d effects)\n"
        "    skipped objects: %d\n"
        "    warnings: %d\n"
        "    string size: %.2f kb\n"
        "    effect size: %.2f kb\n"
        "    mesh size: %.2f kb\n"
        "    node size: %.2f kb\n"
        "    file size: %.2f kb\n",
        stats.nullObjectCount,
        stats.cameraCount,
        stats.meshCount,
        stats.meshResourceCount,
        stats.effectResourceCount,
        stats.skippedCount,
        (int)instance.warnings.size(),
        (float)stats.stringSize / 1024,
        (float)stats.effectSize / 1024,
        (float)stats.meshSize / 1024,
        (float)stats.nodeSize / 1024,
        (float)stats.dataSize / 1024);
  }

  //------------------------------------------------------------------------------
  HostMesh* AddCube(MemoryHostScene* scene, const string& name = "CubeMesh", float halfSize = 1.0f)
  {
    HostMesh* mesh = scene->AddMesh(name);
    MakeCubeMesh(mesh, halfSize);
    return mesh;
  }

  //------------------------------------------------------------------------------
  MemoryHostObject* AddDefaultCamera(MemoryHostScene* scene)
  {
    HostCamera cam;
    return scene->AddObject("Camera", HostObjectType::Camera)
        ->SetLocation(vec3(7.3589f, -6.9258f, 4.9583f))
        ->SetRotation(vec3(DegToRad(63.5593f), 0, DegToRad(46.6919f)))
        ->SetCamera(cam);
  }

  //------------------------------------------------------------------------------
  void BuildCube(MemoryHostScene* scene, Options*)
  {
    scene->AddMeshObject("Cube", AddCube(scene));
  }

  //------------------------------------------------------------------------------
  void BuildDefaultScene(MemoryHostScene* scene, Options*)
  {
    scene->AddMeshObject("Cube", AddCube(scene));
    scene->AddObject("Light", HostObjectType::Light)->SetLocation(vec3(4.0762f, 1.0055f, 5.9039f));
    AddDefaultCamera(scene);
  }

  //------------------------------------------------------------------------------
  void BuildCubeCustomGlsl(MemoryHostScene* scene, Options* options)
  {
    HostMesh* mesh = AddCube(scene);
    scene->AddMeshObject("CubeRed", mesh)->SetLocation(vec3(2, 2, 2));
    scene->AddMeshObject("CubeWhite", mesh);
    options->customGlslObjects.push_back("CubeRed");
  }

  //------------------------------------------------------------------------------
  void BuildCubeRotatedX30(MemoryHostScene* scene, Options*)
  {
    scene->AddMeshObject("Cube", AddCube(scene))->SetRotation(vec3(DegToRad(30), 0, 0));
  }

  //------------------------------------------------------------------------------
  void BuildCubeRotatedX30Y45Z60(MemoryHostScene* scene, Options*)
  {
    scene->AddMeshObject("Cube", AddCube(scene))->SetRotation(vec3(DegToRad(30), DegToRad(45), DegToRad(60)));
  }

  //------------------------------------------------------------------------------
  void BuildCubeRotatedXZY(MemoryHostScene* scene, Options*)
  {
    scene->AddMeshObject("Cube", AddCube(scene))
        ->SetRotation(vec3(DegToRad(30), DegToRad(45), DegToRad(60)), RotationOrder::XZY);
  }

  //------------------------------------------------------------------------------
  void BuildCubeScaledY(MemoryHostScene* scene, Options*)
  {
    scene->AddMeshObject("Cube", AddCube(scene))->SetScale(vec3(1, 2, 1));
  }

  //------------------------------------------------------------------------------
  void BuildCubeScaledXYZ(MemoryHostScene* scene, Options*)
  {
    scene->AddMeshObject("Cube", AddCube(scene))->SetScale(vec3(2, 2, 2));
  }

  //------------------------------------------------------------------------------
  void BuildLayersOneCollectionExcluded(MemoryHostScene* scene, Options*)
  {
    HostMesh* mesh = AddCube(scene);
    // hidden is excluded from both enabled layers
    scene->AddViewLayer("ViewLayer.001");
    int visible = scene->AddCollection("Visible");
    int hidden = scene->AddCollection("Hidden", true);

    MemoryHostObject* a = scene->AddMeshObject("CubeVisible", mesh)->SetLocation(vec3(-3, 0, 0));
    scene->LinkToCollection(a, visible);

    MemoryHostObject* b = scene->AddMeshObject("CubeHidden", mesh)->SetLocation(vec3(3, 0, 0));
    scene->LinkToCollection(b, hidden);

    // linked to a visible collection, so it survives its hidden parent
    MemoryHostObject* c = scene->AddMeshObject("CubeHiddenChild", mesh, b)->SetLocation(vec3(0, 0, 3));
    scene->LinkToCollection(c, visible);

    AddDefaultCamera(scene);
  }

  //------------------------------------------------------------------------------
  void BuildLayersOneDisabled(MemoryHostScene* scene, Options*)
  {
    HostMesh* mesh = AddCube(scene);
    int disabled = scene->AddViewLayer("DisabledLayer", false);
    int collection1 = scene->AddCollection("Collection1");
    int collection2 = scene->AddCollection("Collection2");

    // only the disabled layer sees Collection1
    for (int layer = 0; layer < scene->GetViewLayerCount(); ++layer)
    {
      if (layer != disabled)
        scene->ExcludeFromLayer(collection1, layer);
    }

    scene->AddMeshObject("Cube", mesh);

    MemoryHostObject* a = scene->AddMeshObject("CubeInCollection2", mesh)->SetLocation(vec3(0, 3, 0));
    scene->LinkToCollection(a, collection2);

    MemoryHostObject* b = scene->AddMeshObject("CubeInDisabledLayer", mesh)->SetLocation(vec3(0, -3, 0));
    scene->LinkToCollection(b, collection1);

    AddDefaultCamera(scene);
  }

  //------------------------------------------------------------------------------
  void BuildMirrorCube(MemoryHostScene* scene, Options*)
  {
    HostMesh* mesh = AddCube(scene, "OffsetCubeMesh", 0.5f);
    for (vec3& v : mesh->vertices)
      v += vec3(2, 0, 0);

    scene->AddMeshObject("Cube", mesh);

    HostModifier mirror;
    mirror.name = "Mirror";
    mirror.type = HostModifier::Type::Mirror;
    scene->AddMeshObject("CubeMirrored", mesh)->SetLocation(vec3(0, 3, 0))->AddModifier(mirror);
  }

  //------------------------------------------------------------------------------
  void BuildArrayCube(MemoryHostScene* scene, Options*)
  {
    HostModifier array;
    array.name = "Array";
    array.type = HostModifier::Type::Array;
    array.count = 3;
    array.relativeOffset = vec3(1.5f, 0, 0);

    HostModifier disabled;
    disabled.name = "MirrorViewportOnly";
    disabled.type = HostModifier::Type::Mirror;
    disabled.enabled = false;

    scene->AddMeshObject("CubeArray", AddCube(scene))->AddModifier(array)->AddModifier(disabled);
  }

  //------------------------------------------------------------------------------
  void BuildSharedMesh(MemoryHostScene* scene, Options*)
  {
    HostMesh* mesh = AddCube(scene, "SharedCube", 0.5f);
    MemoryHostObject* group = scene->AddObject("Group", HostObjectType::Empty)->SetLocation(vec3(0, 0, 1));
    for (int i = 0; i < 4; ++i)
    {
      char name[32];
      snprintf(name, sizeof(name), "Cube.%03d", i);
      scene->AddMeshObject(name, mesh, group)->SetLocation(vec3(2.0f * i, 0, 0));
    }
  }

  //------------------------------------------------------------------------------
  void BuildMixedUnsupported(MemoryHostScene* scene, Options*)
  {
    HostMesh* mesh = AddCube(scene);
    scene->AddMeshObject("Cube", mesh);
    scene->AddObject("Light", HostObjectType::Light)->SetLocation(vec3(4, 1, 6));

    MemoryHostObject* curve = scene->AddObject("BezierCurve", HostObjectType::Curve)->SetLocation(vec3(0, 2, 0));
    scene->AddMeshObject("CubeOnCurve", mesh, curve)->SetLocation(vec3(0, 0, 1));

    scene->AddObject("Label", HostObjectType::Text);
    scene->AddObject("SurfacePatch", HostObjectType::Surface);
    scene->AddObject("Metaball", HostObjectType::Meta);

    HostCamera ortho;
    ortho.projection = HostCamera::Projection::Orthographic;
    scene->AddObject("OrthoCamera", HostObjectType::Camera)->SetCamera(ortho);

    AddDefaultCamera(scene);
  }

  //------------------------------------------------------------------------------
  void BuildEmptyMesh(MemoryHostScene* scene, Options*)
  {
    scene->AddMeshObject("Cube", AddCube(scene));
    scene->AddMeshObject("Empty", scene->AddMesh("EmptyMesh"));
  }
}

//------------------------------------------------------------------------------
const vector<FixtureScene>& FixtureScenes()
{
  static const vector<FixtureScene> fixtures = {
      {"cube", "single unit cube", BuildCube, false},
      {"default_scene", "cube, light and camera", BuildDefaultScene, false},
      {"cube_custom_glsl", "red cube at (2,2,2) with custom GLSL next to a default cube", BuildCubeCustomGlsl, false},
      {"cube_rotated_X30", "cube rotated 30 degrees around X", BuildCubeRotatedX30, false},
      {"cube_rotated_X30Y45Z60", "cube rotated (30, 45, 60) degrees, XYZ order", BuildCubeRotatedX30Y45Z60, false},
      {"cube_rotated_XZY", "cube rotated (30, 45, 60) degrees, XZY order", BuildCubeRotatedXZY, false},
      {"cube_scaledY", "cube scaled by 2 along Y", BuildCubeScaledY, false},
      {"cube_scaledXYZ", "cube scaled by 2", BuildCubeScaledXYZ, false},
      {"layers_one_collection_excluded", "two collections, one excluded", BuildLayersOneCollectionExcluded, false},
      {"layers_one_disabled", "two view layers, one disabled", BuildLayersOneDisabled, false},
      {"mirror_cube", "cube with and without a mirror modifier", BuildMirrorCube, false},
      {"array_cube", "cube with an array modifier", BuildArrayCube, false},
      {"shared_mesh", "four cubes sharing one mesh under an empty", BuildSharedMesh, false},
      {"mixed_unsupported", "supported objects mixed with unsupported ones", BuildMixedUnsupported, false},
      {"empty_mesh", "mesh without vertices, rejected by validation", BuildEmptyMesh, true},
  };
  return fixtures;
}

//------------------------------------------------------------------------------
const FixtureScene* FindFixture(const string& name)
{
  for (const FixtureScene& f : FixtureScenes())
  {
    if (name == f.name)
      return &f;
  }
  return nullptr;
}

//------------------------------------------------------------------------------
bool ExportFixture(const FixtureScene& fixture, const Options& baseOptions)
{
  ExportInstance instance;
  instance.options = baseOptions;

  string outputFilename = MakeCanonical(baseOptions.outputDirectory) + "/" + fixture.name + ".sgx";

  // skip outputs that already exist unless forced
  if (!instance.options.force && FileExists(outputFilename))
  {
    instance.Log(1, "Skipping %s, %s already exists (use --force)\n", fixture.name, outputFilename.c_str());
    return true;
  }

  instance.options.logfile = fopen((outputFilename + ".log").c_str(), "at");

  LogTimestamp(instance, "STARTING");
  instance.Log(1, "%s (%s) -> %s\n", fixture.name, fixture.description, outputFilename.c_str());

  MemoryHostScene scene(fixture.name);
  fixture.build(&scene, &instance.options);

  bool res = ExportScene(scene, outputFilename, &instance);

  if (res)
  {
    LogStats(instance);

    if (instance.options.dump)
    {
      NativeSceneData data;
      string error;
      JsonExporter exporter(data);
      if (!LoadSceneFile(outputFilename, &data, &error) || !exporter.ExportToFile(outputFilename + ".json", &error))
      {
        instance.Log(0, "Unable to dump %s: %s\n", outputFilename.c_str(), error.c_str());
        res = false;
      }
    }
  }
  else if (fixture.expectFailure)
  {
    instance.Log(1, "Export failed as expected (%s): %s\n",
        ExportErrorName(instance.errorKind), instance.error.c_str());
    res = true;
  }

  if (res && fixture.expectFailure && instance.errorKind == ExportError::None)
  {
    instance.Log(0, "Expected %s to be rejected, but it exported\n", fixture.name);
    res = false;
  }

  LogTimestamp(instance, "DONE");

  if (instance.options.logfile)
    fclose(instance.options.logfile);

  return res;
}
