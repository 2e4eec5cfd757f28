#include "test_utils.hpp"
#include "json_exporter.hpp"
#include "json_writer.hpp"

//------------------------------------------------------------------------------
TEST(JsonWriterTest, EscapesStrings)
{
  EXPECT_EQ(JsonWriter::Escape("a\"b\\c\n"), "a\\\"b\\\\c\\n");
  EXPECT_EQ(JsonWriter::Escape(string("\x01", 1)), "\\u0001");
}

//------------------------------------------------------------------------------
TEST(JsonWriterTest, NonFiniteFloatsBecomeNull)
{
  JsonWriter w;
  {
    JsonWriter::JsonScope s(&w, JsonWriter::CompoundType::Object);
    w.Emit("bad", NAN);
    w.Emit("good", 0.5f);
  }
  EXPECT_EQ(w.res, "{\n  \"bad\": null,\n  \"good\": 0.5\n}");
}

//------------------------------------------------------------------------------
TEST(JsonExporterTest, DescribesExportedScene)
{
  TempDir dir;
  MemoryHostScene host("cube_scene");
  ExportInstance instance;
  SilenceLog(&instance);
  FindFixture("default_scene")->build(&host, &instance.options);

  string path = dir.File("scene.sgx");
  ASSERT_TRUE(ExportScene(host, path, &instance)) << instance.error;

  NativeSceneData data;
  string error;
  ASSERT_TRUE(LoadSceneFile(path, &data, &error)) << error;

  JsonExporter exporter(data);
  string json = exporter.Export();
  EXPECT_NE(json.find("\"name\": \"cube_scene\""), string::npos);
  EXPECT_NE(json.find("\"kind\": \"mesh\""), string::npos);
  EXPECT_NE(json.find("\"kind\": \"camera\""), string::npos);
  EXPECT_NE(json.find("\"vertexCount\": 8"), string::npos);
  EXPECT_NE(json.find("\"viewport\": ["), string::npos);

  string jsonPath = path + ".json";
  ASSERT_TRUE(exporter.ExportToFile(jsonPath, &error)) << error;
  string contents;
  ASSERT_TRUE(ReadTextFile(jsonPath, &contents));
  EXPECT_EQ(contents, json);
}
