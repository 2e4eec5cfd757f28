//-----------------------------------------------------------------------------
// sgx scene-graph exporter, command line front end
//-----------------------------------------------------------------------------

#include "arg_parse.hpp"
#include "exporter.hpp"
#include "exporter_utils.hpp"
#include "fixture_scenes.hpp"
#include "json_exporter.hpp"

#ifndef SGX_DEFAULT_SHADER_DIR
#define SGX_DEFAULT_SHADER_DIR ""
#endif

//-----------------------------------------------------------------------------
namespace
{
  //------------------------------------------------------------------------------
  bool InspectFile(const string& filename)
  {
    NativeSceneData data;
    string error;
    if (!LoadSceneFile(filename, &data, &error))
    {
      fprintf(stderr, "Unable to load %s: %s\n", filename.c_str(), error.c_str());
      return false;
    }

    JsonExporter exporter(data);
    fputs(exporter.Export().c_str(), stdout);
    return true;
  }
}

//-----------------------------------------------------------------------------
int main(int argc, char** argv)
{
  Options options;
  bool noCompressIndices = false;
  bool list = false;
  string customGlsl;
  string inspect;

  ArgParse parser;
  parser.AddFlag(nullptr, "no-compress-indices", &noCompressIndices);
  parser.AddFlag("f", "force", &options.force);
  parser.AddFlag(nullptr, "dump", &options.dump);
  parser.AddFlag(nullptr, "list", &list);
  parser.AddIntArgument(nullptr, "loglevel", &options.loglevel);
  parser.AddStringArgument("o", nullptr, &options.outputDirectory);
  parser.AddStringArgument(nullptr, "shader-dir", &options.shaderDir);
  parser.AddStringArgument(nullptr, "custom-glsl", &customGlsl);
  parser.AddStringArgument(nullptr, "inspect", &inspect);

  if (!parser.Parse(argc - 1, argv + 1))
  {
    fprintf(stderr, "%s", parser.error.c_str());
    return 1;
  }

  if (list)
  {
    for (const FixtureScene& f : FixtureScenes())
      printf("%-32s %s\n", f.name, f.description);
    return 0;
  }

  if (!inspect.empty())
    return InspectFile(inspect) ? 0 : 2;

  if (parser.positional.empty())
  {
    fprintf(stderr,
        "usage: sgx_export [-o dir] [--loglevel n] [-f] [--shader-dir dir] [--custom-glsl a,b] "
        "[--no-compress-indices] [--dump] <fixture...|all>\n"
        "       sgx_export --list\n"
        "       sgx_export --inspect file.sgx\n");
    return 1;
  }

  options.compressIndices = !noCompressIndices;
  options.customGlslObjects = SplitString(customGlsl, ',');
  if (options.shaderDir.empty())
    options.shaderDir = SGX_DEFAULT_SHADER_DIR;

  vector<const FixtureScene*> fixtures;
  for (const string& name : parser.positional)
  {
    if (name == "all")
    {
      for (const FixtureScene& f : FixtureScenes())
        fixtures.push_back(&f);
      continue;
    }

    const FixtureScene* f = FindFixture(name);
    if (!f)
    {
      fprintf(stderr, "Unknown fixture: %s (see --list)\n", name.c_str());
      return 1;
    }
    fixtures.push_back(f);
  }

  int failed = 0;
  for (const FixtureScene* f : fixtures)
  {
    if (!ExportFixture(*f, options))
      failed++;
  }

  if (failed)
  {
    fprintf(stderr, "%d of %d exports failed\n", failed, (int)fixtures.size());
    return 2;
  }

  return 0;
}
