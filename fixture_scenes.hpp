#pragma once
#include "memory_host_scene.hpp"

struct Options;

//------------------------------------------------------------------------------
// Built-in scenes used by the command line tool and the tests.
struct FixtureScene
{
  const char* name;
  const char* description;
  void (*build)(MemoryHostScene* scene, Options* options);
  // the export is expected to be rejected
  bool expectFailure;
};

const vector<FixtureScene>& FixtureScenes();
const FixtureScene* FindFixture(const string& name);

// Exports 'fixture' to <outputDirectory>/<name>.sgx, appending to <name>.sgx.log.
// Returns false when the outcome doesn't match expectFailure.
bool ExportFixture(const FixtureScene& fixture, const Options& options);
