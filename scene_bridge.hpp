#pragma once

struct ImScene;
struct ExportInstance;
class SceneBackend;

//-----------------------------------------------------------------------------
// Creates one mesh resource per pool mesh, one effect resource per pool
// effect, then one node plus one SetTransform per IR object (depth first).
// Stops at the first rejection and records which IR entity failed.
bool BridgeScene(const ImScene& scene, SceneBackend* backend, ExportInstance* instance);
