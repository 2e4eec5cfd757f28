#pragma once

class HostScene;
struct ExportInstance;

//-----------------------------------------------------------------------------
// Walks the host hierarchy depth first and fills instance->scene with one IR
// node per supported object, plus the deduplicated mesh and effect pools.
// Unsupported objects are skipped with a warning; their children are attached
// to the nearest exported ancestor.
bool TraverseScene(const HostScene& host, ExportInstance* instance);
