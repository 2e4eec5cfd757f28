#include "scene_traverser.hpp"
#include "export_camera.hpp"
#include "export_mesh.hpp"
#include "export_misc.hpp"
#include "exporter.hpp"
#include "transform_resolver.hpp"

namespace
{
  //-----------------------------------------------------------------------------
  struct Traverser
  {
    Traverser(ExportInstance* instance) : instance(instance) {}

    void VisitSiblings(const HostObject* first, ImBaseObject* parent, const Matrix& carry);
    void Visit(const HostObject* obj, ImBaseObject* parent, const Matrix& carry);
    ImBaseObject* ExportObject(const HostObject* obj, ImBaseObject* parent, const Matrix& carry);

    bool IsVisible(const HostObject* obj) const;

    ExportInstance* instance;
    unordered_set<const HostObject*> visited;
    // indices of the view layers with use set
    vector<int> layers;
  };

  //-----------------------------------------------------------------------------
  void Traverser::VisitSiblings(const HostObject* first, ImBaseObject* parent, const Matrix& carry)
  {
    for (const HostObject* obj = first; obj; obj = obj->GetNext())
    {
      if (visited.count(obj))
      {
        instance->Warn("Hierarchy cycle at '%s', skipping the repeated object", obj->GetName().c_str());
        instance->stats.skippedCount++;
        break;
      }
      Visit(obj, parent, carry);
    }
  }

  //-----------------------------------------------------------------------------
  bool Traverser::IsVisible(const HostObject* obj) const
  {
    for (int layer : layers)
    {
      if (!obj->IsExcludedFrom(layer))
        return true;
    }
    return false;
  }

  //-----------------------------------------------------------------------------
  void Traverser::Visit(const HostObject* obj, ImBaseObject* parent, const Matrix& carry)
  {
    visited.insert(obj);

    ImBaseObject* imObj = nullptr;
    if (!IsVisible(obj))
    {
      instance->Log(2, "Skipping '%s', not in any enabled view layer\n", obj->GetName().c_str());
      instance->stats.skippedCount++;
    }
    else
    {
      imObj = ExportObject(obj, parent, carry);
    }

    // children of a skipped object inherit its transform through the carry
    if (imObj)
      VisitSiblings(obj->GetDown(), imObj, Matrix());
    else
      VisitSiblings(obj->GetDown(), parent, carry * ComposeLocalMatrix(obj));
  }

  //-----------------------------------------------------------------------------
  ImBaseObject* Traverser::ExportObject(const HostObject* obj, ImBaseObject* parent, const Matrix& carry)
  {
    const string& name = obj->GetName();
    HostObjectType type = obj->GetType();

    switch (type)
    {
      case HostObjectType::Mesh:
      {
        instance->Log(1, "Exporting: %s\n", name.c_str());
        return ExportMesh(obj, parent, carry, instance);
      }

      case HostObjectType::Empty:
      {
        instance->Log(1, "Exporting: %s\n", name.c_str());
        return ExportNullObject(obj, parent, carry, instance);
      }

      case HostObjectType::Camera:
      {
        if (ImCamera* camera = ExportCamera(obj, parent, carry, instance))
        {
          instance->Log(1, "Exporting: %s\n", name.c_str());
          return camera;
        }
        instance->Warn("Skipping camera '%s' with unsupported projection", name.c_str());
        break;
      }

      case HostObjectType::Light:
      case HostObjectType::Curve:
      case HostObjectType::Surface:
      case HostObjectType::Text:
      case HostObjectType::Meta:
      case HostObjectType::Armature:
      case HostObjectType::Unknown:
      {
        instance->Warn("Skipping unsupported object '%s' (%s)", name.c_str(), HostObjectTypeName(type));
        break;
      }
    }

    instance->stats.skippedCount++;
    return nullptr;
  }
}

//-----------------------------------------------------------------------------
bool TraverseScene(const HostScene& host, ExportInstance* instance)
{
  if (!instance->scene)
    return instance->SetError(ExportError::InvalidScene, "No IR scene to fill");

  instance->Log(2, "Traversing scene '%s'\n", host.GetName().c_str());

  Traverser traverser(instance);
  int layerCount = host.GetViewLayerCount();
  if (layerCount == 0)
    traverser.layers.push_back(0);

  for (int i = 0; i < layerCount; ++i)
  {
    const HostViewLayer* layer = host.GetViewLayer(i);
    if (layer && layer->use)
    {
      instance->Log(2, "Using view layer '%s'\n", layer->name.c_str());
      traverser.layers.push_back(i);
    }
    else if (layer)
    {
      instance->Log(2, "Ignoring disabled view layer '%s'\n", layer->name.c_str());
    }
  }

  if (traverser.layers.empty())
    instance->Warn("Scene '%s' has no enabled view layer, nothing to export", host.GetName().c_str());

  traverser.VisitSiblings(host.GetFirstObject(), nullptr, Matrix());

  ImScene* scene = instance->scene;
  instance->Log(2,
      "Traversal done: %d nodes, %d meshes in pool, %d effects, %d skipped\n",
      scene->NodeCount(),
      (int)scene->meshPool.size(),
      (int)scene->effectPool.size(),
      instance->stats.skippedCount);

  return true;
}
