#include "export_misc.hpp"
#include "exporter.hpp"
#include "exporter_utils.hpp"

//-----------------------------------------------------------------------------
static const char* DEFAULT_VERTEX_SHADER = R"(#version 300 es

in vec3 a_position;
uniform highp mat4 u_ModelMatrix;
uniform highp mat4 u_ViewMatrix;
uniform highp mat4 u_ProjectionMatrix;

void main()
{
  gl_Position = u_ProjectionMatrix * u_ViewMatrix * u_ModelMatrix * vec4(a_position.xyz, 1.0);
}
)";

static const char* DEFAULT_FRAGMENT_SHADER = R"(#version 300 es

precision mediump float;
out vec4 FragColor;

void main(void)
{
  FragColor = vec4(1.0, 1.0, 1.0, 1.0);
}
)";

//-----------------------------------------------------------------------------
void DefaultShaders(string* vertexShader, string* fragmentShader)
{
  *vertexShader = DEFAULT_VERTEX_SHADER;
  *fragmentShader = DEFAULT_FRAGMENT_SHADER;
}

//-----------------------------------------------------------------------------
static bool LoadCustomShaders(const string& objName, ExportInstance* instance, string* vs, string* fs)
{
  const Options& options = instance->options;
  if (find(options.customGlslObjects.begin(), options.customGlslObjects.end(), objName)
      == options.customGlslObjects.end())
    return false;

  if (options.shaderDir.empty())
  {
    instance->Warn("No shader directory set for custom GLSL of '%s', using the default effect", objName.c_str());
    return false;
  }

  string prefix = ReplaceAll(options.shaderDir, '\\', '/') + "/" + objName;
  string vertexFile = prefix + ".vert";
  string fragmentFile = prefix + ".frag";

  if (!ReadTextFile(vertexFile, vs))
  {
    instance->Warn("Unable to read vertex shader '%s', using the default effect", vertexFile.c_str());
    return false;
  }

  if (!ReadTextFile(fragmentFile, fs))
  {
    instance->Warn("Unable to read fragment shader '%s', using the default effect", fragmentFile.c_str());
    return false;
  }

  instance->Log(2, "  Loaded custom GLSL for '%s' from %s.{vert,frag}\n", objName.c_str(), prefix.c_str());
  return true;
}

//-----------------------------------------------------------------------------
ImEffect* ExportEffect(const string& objName, ExportInstance* instance)
{
  string vs, fs;
  bool custom = LoadCustomShaders(objName, instance, &vs, &fs);
  if (!custom)
    DefaultShaders(&vs, &fs);

  ImScene* scene = instance->scene;
  if (ImEffect* existing = scene->FindEffect(vs, fs))
    return existing;

  unique_ptr<ImEffect> effect = make_unique<ImEffect>();
  effect->name = custom ? objName : "default";
  effect->vertexShader = vs;
  effect->fragmentShader = fs;
  return scene->AddEffect(std::move(effect));
}

//-----------------------------------------------------------------------------
ImNullObject* ExportNullObject(const HostObject* obj, ImBaseObject* parent, const Matrix& carry, ExportInstance* instance)
{
  unique_ptr<ImNullObject> nullObject = make_unique<ImNullObject>(obj, parent);
  nullObject->carry = carry;
  return instance->scene->AddObject(std::move(nullObject));
}
