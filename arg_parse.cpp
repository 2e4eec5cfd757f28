#include "arg_parse.hpp"

//------------------------------------------------------------------------------
void ArgParse::AddOption(const char* shortName, const char* longName, Type type, void* out)
{
  _options.push_back(Option{shortName ? shortName : "", longName ? longName : "", type, out});
}

//------------------------------------------------------------------------------
void ArgParse::AddFlag(const char* shortName, const char* longName, bool* out)
{
  AddOption(shortName, longName, Type::Flag, out);
}

//------------------------------------------------------------------------------
void ArgParse::AddIntArgument(const char* shortName, const char* longName, int* out)
{
  AddOption(shortName, longName, Type::Int, out);
}

//------------------------------------------------------------------------------
void ArgParse::AddStringArgument(const char* shortName, const char* longName, string* out)
{
  AddOption(shortName, longName, Type::String, out);
}

//------------------------------------------------------------------------------
ArgParse::Option* ArgParse::FindOption(const string& arg)
{
  for (Option& opt : _options)
  {
    if (arg.size() > 2 && arg[1] == '-')
    {
      if (!opt.longName.empty() && arg.compare(2, string::npos, opt.longName) == 0)
        return &opt;
    }
    else if (!opt.shortName.empty() && arg.compare(1, string::npos, opt.shortName) == 0)
    {
      return &opt;
    }
  }
  return nullptr;
}

//------------------------------------------------------------------------------
bool ArgParse::Parse(int argc, const char* const* argv)
{
  positional.clear();
  error.clear();

  for (int i = 0; i < argc; ++i)
  {
    string arg = argv[i];
    if (arg.size() < 2 || arg[0] != '-')
    {
      positional.push_back(arg);
      continue;
    }

    Option* opt = FindOption(arg);
    if (!opt)
    {
      error = "Unknown option: " + arg + "\n";
      return false;
    }

    if (opt->type == Type::Flag)
    {
      *(bool*)opt->out = true;
      continue;
    }

    if (i + 1 >= argc)
    {
      error = "Missing value for option: " + arg + "\n";
      return false;
    }

    const char* value = argv[++i];
    if (opt->type == Type::Int)
    {
      char* end = nullptr;
      long v = strtol(value, &end, 10);
      if (!*value || *end)
      {
        error = "Invalid integer for " + arg + ": " + value + "\n";
        return false;
      }
      *(int*)opt->out = (int)v;
    }
    else
    {
      *(string*)opt->out = value;
    }
  }

  return true;
}
