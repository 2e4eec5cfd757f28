#pragma once
#include "precompiled.hpp"

//------------------------------------------------------------------------------
// Minimal command line parser. Options are given as "-x", "--long", and take
// their value from the next argument. Anything not starting with '-' is
// collected in 'positional'.
struct ArgParse
{
  void AddFlag(const char* shortName, const char* longName, bool* out);
  void AddIntArgument(const char* shortName, const char* longName, int* out);
  void AddStringArgument(const char* shortName, const char* longName, string* out);

  bool Parse(int argc, const char* const* argv);

  vector<string> positional;
  string error;

private:
  enum class Type
  {
    Flag,
    Int,
    String,
  };

  struct Option
  {
    string shortName;
    string longName;
    Type type;
    void* out;
  };

  void AddOption(const char* shortName, const char* longName, Type type, void* out);
  Option* FindOption(const string& arg);

  vector<Option> _options;
};
