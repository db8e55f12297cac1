//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#include "core/core.hpp"
#include "platform.hpp"

#include "resources/themes.xmacro.inl"

#include <stdexcept>


static const char* default_config = R"!!({

  // Directory of the tasks.md file, empty means ~/.local/share/ticklist.
  "todo_path" : "",

  // One of "default", "mono".
  "theme"     : "default",

  // Override the theme entries, for example:
  //   "task.done" : "#6a9955"
  //   "ui.header" : { "fg": "#569cd6", "modifiers": ["bold"] }
  "theme_overrides" : {},

  // Initial view: "list" or "grouped".
  "view"      : "list",

  "scrolloff" : 2,

  // Additional key bindings on top of the default ones, for example:
  //   "normal" : { "<C-d>" : "delete_task" }
  "bindings"  : {
    "normal" : {},
    "insert" : {}
  }

}
)!!";


const char* Platform::GetDefaultConfigSource() {
  return default_config;
}


Json Platform::LoadConfig(const Path& path, std::vector<std::string>* warnings) {
  std::string source;

  if (!path.Exists()) {
    source = default_config;
    try {
      WriteFileAtomic(path, default_config);
    } catch (const std::exception& e) {
      if (warnings) warnings->push_back(std::string("Cannot create the default config: ") + e.what());
    }
  } else {
    ReadFile(source, path);
  }

  try {
    return Json::parse(source,
      nullptr, // callback.
      true,    // allow exceptions.
      true);   // ignore comments.
  } catch (const Json::parse_error& e) {
    throw std::runtime_error("Invalid config file \"" + path.String() + "\": " + e.what());
  }
}


std::map<std::string, Json> Platform::LoadThemes() {

  // The return value.
  std::map<std::string, Json> themes;

  // The themes are shipped with the binary, parsing them can't fail unless
  // someone broke the sources.
  #define X(theme_name, theme_source)                \
    try {                                            \
      Json data = Json::parse(theme_source);         \
      themes[theme_name] = std::move(data);          \
    } catch (const Json::parse_error& e) {           \
      fprintf(stderr, "Invalid builtin theme %s: %s\n", theme_name, e.what()); \
    }
  THEMES(X);
  #undef X

  return themes;
}
