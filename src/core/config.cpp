//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#include "core.hpp"

#include <climits>
#include <stdexcept>


// Throws if the value of the key (if exists) is not the expected type.
#define CHECK_TYPE(json, key, is_type, type_name)                    \
  do {                                                               \
    if ((json).contains(key) && !(json)[key].is_type()) {            \
      throw std::runtime_error(                                      \
        std::string("Invalid config value for \"") + key +           \
        "\", expected " type_name ".");                              \
    }                                                                \
  } while (false)


void Config::LoadJson(const Json& json, std::vector<std::string>* warnings) {

  if (!json.is_object()) {
    throw std::runtime_error("Invalid config, expected a json object.");
  }

  CHECK_TYPE(json, "todo_path",       is_string,          "a string");
  CHECK_TYPE(json, "theme",           is_string,          "a string");
  CHECK_TYPE(json, "theme_overrides", is_object,          "an object");
  CHECK_TYPE(json, "view",            is_string,          "a string");
  CHECK_TYPE(json, "scrolloff",       is_number_integer,  "an integer");
  CHECK_TYPE(json, "bindings",        is_object,          "an object");

  for (auto it = json.begin(); it != json.end(); ++it) {
    const std::string& key = it.key();
    if (key == "todo_path" || key == "theme" || key == "theme_overrides" ||
        key == "view" || key == "scrolloff" || key == "bindings") continue;
    if (warnings) warnings->push_back("Unknown config key \"" + key + "\" ignored.");
  }

  if (json.contains("todo_path")) todo_path = json["todo_path"].get<std::string>();
  if (json.contains("theme")) theme = json["theme"].get<std::string>();
  if (json.contains("theme_overrides")) theme_overrides = json["theme_overrides"];

  if (json.contains("view")) {
    std::string view = json["view"].get<std::string>();
    if (view == "list") grouped_view = false;
    else if (view == "grouped") grouped_view = true;
    else throw std::runtime_error("Invalid config value for \"view\", expected \"list\" or \"grouped\".");
  }

  if (json.contains("scrolloff")) {
    // Read wide so a huge value can't wrap into range.
    int64_t value = json["scrolloff"].get<int64_t>();
    if (value < 0 || value > INT_MAX) {
      throw std::runtime_error("Invalid config value for \"scrolloff\", expected a non negative integer.");
    }
    scrolloff = (int) value;
  }

  if (json.contains("bindings")) {
    const Json& json_bindings = json["bindings"];
    for (auto it_mode = json_bindings.begin(); it_mode != json_bindings.end(); ++it_mode) {
      Mode mode;
      if (!ModeFromString(it_mode.key(), &mode)) {
        throw std::runtime_error("Invalid mode \"" + it_mode.key() + "\" in the bindings.");
      }
      if (!it_mode.value().is_object()) {
        throw std::runtime_error("Invalid bindings for mode \"" + it_mode.key() + "\", expected an object.");
      }
      for (auto it = it_mode.value().begin(); it != it_mode.value().end(); ++it) {
        if (!it.value().is_string()) {
          throw std::runtime_error("Invalid action for binding \"" + it.key() + "\", expected a string.");
        }
        bindings.push_back({ mode, it.key(), it.value().get<std::string>() });
      }
    }
  }
}

#undef CHECK_TYPE
