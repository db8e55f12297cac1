//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#include <doctest/doctest.h>

#include "test_utils.hpp"


TEST_CASE("config defaults") {
  Config config;
  CHECK(config.todo_path.empty());
  CHECK(config.theme == "default");
  CHECK(config.scrolloff == 2);
  CHECK_FALSE(config.grouped_view);
  CHECK(config.bindings.empty());
}


TEST_CASE("config values are loaded") {
  Json json = Json::parse(R"({
    "todo_path" : "~/notes",
    "theme"     : "mono",
    "theme_overrides" : { "task.done" : "#00ff00" },
    "view"      : "grouped",
    "scrolloff" : 0,
    "bindings"  : {
      "normal" : { "X" : "delete_task", "<C-d>" : "delete_task" },
      "insert" : { "<C-u>" : "input_home" }
    }
  })");

  Config config;
  std::vector<std::string> warnings;
  config.LoadJson(json, &warnings);

  CHECK(warnings.empty());
  CHECK(config.todo_path == "~/notes");
  CHECK(config.theme == "mono");
  CHECK(config.theme_overrides["task.done"] == "#00ff00");
  CHECK(config.grouped_view);
  CHECK(config.scrolloff == 0);

  REQUIRE(config.bindings.size() == 3);
  int insert_count = 0;
  for (const Config::Binding& binding : config.bindings) {
    if (binding.mode == Mode::INSERT) {
      insert_count++;
      CHECK(binding.keys == "<C-u>");
      CHECK(binding.action == "input_home");
    } else {
      CHECK(binding.mode == Mode::NORMAL);
      CHECK(binding.action == "delete_task");
    }
  }
  CHECK(insert_count == 1);
}


TEST_CASE("unknown config keys are warnings") {
  Config config;
  std::vector<std::string> warnings;
  config.LoadJson(Json::parse(R"({ "colour" : "red", "scrolloff" : 4 })"), &warnings);

  REQUIRE(warnings.size() == 1);
  CHECK(warnings[0] == "Unknown config key \"colour\" ignored.");
  CHECK(config.scrolloff == 4);
}


TEST_CASE("wrong config value types throw") {
  const char* sources[] = {
    R"([1, 2])",
    R"({ "todo_path" : 42 })",
    R"({ "theme" : ["default"] })",
    R"({ "theme_overrides" : "none" })",
    R"({ "view" : "table" })",
    R"({ "view" : true })",
    R"({ "scrolloff" : "2" })",
    R"({ "scrolloff" : -1 })",
    R"({ "scrolloff" : 1.5 })",
    R"({ "scrolloff" : 4294967298 })",
    R"({ "scrolloff" : 18446744073709551615 })",
    R"({ "bindings" : [] })",
    R"({ "bindings" : { "visual" : {} } })",
    R"({ "bindings" : { "normal" : [] } })",
    R"({ "bindings" : { "normal" : { "x" : 1 } } })",
  };

  for (const char* source : sources) {
    CAPTURE(source);
    Config config;
    CHECK_THROWS_AS(config.LoadJson(Json::parse(source), nullptr), std::runtime_error);
  }
}


TEST_CASE("the default config is valid") {
  Json json = Json::parse(Platform::GetDefaultConfigSource(), nullptr, true, true);

  Config config;
  std::vector<std::string> warnings;
  config.LoadJson(json, &warnings);

  CHECK(warnings.empty());
  CHECK(config.theme == "default");
  CHECK_FALSE(config.grouped_view);
}


TEST_CASE("a missing config file is created with the defaults") {
  TempDir dir;
  Path path = dir / "ticklist/config.json";

  std::vector<std::string> warnings;
  Json json = Platform::LoadConfig(path, &warnings);

  CHECK(warnings.empty());
  CHECK(json.is_object());
  CHECK(path.IsRegularFile());
  CHECK(ReadText(path) == Platform::GetDefaultConfigSource());
}


TEST_CASE("config file with comments") {
  TempDir dir;
  Path path = dir / "config.json";
  WriteText(path,
    "{\n"
    "  // Where the tasks live.\n"
    "  \"todo_path\" : \"/tmp/todo\"\n"
    "}\n");

  Json json = Platform::LoadConfig(path, nullptr);
  CHECK(json["todo_path"] == "/tmp/todo");
}


TEST_CASE("invalid config json throws") {
  TempDir dir;
  Path path = dir / "config.json";
  WriteText(path, "{ \"theme\" : ");
  CHECK_THROWS_AS(Platform::LoadConfig(path, nullptr), std::runtime_error);
}


TEST_CASE("color strings") {
  Color color = 0;
  REQUIRE(Theme::StringToColor("#1e1e1e", &color));
  CHECK(color == 0x1e1e1e);
  REQUIRE(Theme::StringToColor("#FFa500", &color));
  CHECK(color == 0xffa500);

  CHECK_FALSE(Theme::StringToColor("1e1e1e", &color));
  CHECK_FALSE(Theme::StringToColor("#1e1e1", &color));
  CHECK_FALSE(Theme::StringToColor("#1e1e1e1", &color));
  CHECK_FALSE(Theme::StringToColor("#gggggg", &color));
}


TEST_CASE("theme styles fall back to the parent entry") {
  Theme theme(Json::parse(R"({
    "ui"              : "#111111",
    "ui.statusline"   : { "fg": "fg", "bg": "bg", "modifiers": ["bold"] },
    "palette"         : { "fg": "#eeeeee", "bg": "#222222" }
  })"));

  Style style = theme.GetStyle("ui.statusline.insert");
  CHECK(style.fg == std::optional<Color>(0xeeeeee));
  CHECK(style.bg == std::optional<Color>(0x222222));
  CHECK(style.attrib == TICKLIST_CELL_BOLD);

  CHECK(theme.GetStyle("ui.text").fg == std::optional<Color>(0x111111));
  CHECK(theme.GetStyle("task.done").fg == std::nullopt);
}


TEST_CASE("invalid theme entries are reported") {
  std::vector<std::string> warnings;
  Theme theme(Json::parse(R"({
    "ui.text"      : "no_such_color",
    "ui.header"    : { "fg": "#12345", "modifiers": ["blink"] },
    "task.done"    : 42,
    "task.todo"    : "#abcdef",
    "palette"      : { "broken": "#xyz" }
  })"), &warnings);

  CHECK(warnings.size() == 5);
  CHECK(theme.task_todo.fg == std::optional<Color>(0xabcdef));
}


TEST_CASE("builtin themes are loaded without warnings") {
  std::map<std::string, Json> themes = Platform::LoadThemes();
  REQUIRE(themes.count("default") == 1);
  REQUIRE(themes.count("mono") == 1);

  for (auto& it : themes) {
    CAPTURE(it.first);
    std::vector<std::string> warnings;
    Theme theme(it.second, &warnings);
    CHECK(warnings.empty());
    CHECK(theme.style.bg.has_value());
    CHECK(theme.task_done.fg.has_value());
  }
}


TEST_CASE("paths with the home directory") {
  Path home = Platform::GetHomeDirectory();
  REQUIRE_FALSE(home.Empty());

  CHECK(Path::ExpandUser("~") == home);
  CHECK(Path::ExpandUser("~/todo") == home / "todo");
  CHECK(Path::ExpandUser("/var/~/x") == Path("/var/~/x"));
}


TEST_CASE("xdg directories") {
  TempDir dir;
  setenv("XDG_CONFIG_HOME", dir.Get().c_str(), 1);
  setenv("XDG_DATA_HOME", dir.Get().c_str(), 1);

  CHECK(Platform::GetConfigPath() == dir / "ticklist/config.json");
  CHECK(Platform::GetDataDirectory() == dir / "ticklist");

  unsetenv("XDG_CONFIG_HOME");
  unsetenv("XDG_DATA_HOME");
}
