//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#include "core/core.hpp"
#include "platform/platform.hpp"
#include "frontend/frontend.hpp"
#include "app/app.hpp"


static void PrintUsage(FILE* out) {
  fprintf(out,
    "usage: ticklist [options]\n"
    "\n"
    "options:\n"
    "  -h, --help         Show this message and exit.\n"
    "  -v, --version      Show the version and exit.\n"
    "  -f, --file <path>  Use the given tasks file instead of the configured one.\n"
    "\n"
    "The config file is at: %s\n",
    Platform::GetConfigPath().String().c_str());
}


int main(int argc, char** argv) {

  std::string file_arg;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      PrintUsage(stdout);
      return 0;
    }

    if (arg == "-v" || arg == "--version") {
      printf("ticklist %s\n", TICKLIST_VERSION_STRING);
      return 0;
    }

    if (arg == "-f" || arg == "--file") {
      if (i + 1 >= argc) {
        fprintf(stderr, "ticklist: option %s requires a path.\n", arg.c_str());
        return 1;
      }
      file_arg = argv[++i];
      continue;
    }

    if (StartsWith(arg, "--file=")) {
      file_arg = arg.substr(strlen("--file="));
      continue;
    }

    fprintf(stderr, "ticklist: unknown option \"%s\".\n\n", arg.c_str());
    PrintUsage(stderr);
    return 1;
  }

  try {

    std::vector<std::string> warnings;

    Json json = Platform::LoadConfig(Platform::GetConfigPath(), &warnings);
    Config config;
    config.LoadJson(json, &warnings);

    Path tasks_path;
    if (!file_arg.empty()) {
      tasks_path = Path::ExpandUser(file_arg);
    } else if (!config.todo_path.empty()) {
      tasks_path = Path::ExpandUser(config.todo_path) / "tasks.md";
    } else {
      tasks_path = Platform::GetDataDirectory() / "tasks.md";
    }

    App app(std::move(config), tasks_path, std::make_unique<Termbox2>(), std::move(warnings));
    app.Load();

    Platform::InstallTerminationHandler();
    return app.MainLoop();

  } catch (const std::exception& e) {
    fprintf(stderr, "ticklist: %s\n", e.what());
    return 1;
  }
}
