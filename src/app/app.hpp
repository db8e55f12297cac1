//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#pragma once

#include "core/core.hpp"
#include "platform/platform.hpp"
#include "tasks/tasklist.hpp"
#include "ui/ui.hpp"


// How long the main loop waits for an input before checking the termination
// signal again.
#define EVENT_TIMEOUT_MS 100


// The application owns the task list, the key tree, the theme, the ui and the
// front end, and runs the main loop. The tasks are persisted after every
// change and once more before exit.
class App {

public:
  // The warnings are the non fatal issues found so far (ie. while loading the
  // config) which will be shown in the info bar and printed to stderr at exit.
  App(Config config, Path tasks_path, std::unique_ptr<IFrontEnd> frontend, std::vector<std::string> warnings);
  NO_COPY_CONSTRUCTOR(App);

  // !! WARNING !! This will throw if the tasks file exists but cannot be read.
  void Load();

  // Returns the exit code of the application.
  int MainLoop();

  const std::vector<std::string>& GetWarnings() const;
  TaskList& GetTasks();
  Ui& GetUi();

private:
  Config config;
  Path tasks_path;

  TaskList tasks;
  KeyTree keytree;
  std::unique_ptr<Theme> theme;
  std::unique_ptr<Ui> ui;
  std::unique_ptr<IFrontEnd> frontend;

  FrameBuffer buff; // The frame we'll be drawing on.

  std::vector<std::string> warnings;
  std::string save_error; // Last save error (empty if the last save succeeded).

private:
  void AddWarning(const std::string& message);
  void PrepareFrameBuffer();
  bool Save();
};
