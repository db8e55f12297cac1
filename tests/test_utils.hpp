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

#include <fstream>
#include <random>


// A temporary directory which is removed (with everything in it) when it goes
// out of scope.
class TempDir {
public:
  TempDir() {
    std::random_device rd;
    std::string name = "ticklist-test-" + std::to_string(rd()) + std::to_string(rd());
    dir = fs::temp_directory_path() / name;
    fs::create_directories(dir);
  }

  ~TempDir() {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  NO_COPY_CONSTRUCTOR(TempDir);

  Path operator /(const std::string& name) const {
    return Path((dir / name).string());
  }

  const fs::path& Get() const { return dir; }

private:
  fs::path dir;
};


inline void WriteText(const Path& path, const std::string& text) {
  std::ofstream out(path.String(), std::ios::binary);
  out << text;
}


inline std::string ReadText(const Path& path) {
  std::string text;
  Platform::ReadFile(text, path);
  return text;
}


// A key event of a character.
inline Event CharEvent(int c) {
  Event e(Event::Type::KEY);
  if (c == ' ') {
    e.key.code = Event::KEY_SPACE;
  } else {
    e.key.unicode = c;
  }
  return e;
}


// A key event of a special key (enter, esc, arrows, etc).
inline Event KeyEvent(Event::Keycode code, bool ctrl = false, bool shift = false) {
  Event e(Event::Type::KEY);
  e.key.code = code;
  e.key.ctrl = ctrl;
  e.key.shift = shift;
  return e;
}


// A ui wired with the default bindings and an empty theme, events are fed
// directly without a front end.
struct UiHarness {
  KeyTree keytree;
  Config config;
  Theme theme { Json::object() };
  TaskList tasks;
  std::unique_ptr<Ui> ui;

  UiHarness(std::initializer_list<const char*> texts = {}) {
    for (const char* text : texts) tasks.Add(text);
    tasks.SetCursor(0);
    tasks.ClearDirty();
    RegisterActions(keytree);
    RegisterDefaultBindings(keytree);
    ui = std::make_unique<Ui>(&keytree, &tasks, &config, &theme);
  }

  NO_COPY_CONSTRUCTOR(UiHarness);

  TaskWindow& Window() { return ui->GetTaskWindow(); }

  // Type each character of the string as a key press.
  void Type(const std::string& keys) {
    for (char c : keys) ui->HandleEvent(CharEvent((unsigned char) c));
  }

  void Press(Event::Keycode code, bool ctrl = false, bool shift = false) {
    ui->HandleEvent(KeyEvent(code, ctrl, shift));
  }

  std::vector<std::string> Texts() const {
    std::vector<std::string> ret;
    for (const Task& task : tasks.GetTasks()) ret.push_back(task.text);
    return ret;
  }
};
