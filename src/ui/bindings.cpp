//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#include "ui.hpp"


void RegisterActions(KeyTree& keytree) {
  std::string name;

  name = Ui::ClassName();

  keytree.RegisterAction(name, "close", Ui::Action_Close);

  name = TaskWindow::ClassName();

  keytree.RegisterAction(name, "cursor_down", (FuncAction) TaskWindow::Action_CursorDown);
  keytree.RegisterAction(name, "cursor_up", (FuncAction) TaskWindow::Action_CursorUp);
  keytree.RegisterAction(name, "cursor_first", (FuncAction) TaskWindow::Action_CursorFirst);
  keytree.RegisterAction(name, "cursor_last", (FuncAction) TaskWindow::Action_CursorLast);
  keytree.RegisterAction(name, "add_task", (FuncAction) TaskWindow::Action_AddTask);
  keytree.RegisterAction(name, "edit_task", (FuncAction) TaskWindow::Action_EditTask);
  keytree.RegisterAction(name, "toggle_task", (FuncAction) TaskWindow::Action_ToggleTask);
  keytree.RegisterAction(name, "cycle_task", (FuncAction) TaskWindow::Action_CycleTask);
  keytree.RegisterAction(name, "delete_task", (FuncAction) TaskWindow::Action_DeleteTask);
  keytree.RegisterAction(name, "move_down", (FuncAction) TaskWindow::Action_MoveDown);
  keytree.RegisterAction(name, "move_up", (FuncAction) TaskWindow::Action_MoveUp);
  keytree.RegisterAction(name, "toggle_view", (FuncAction) TaskWindow::Action_ToggleView);
  keytree.RegisterAction(name, "quit", (FuncAction) TaskWindow::Action_Quit);

  keytree.RegisterAction(name, "confirm", (FuncAction) TaskWindow::Action_Confirm);
  keytree.RegisterAction(name, "cancel", (FuncAction) TaskWindow::Action_Cancel);
  keytree.RegisterAction(name, "input_left", (FuncAction) TaskWindow::Action_InputLeft);
  keytree.RegisterAction(name, "input_right", (FuncAction) TaskWindow::Action_InputRight);
  keytree.RegisterAction(name, "input_home", (FuncAction) TaskWindow::Action_InputHome);
  keytree.RegisterAction(name, "input_end", (FuncAction) TaskWindow::Action_InputEnd);
  keytree.RegisterAction(name, "backspace", (FuncAction) TaskWindow::Action_InputBackspace);
  keytree.RegisterAction(name, "delete", (FuncAction) TaskWindow::Action_InputDelete);
  keytree.RegisterAction(name, "insert_space", (FuncAction) TaskWindow::Action_InsertSpace);
}


void RegisterDefaultBindings(KeyTree& keytree) {
  std::string name;

  name = Ui::ClassName();

  keytree.RegisterBinding(name, "<C-c>", "close");
  keytree.RegisterBinding(name, "<C-q>", "close");

  name = TaskWindow::ClassName();

  keytree.RegisterBinding(name, Mode::NORMAL, "j",           "cursor_down");
  keytree.RegisterBinding(name, Mode::NORMAL, "<down>",      "cursor_down");
  keytree.RegisterBinding(name, Mode::NORMAL, "k",           "cursor_up");
  keytree.RegisterBinding(name, Mode::NORMAL, "<up>",        "cursor_up");
  keytree.RegisterBinding(name, Mode::NORMAL, "gg",          "cursor_first");
  keytree.RegisterBinding(name, Mode::NORMAL, "<home>",      "cursor_first");
  keytree.RegisterBinding(name, Mode::NORMAL, "G",           "cursor_last");
  keytree.RegisterBinding(name, Mode::NORMAL, "<end>",       "cursor_last");
  keytree.RegisterBinding(name, Mode::NORMAL, "a",           "add_task");
  keytree.RegisterBinding(name, Mode::NORMAL, "i",           "add_task");
  keytree.RegisterBinding(name, Mode::NORMAL, "o",           "add_task");
  keytree.RegisterBinding(name, Mode::NORMAL, "e",           "edit_task");
  keytree.RegisterBinding(name, Mode::NORMAL, "<enter>",     "edit_task");
  keytree.RegisterBinding(name, Mode::NORMAL, "x",           "toggle_task");
  keytree.RegisterBinding(name, Mode::NORMAL, "<space>",     "toggle_task");
  keytree.RegisterBinding(name, Mode::NORMAL, "h",           "toggle_task");
  keytree.RegisterBinding(name, Mode::NORMAL, "c",           "cycle_task");
  keytree.RegisterBinding(name, Mode::NORMAL, "dd",          "delete_task");
  keytree.RegisterBinding(name, Mode::NORMAL, "<del>",       "delete_task");
  keytree.RegisterBinding(name, Mode::NORMAL, "J",           "move_down");
  keytree.RegisterBinding(name, Mode::NORMAL, "<S-down>",    "move_down");
  keytree.RegisterBinding(name, Mode::NORMAL, "K",           "move_up");
  keytree.RegisterBinding(name, Mode::NORMAL, "<S-up>",      "move_up");
  keytree.RegisterBinding(name, Mode::NORMAL, "v",           "toggle_view");
  keytree.RegisterBinding(name, Mode::NORMAL, "q",           "quit");

  keytree.RegisterBinding(name, Mode::INSERT, "<enter>",     "confirm");
  keytree.RegisterBinding(name, Mode::INSERT, "<esc>",       "cancel");
  keytree.RegisterBinding(name, Mode::INSERT, "<left>",      "input_left");
  keytree.RegisterBinding(name, Mode::INSERT, "<right>",     "input_right");
  keytree.RegisterBinding(name, Mode::INSERT, "<home>",      "input_home");
  keytree.RegisterBinding(name, Mode::INSERT, "<end>",       "input_end");
  keytree.RegisterBinding(name, Mode::INSERT, "<backspace>", "backspace");
  keytree.RegisterBinding(name, Mode::INSERT, "<del>",       "delete");
  keytree.RegisterBinding(name, Mode::INSERT, "<space>",     "insert_space");
}


void RegisterConfigBindings(KeyTree& keytree, const Config& config, std::vector<std::string>* warnings) {
  for (const Config::Binding& binding : config.bindings) {

    std::string name;
    if (keytree.HasAction(TaskWindow::ClassName(), binding.action)) {
      name = TaskWindow::ClassName();
    } else if (keytree.HasAction(Ui::ClassName(), binding.action)) {
      name = Ui::ClassName();
    } else {
      if (warnings) warnings->push_back("Unknown action \"" + binding.action + "\" in the bindings.");
      continue;
    }

    if (!keytree.RegisterBinding(name, binding.mode, binding.keys, binding.action)) {
      if (warnings) warnings->push_back("Invalid key binding \"" + binding.keys + "\" for " + ModeToString(binding.mode) + " mode.");
    }
  }
}
