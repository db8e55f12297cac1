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


// Markdown representation of a single task ("- [x] Buy milk").
std::string TaskToMarkdown(const Task& task);

// Returns false if the line isn't a task entry. The text is trimmed and an
// empty text is not a valid task.
bool TaskFromMarkdown(const std::string& line, Task* task);

// The checkbox character of the state (' ', '~', 'x', '!').
char TaskStateToChar(TaskState state);


// The ordered list of tasks and the cursor (selected task) in it. All the
// mutations re-clamp the cursor and either fully succeed or leave the list
// unchanged (and return false).
class TaskList {

public:
  TaskList() = default;
  TaskList(std::vector<Task> tasks);

  int Size() const;
  bool Empty() const;
  const Task& Get(int index) const;
  const std::vector<Task>& GetTasks() const;

  int GetCursor() const;
  void SetCursor(int index); // Will be clamped.

  // Number of tasks in the DONE state.
  int CountCompleted() const;

  // Mutations.
  bool Add(const std::string& text);
  bool Toggle(int index);
  bool Cycle(int index);
  bool Edit(int index, const std::string& text);
  bool Remove(int index);
  bool Move(int index, int direction);

  // The dirty counter incremented on every successfull mutation, so the caller
  // can decide when to persist.
  bool IsDirty() const;
  void ClearDirty();

  // Parse the markdown content and replace the tasks. The line number (1
  // based) of each malformed line is reported as warnings.
  void LoadFromString(const std::string& content, std::vector<std::string>* warnings);
  std::string Serialize() const;

  // !! WARNING !! This will throw if the file exists and cannot be read. A
  // missing file is not an error and results an empty list.
  void Load(const Path& path, std::vector<std::string>* warnings);

  // Returns false and set the error message on failure, the file on the disk
  // will be the previous one.
  bool Save(const Path& path, std::string* error);

private:
  std::vector<Task> tasks;
  int cursor = 0;
  int dirty  = 0;

  bool IsValidIndex(int index) const;
  void ClampCursor();
  void MarkDirty();
};
