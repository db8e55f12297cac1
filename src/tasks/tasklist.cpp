//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#include "tasklist.hpp"

#include <stdexcept>
#include <system_error>


// -----------------------------------------------------------------------------
// Markdown.
// -----------------------------------------------------------------------------


char TaskStateToChar(TaskState state) {
  switch (state) {
    case TaskState::TODO:      return ' ';
    case TaskState::DOING:     return '~';
    case TaskState::DONE:      return 'x';
    case TaskState::IMPORTANT: return '!';
  }
  UNREACHABLE();
  return ' ';
}


std::string TaskToMarkdown(const Task& task) {
  std::string ret = "- [";
  ret += TaskStateToChar(task.state);
  ret += "] ";
  ret += task.text;
  return ret;
}


bool TaskFromMarkdown(const std::string& line, Task* task) {
  // "- [?] " is the minimum prefix.
  if (line.size() < 6) return false;
  if (!StartsWith(line, "- [") || line[4] != ']' || line[5] != ' ') return false;

  TaskState state;
  switch (line[3]) {
    case ' ': state = TaskState::TODO;      break;
    case '~': state = TaskState::DOING;     break;
    case 'x':
    case 'X': state = TaskState::DONE;      break;
    case '!': state = TaskState::IMPORTANT; break;
    default: return false;
  }

  std::string text = StringTrim(line.substr(6));
  if (text.empty()) return false;

  task->text = std::move(text);
  task->state = state;
  return true;
}


// -----------------------------------------------------------------------------
// TaskList.
// -----------------------------------------------------------------------------


TaskList::TaskList(std::vector<Task> tasks) : tasks(std::move(tasks)) {
  ClampCursor();
}


int TaskList::Size() const {
  return (int) tasks.size();
}


bool TaskList::Empty() const {
  return tasks.empty();
}


const Task& TaskList::Get(int index) const {
  ASSERT_INDEX(index, Size());
  return tasks[index];
}


const std::vector<Task>& TaskList::GetTasks() const {
  return tasks;
}


int TaskList::GetCursor() const {
  return cursor;
}


void TaskList::SetCursor(int index) {
  cursor = index;
  ClampCursor();
}


int TaskList::CountCompleted() const {
  int count = 0;
  for (const Task& task : tasks) {
    if (task.IsCompleted()) count++;
  }
  return count;
}


bool TaskList::Add(const std::string& text) {
  std::string trimmed = StringTrim(text);
  if (trimmed.empty()) return false;
  tasks.emplace_back(std::move(trimmed), TaskState::TODO);
  cursor = Size() - 1;
  MarkDirty();
  return true;
}


bool TaskList::Toggle(int index) {
  if (!IsValidIndex(index)) return false;
  Task& task = tasks[index];
  task.state = (task.state == TaskState::DONE) ? TaskState::TODO : TaskState::DONE;
  MarkDirty();
  return true;
}


bool TaskList::Cycle(int index) {
  if (!IsValidIndex(index)) return false;
  Task& task = tasks[index];
  switch (task.state) {
    case TaskState::TODO:      task.state = TaskState::DOING;     break;
    case TaskState::DOING:     task.state = TaskState::DONE;      break;
    case TaskState::DONE:      task.state = TaskState::IMPORTANT; break;
    case TaskState::IMPORTANT: task.state = TaskState::TODO;      break;
  }
  MarkDirty();
  return true;
}


bool TaskList::Edit(int index, const std::string& text) {
  if (!IsValidIndex(index)) return false;
  std::string trimmed = StringTrim(text);
  if (trimmed.empty()) return false;
  if (tasks[index].text == trimmed) return true; // Nothing changed.
  tasks[index].text = std::move(trimmed);
  MarkDirty();
  return true;
}


bool TaskList::Remove(int index) {
  if (!IsValidIndex(index)) return false;
  tasks.erase(tasks.begin() + index);
  ClampCursor();
  MarkDirty();
  return true;
}


bool TaskList::Move(int index, int direction) {
  if (!IsValidIndex(index)) return false;
  if (direction != -1 && direction != 1) return false;

  int other = index + direction;
  if (!IsValidIndex(other)) return false;

  std::swap(tasks[index], tasks[other]);
  cursor = other;
  MarkDirty();
  return true;
}


bool TaskList::IsDirty() const {
  return dirty != 0;
}


void TaskList::ClearDirty() {
  dirty = 0;
}


void TaskList::LoadFromString(const std::string& content, std::vector<std::string>* warnings) {
  std::vector<Task> loaded;

  std::vector<std::string> lines = StringSplit(content, '\n');
  for (int i = 0; i < (int) lines.size(); i++) {
    // Indented items are accepted, they're written back without the indent.
    std::string line = StringTrim(lines[i]);
    if (line.empty()) continue;

    Task task;
    if (!TaskFromMarkdown(line, &task)) {
      if (warnings) warnings->push_back("line " + std::to_string(i + 1) + ": malformed task entry");
      continue;
    }
    loaded.push_back(std::move(task));
  }

  tasks = std::move(loaded);
  cursor = 0;
  dirty = 0;
}


std::string TaskList::Serialize() const {
  std::string ret;
  for (const Task& task : tasks) {
    ret += TaskToMarkdown(task);
    ret += '\n';
  }
  return ret;
}


void TaskList::Load(const Path& path, std::vector<std::string>* warnings) {
  // Only a missing file means an empty list. A directory we can't search
  // must not look like one, or the next save would replace the tasks.
  std::error_code ec;
  fs::file_status status = fs::status(fs::path(path.String()), ec);
  if (status.type() == fs::file_type::not_found || ec == std::errc::not_a_directory) {
    tasks.clear();
    cursor = 0;
    dirty = 0;
    return;
  }
  if (ec) {
    throw std::runtime_error("Error accessing file \"" + path.String() + "\" (" + ec.message() + ")");
  }

  std::string content;
  Platform::ReadFile(content, path);
  LoadFromString(content, warnings);
}


bool TaskList::Save(const Path& path, std::string* error) {
  try {
    Platform::WriteFileAtomic(path, Serialize());
  } catch (const std::exception& e) {
    if (error) *error = e.what();
    return false;
  }
  return true;
}


bool TaskList::IsValidIndex(int index) const {
  return index >= 0 && index < Size();
}


void TaskList::ClampCursor() {
  if (tasks.empty()) {
    cursor = 0;
    return;
  }
  cursor = CLAMP(0, cursor, Size() - 1);
}


void TaskList::MarkDirty() {
  dirty++;
}
