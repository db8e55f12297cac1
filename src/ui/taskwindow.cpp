//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#include "ui.hpp"


// -----------------------------------------------------------------------------
// Mode transitions.
// -----------------------------------------------------------------------------


struct ModeTransition {
  Mode from;
  TaskWindow::Trigger trigger;
  Mode to;
};


// Any (mode, trigger) pair that isn't listed here is rejected.
static const ModeTransition transitions[] = {
  { Mode::NORMAL, TaskWindow::Trigger::BEGIN_ADD,  Mode::INSERT },
  { Mode::NORMAL, TaskWindow::Trigger::BEGIN_EDIT, Mode::INSERT },
  { Mode::INSERT, TaskWindow::Trigger::CONFIRM,    Mode::NORMAL },
  { Mode::INSERT, TaskWindow::Trigger::CANCEL,     Mode::NORMAL },
};


// The groups of the grouped view in the order they're drawn.
static const struct {
  TaskState state;
  const char* header;
} groups[] = {
  { TaskState::TODO,      "TO DO:"       },
  { TaskState::DONE,      "DONE:"        },
  { TaskState::DOING,     "IN PROGRESS:" },
  { TaskState::IMPORTANT, "IMPORTANT:"   },
};


#define EMPTY_LIST_MESSAGE "No tasks yet. Press 'a' to add a task."


// -----------------------------------------------------------------------------
// Task Window.
// -----------------------------------------------------------------------------


TaskWindow::TaskWindow(Ui* ui, TaskList* tasks) : ui(ui), tasks(tasks) {
  ASSERT(ui != nullptr && tasks != nullptr, OOPS);
  SetMode(Mode::NORMAL);
}


TaskWindow::View TaskWindow::GetView() const {
  return view;
}


void TaskWindow::SetView(View view) {
  this->view = view;
  view_start = 0;
}


TaskWindow::Target TaskWindow::GetTarget() const {
  return target;
}


const InputLine& TaskWindow::GetInput() const {
  return input;
}


bool TaskWindow::IsShouldClose() const {
  return should_close;
}


void TaskWindow::SetShouldClose() {
  should_close = true;
}


int TaskWindow::GetViewStart() const {
  return view_start;
}


bool TaskWindow::Transit(Trigger trigger) {

  const ModeTransition* transition = nullptr;
  for (const ModeTransition& t : transitions) {
    if (t.from == GetMode() && t.trigger == trigger) {
      transition = &t;
      break;
    }
  }
  if (transition == nullptr) return false;

  switch (trigger) {

    case Trigger::BEGIN_ADD: {
      target = Target::ADD;
      input.Clear();
    } break;

    case Trigger::BEGIN_EDIT: {
      if (tasks->Empty()) return false; // Nothing to edit.
      target = Target::EDIT;
      edit_index = tasks->GetCursor();
      input.SetText(tasks->Get(edit_index).text);
    } break;

    case Trigger::CONFIRM: {
      const std::string& text = input.GetText();
      if (target == Target::ADD) {
        if (tasks->Add(text)) ui->Info("Task added.");
      } else if (target == Target::EDIT) {
        if (StringTrim(text).empty()) {
          ui->Warning("Task text cannot be empty, edit discarded.");
        } else {
          bool changed = edit_index < tasks->Size() && tasks->Get(edit_index).text != StringTrim(text);
          if (tasks->Edit(edit_index, text) && changed) ui->Info("Task updated.");
        }
      }
    } [[fallthrough]];

    case Trigger::CANCEL: {
      target = Target::NONE;
      edit_index = -1;
      input.Clear();
    } break;
  }

  SetMode(transition->to);
  return true;
}


bool TaskWindow::HandleEvent(const Event& event) {
  if (event.type != Event::Type::KEY) return false;
  if (GetMode() != Mode::INSERT) return false;

  if (event.key.unicode != 0) {
    input.Insert((uint32_t) event.key.unicode);
    return true;
  }

  return false;
}


std::vector<TaskWindow::Row> TaskWindow::BuildRows() const {
  std::vector<Row> rows;
  const std::vector<Task>& list = tasks->GetTasks();

  if (view == View::LIST) {
    for (int i = 0; i < (int) list.size(); i++) {
      Row row;
      row.type = Row::Type::TASK;
      row.index = i;
      rows.push_back(row);
    }
    return rows;
  }

  for (const auto& group : groups) {
    bool header_added = false;
    for (int i = 0; i < (int) list.size(); i++) {
      if (list[i].state != group.state) continue;

      if (!header_added) {
        if (!rows.empty()) {
          Row blank;
          blank.type = Row::Type::BLANK;
          rows.push_back(blank);
        }
        Row header;
        header.type = Row::Type::HEADER;
        header.header = group.header;
        rows.push_back(header);
        header_added = true;
      }

      Row row;
      row.type = Row::Type::TASK;
      row.index = i;
      rows.push_back(row);
    }
  }

  return rows;
}


std::vector<int> TaskWindow::GetDisplayOrder() const {
  std::vector<int> order;
  for (const Row& row : BuildRows()) {
    if (row.type == Row::Type::TASK) order.push_back(row.index);
  }
  return order;
}


void TaskWindow::MoveCursorInDisplayOrder(int delta) {
  std::vector<int> order = GetDisplayOrder();
  if (order.empty()) return;

  auto it = std::find(order.begin(), order.end(), tasks->GetCursor());
  int pos = (it == order.end()) ? 0 : (int) (it - order.begin());
  pos = CLAMP(0, pos + delta, (int) order.size() - 1);
  tasks->SetCursor(order[pos]);
}


void TaskWindow::EnsureCursorOnView(const std::vector<Row>& rows, int height) {
  if (height <= 0) return;

  int row = -1;
  for (int i = 0; i < (int) rows.size(); i++) {
    if (rows[i].type == Row::Type::TASK && rows[i].index == tasks->GetCursor()) {
      row = i;
      break;
    }
  }

  if (row >= 0) {
    int scrolloff = ui->GetConfig().scrolloff;
    scrolloff = MAX(0, scrolloff);
    scrolloff = CLAMP(0, scrolloff, (height - 1) / 2);

    if ((row - scrolloff) <= view_start) {
      view_start = MAX(0, row - scrolloff);
    } else if (view_start + height <= (row + scrolloff)) {
      view_start = row + scrolloff - MAX(0, height - 1);
    }
  }

  // Don't leave empty rows at the bottom (the list got shorter or the cursor
  // is within the scrolloff of the end).
  view_start = CLAMP(0, view_start, MAX(0, (int) rows.size() - height));
}


void TaskWindow::Draw(FrameBuffer& buff, Position pos, Area area) {
  const Theme& theme = ui->GetTheme();
  const Icons& icons = ui->GetIcons();

  if (area.width <= 0 || area.height <= 0) return;
  DrawRectangleFill(buff, pos, area, theme.style);

  if (tasks->Empty()) {
    view_start = 0;
    DrawTextLine(buff, EMPTY_LIST_MESSAGE, Position(pos.x + 1, pos.y), area.width - 1, theme.info, icons, false);
    return;
  }

  std::vector<Row> rows = BuildRows();
  EnsureCursorOnView(rows, area.height);

  for (int i = 0; i < area.height; i++) {
    int index = view_start + i;
    if (index >= (int) rows.size()) break;
    DrawRow(buff, rows[index], Position(pos.x, pos.y + i), area.width);
  }
}


void TaskWindow::DrawRow(FrameBuffer& buff, const Row& row, Position pos, int width) {
  const Theme& theme = ui->GetTheme();
  const Icons& icons = ui->GetIcons();

  switch (row.type) {

    case Row::Type::BLANK: break;

    case Row::Type::HEADER: {
      DrawTextLine(buff, row.header, Position(pos.x + 1, pos.y), width - 1, theme.group_header, icons, false);
    } break;

    case Row::Type::TASK: {
      const Task& task = tasks->Get(row.index);

      Style style;
      int glyph = ' ';
      switch (task.state) {
        case TaskState::TODO:      style = theme.task_todo;      glyph = icons.task_todo;      break;
        case TaskState::DOING:     style = theme.task_doing;     glyph = icons.task_doing;     break;
        case TaskState::DONE:      style = theme.task_done;      glyph = icons.task_done;      break;
        case TaskState::IMPORTANT: style = theme.task_important; glyph = icons.task_important; break;
      }

      if (row.index == tasks->GetCursor()) {
        style = style.Apply(theme.selection);
        DrawRectangleFill(buff, pos, Area(width, 1), style);
      }

      // " <glyph> <text>"
      DrawIcon(buff, glyph, Position(pos.x + 1, pos.y), style);
      DrawTextLine(buff, task.text.c_str(), Position(pos.x + 3, pos.y), width - 3, style, icons, false);
    } break;
  }
}


// -----------------------------------------------------------------------------
// Actions.
// -----------------------------------------------------------------------------


bool TaskWindow::Action_CursorDown(TaskWindow* self) { self->MoveCursorInDisplayOrder(+1); return true; }
bool TaskWindow::Action_CursorUp(TaskWindow* self) { self->MoveCursorInDisplayOrder(-1); return true; }


bool TaskWindow::Action_CursorFirst(TaskWindow* self) {
  std::vector<int> order = self->GetDisplayOrder();
  if (!order.empty()) self->tasks->SetCursor(order.front());
  return true;
}


bool TaskWindow::Action_CursorLast(TaskWindow* self) {
  std::vector<int> order = self->GetDisplayOrder();
  if (!order.empty()) self->tasks->SetCursor(order.back());
  return true;
}


bool TaskWindow::Action_AddTask(TaskWindow* self) {
  return self->Transit(Trigger::BEGIN_ADD);
}


bool TaskWindow::Action_EditTask(TaskWindow* self) {
  // Rejected on an empty list, but the key is still ours.
  self->Transit(Trigger::BEGIN_EDIT);
  return true;
}


bool TaskWindow::Action_ToggleTask(TaskWindow* self) {
  self->tasks->Toggle(self->tasks->GetCursor());
  return true;
}


bool TaskWindow::Action_CycleTask(TaskWindow* self) {
  self->tasks->Cycle(self->tasks->GetCursor());
  return true;
}


bool TaskWindow::Action_DeleteTask(TaskWindow* self) {
  if (self->tasks->Remove(self->tasks->GetCursor())) {
    self->ui->Info("Task deleted.");
  }
  return true;
}


// In the grouped view the neighbours on the screen aren't the neighbours in the
// list, so reordering is only allowed in the list view.
#define CHECK_REORDER_ALLOWED(self)                                     \
  do {                                                                  \
    if ((self)->view != View::LIST) {                                   \
      (self)->ui->Info("Switch to the list view (v) to reorder tasks."); \
      return true;                                                      \
    }                                                                   \
  } while (false)


bool TaskWindow::Action_MoveDown(TaskWindow* self) {
  CHECK_REORDER_ALLOWED(self);
  self->tasks->Move(self->tasks->GetCursor(), +1);
  return true;
}


bool TaskWindow::Action_MoveUp(TaskWindow* self) {
  CHECK_REORDER_ALLOWED(self);
  self->tasks->Move(self->tasks->GetCursor(), -1);
  return true;
}

#undef CHECK_REORDER_ALLOWED


bool TaskWindow::Action_ToggleView(TaskWindow* self) {
  if (self->view == View::LIST) {
    self->SetView(View::GROUPED);
    self->ui->Info("Grouped view.");
  } else {
    self->SetView(View::LIST);
    self->ui->Info("List view.");
  }
  return true;
}


bool TaskWindow::Action_Quit(TaskWindow* self) {
  self->SetShouldClose();
  return true;
}


bool TaskWindow::Action_Confirm(TaskWindow* self) { return self->Transit(Trigger::CONFIRM); }
bool TaskWindow::Action_Cancel(TaskWindow* self) { return self->Transit(Trigger::CANCEL); }
bool TaskWindow::Action_InputLeft(TaskWindow* self) { self->input.CursorLeft(); return true; }
bool TaskWindow::Action_InputRight(TaskWindow* self) { self->input.CursorRight(); return true; }
bool TaskWindow::Action_InputHome(TaskWindow* self) { self->input.CursorHome(); return true; }
bool TaskWindow::Action_InputEnd(TaskWindow* self) { self->input.CursorEnd(); return true; }
bool TaskWindow::Action_InputBackspace(TaskWindow* self) { self->input.Backspace(); return true; }
bool TaskWindow::Action_InputDelete(TaskWindow* self) { self->input.Delete(); return true; }
bool TaskWindow::Action_InsertSpace(TaskWindow* self) { self->input.Insert(' '); return true; }
