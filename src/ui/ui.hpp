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
#include "tasks/tasklist.hpp"


class Ui;


// -----------------------------------------------------------------------------
// Input Line.
// -----------------------------------------------------------------------------


// A single line text input with a cursor, used to type the text of a new task
// or edit an existing one. The text is utf8 and the cursor is a codepoint index
// (not a byte index).
class InputLine {

public:
  InputLine() = default;

  void SetText(const std::string& text); // Cursor will be at the end.
  const std::string& GetText() const;
  int GetCursor() const;
  int GetLength() const; // Number of codepoints.
  void Clear();

  void Insert(uint32_t codepoint);
  void Insert(const std::string& text);
  bool Backspace();
  bool Delete();

  bool CursorLeft();
  bool CursorRight();
  void CursorHome();
  void CursorEnd();

private:
  std::string text;
  int cursor = 0;

  // Returns the byte index of the codepoint index.
  size_t ByteIndex(int index) const;
};


// -----------------------------------------------------------------------------
// Task Window.
// -----------------------------------------------------------------------------


// The main (and the only) window of the app which lists the tasks and handles
// all the task related actions. The window is in either normal or insert mode
// and all the mode changes go through Transit() (see the transition table in
// taskwindow.cpp).
class TaskWindow : public ActionExecutor {
  DEFINE_GET_CLASS_NAME(TaskWindow);

public:
  enum class View {
    LIST,
    GROUPED,
  };

  enum class Trigger {
    BEGIN_ADD,
    BEGIN_EDIT,
    CONFIRM,
    CANCEL,
  };

  // What the input line is targeting while in the insert mode.
  enum class Target {
    NONE,
    ADD,
    EDIT,
  };

  // A row in the list area, either a task or a group header or a blank line
  // between the groups.
  struct Row {
    enum class Type { TASK, HEADER, BLANK };
    Type type;
    int index = -1;             // Task index if type == TASK.
    const char* header = "";    // Header text if type == HEADER.
  };

  TaskWindow(Ui* ui, TaskList* tasks);

  // Handle the events which are not bound to any action (ie. inserting
  // characters in the insert mode). Returns true if consumed.
  bool HandleEvent(const Event& event);

  // Draw the task list into the given area. The cursor row is scrolled into
  // view before drawing.
  void Draw(FrameBuffer& buff, Position pos, Area area);

  // Returns false if the trigger is not valid for the current mode (and
  // nothing changed).
  bool Transit(Trigger trigger);

  View GetView() const;
  void SetView(View view);

  Target GetTarget() const;
  const InputLine& GetInput() const;

  bool IsShouldClose() const;
  void SetShouldClose();

  // The rows of the current view (grouped view has headers).
  std::vector<Row> BuildRows() const;

  // Task indices in the order they're displaied.
  std::vector<int> GetDisplayOrder() const;

  int GetViewStart() const;

private:
  Ui* ui = nullptr;
  TaskList* tasks = nullptr;

  View view = View::LIST;

  Target target = Target::NONE;
  int edit_index = -1;
  InputLine input;

  // First row of the list we're drawing (scroll position).
  int view_start = 0;

  bool should_close = false;

private:
  void EnsureCursorOnView(const std::vector<Row>& rows, int height);
  void MoveCursorInDisplayOrder(int delta);
  void DrawRow(FrameBuffer& buff, const Row& row, Position pos, int width);

public: // Actions.
  static bool Action_CursorDown(TaskWindow* self);
  static bool Action_CursorUp(TaskWindow* self);
  static bool Action_CursorFirst(TaskWindow* self);
  static bool Action_CursorLast(TaskWindow* self);
  static bool Action_AddTask(TaskWindow* self);
  static bool Action_EditTask(TaskWindow* self);
  static bool Action_ToggleTask(TaskWindow* self);
  static bool Action_CycleTask(TaskWindow* self);
  static bool Action_DeleteTask(TaskWindow* self);
  static bool Action_MoveDown(TaskWindow* self);
  static bool Action_MoveUp(TaskWindow* self);
  static bool Action_ToggleView(TaskWindow* self);
  static bool Action_Quit(TaskWindow* self);

  static bool Action_Confirm(TaskWindow* self);
  static bool Action_Cancel(TaskWindow* self);
  static bool Action_InputLeft(TaskWindow* self);
  static bool Action_InputRight(TaskWindow* self);
  static bool Action_InputHome(TaskWindow* self);
  static bool Action_InputEnd(TaskWindow* self);
  static bool Action_InputBackspace(TaskWindow* self);
  static bool Action_InputDelete(TaskWindow* self);
  static bool Action_InsertSpace(TaskWindow* self);
};


// -----------------------------------------------------------------------------
// UI.
// -----------------------------------------------------------------------------


class Ui : public IUi, public ActionExecutor {
  DEFINE_GET_CLASS_NAME(Ui);

public:
  Ui(const KeyTree* keytree, TaskList* tasks, const Config* config, const Theme* theme);

  bool HandleEvent(const Event& event) override;
  void Draw(FrameBuffer& buff) override;

  void Info(const std::string& message);
  void Warning(const std::string& message);
  void Error(const std::string& message);

  // Returns true once the app should exit (quit from the window or close from
  // the ui).
  bool IsShouldClose() const;
  void SetShouldClose();

  TaskWindow& GetTaskWindow();
  const std::string& GetInfoBarText() const;
  const Config& GetConfig() const;
  const Theme& GetTheme() const;
  const Icons& GetIcons() const;

private:
  const KeyTree* keytree = nullptr;
  KeyTreeCursor cursor;

  TaskList* tasks = nullptr;
  const Config* config = nullptr;
  const Theme* theme = nullptr;
  Icons icons;

  TaskWindow window;

  std::string info_bar_text;
  Style info_bar_style;

  bool should_close = false;

private:
  void DrawHeader(FrameBuffer& buff);
  void DrawInfoBar(FrameBuffer& buff);   // Will draw at the second last line.
  void DrawPromptBar(FrameBuffer& buff); // Instead of info bar in insert mode.
  void DrawShortcutBar(FrameBuffer& buff);

public: // Actions.
  static bool Action_Close(ActionExecutor* self);
};


// -----------------------------------------------------------------------------
// Key bindings.
// -----------------------------------------------------------------------------


// Register all the actions of the ui and the task window to the key tree.
void RegisterActions(KeyTree& keytree);

void RegisterDefaultBindings(KeyTree& keytree);

// The user bindings from the config are registered on top of the defaults, an
// action is searched in the task window first and then the ui. Bindings that
// cannot be registered are reported to the warnings.
void RegisterConfigBindings(KeyTree& keytree, const Config& config, std::vector<std::string>* warnings);
