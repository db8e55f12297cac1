//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#include "ui.hpp"


#define SHORTCUTS_NORMAL "a:add  e:edit  x:toggle  c:cycle  dd:delete  J/K:move  v:view  q:quit"
#define SHORTCUTS_INSERT "enter:confirm  esc:cancel"


Ui::Ui(const KeyTree* keytree, TaskList* tasks, const Config* config, const Theme* theme)
  : keytree(keytree), cursor(keytree), tasks(tasks), config(config), theme(theme), window(this, tasks) {
  ASSERT(config != nullptr && theme != nullptr, OOPS);
  window.SetView(config->grouped_view ? TaskWindow::View::GROUPED : TaskWindow::View::LIST);
  info_bar_style = theme->info;
}


bool Ui::HandleEvent(const Event& event) {

  if (event.type != Event::Type::KEY) return false;

  // The ui follows the mode of the window so the user can bind ui actions per
  // mode.
  SetMode(window.GetMode());

  // Try to consume the event for the window and if it cannot consumed, we try
  // to consume the event to the ui.
  bool consumed = cursor.ConsumeEvent(&window, event) ||
                  cursor.ConsumeEvent(this, event);

  if (!consumed) {
    bool listening = !cursor.IsCursorRoot();
    cursor.ResetCursor();

    // Sent the event to the window to manually handle without bindnigs.
    if (!listening) {
      return window.HandleEvent(event);
    }

    // If it was listening, we reset the cursor and accept the event as handled.
    return true;
  }

  #define return_true do { cursor.ResetCursor(); return true; } while (false)
  if (cursor.TryEvent(&window)) return_true;
  if (cursor.TryEvent(this)) return_true;
  #undef return_true

  if (cursor.HasMore()) return true;

  if (!cursor.IsCursorRoot()) {
    cursor.ResetCursor();
    return true;
  }

  return false;
}


void Ui::Draw(FrameBuffer& buff) {
  if (buff.width <= 0 || buff.height <= 0) return;

  DrawRectangleFill(buff, Position(0, 0), Area(buff.width, buff.height), theme->style);

  DrawHeader(buff);

  // Rows 2 .. h-3 are for the task list.
  Position pos(0, 2);
  Area area(buff.width, buff.height - 4);
  window.Draw(buff, pos, area);

  if (window.GetMode() == Mode::INSERT) {
    DrawPromptBar(buff);
  } else {
    DrawInfoBar(buff);
  }
  DrawShortcutBar(buff);
}


void Ui::DrawHeader(FrameBuffer& buff) {
  std::string title = "ticklist";
  std::string counts = " (" + std::to_string(tasks->CountCompleted()) + "/" +
                       std::to_string(tasks->Size()) + ")";

  int len = (int) (title.size() + counts.size());
  Position curr(MAX(0, (buff.width - len) / 2), 0);

  DrawTextLine(buff, title.c_str(), curr, buff.width - curr.x, theme->header, icons, false);
  curr.x += (int) title.size();
  DrawTextLine(buff, counts.c_str(), curr, buff.width - curr.x, theme->info, icons, false);

  if (buff.height > 1) {
    DrawHorizontalLine(buff, Position(0, 1), buff.width, theme->lines, icons);
  }
}


void Ui::DrawInfoBar(FrameBuffer& buff) {
  if (buff.height < 2) return;
  Position curr(0, buff.height-2);
  DrawTextLine(buff, info_bar_text.c_str(), Position(curr.x + 1, curr.y), buff.width - 1, info_bar_style, icons, false);
}


void Ui::DrawPromptBar(FrameBuffer& buff) {
  if (buff.height < 2) return;

  const InputLine& input = window.GetInput();
  const char* label = (window.GetTarget() == TaskWindow::Target::EDIT) ? "Edit task: " : "Add task: ";

  Position curr(1, buff.height-2);
  int label_len = Utf8Strlen(label);
  DrawTextLine(buff, label, curr, buff.width - curr.x, theme->prompt, icons, false);
  curr.x += label_len;

  int width = buff.width - curr.x - 1; // -1 for right margin.
  if (width <= 0) return;

  // Scroll the text horizontally so the cursor cell is always visible.
  const std::string& text = input.GetText();
  int cursor_col = input.GetCursor();
  int start = MAX(0, cursor_col - (width - 1));

  const char* c = text.c_str();
  for (int i = 0; i < start && *c; i++) c += Utf8CharLength(*c);

  DrawTextLine(buff, c, curr, width, theme->style, icons, false);

  // The cursor is drawn as a cell with the cursor style (on the character or on
  // a space if at the end).
  Position cursor_pos(curr.x + (cursor_col - start), curr.y);
  if (cursor_pos.x < buff.width) {
    uint32_t ch = BUFF_CELL(buff, cursor_pos.x, cursor_pos.y).ch;
    Style style = theme->style.Apply(theme->cursor);
    SET_CELL(buff, cursor_pos.x, cursor_pos.y, ch, style);
  }
}


void Ui::DrawShortcutBar(FrameBuffer& buff) {
  Position curr(0, buff.height-1);
  DrawRectangleFill(buff, curr, Area(buff.width, 1), theme->statusline);

  std::string mode = (window.GetMode() == Mode::INSERT) ? " INSERT " : " NORMAL ";
  Style mode_style = theme->statusline;
  mode_style.attrib |= TICKLIST_CELL_BOLD;
  DrawTextLine(buff, mode.c_str(), curr, buff.width, mode_style, icons, false);
  curr.x += (int) mode.size() + 1;

  const char* shortcuts = (window.GetMode() == Mode::INSERT) ? SHORTCUTS_INSERT : SHORTCUTS_NORMAL;
  DrawTextLine(buff, shortcuts, curr, buff.width - curr.x, theme->statusline, icons, false);
}


void Ui::Info(const std::string& message) {
  info_bar_text = message;
  info_bar_style = theme->info;
}


void Ui::Warning(const std::string& message) {
  info_bar_text = message;
  info_bar_style = theme->warning;
}


void Ui::Error(const std::string& message) {
  info_bar_text = message;
  info_bar_style = theme->error;
}


bool Ui::IsShouldClose() const {
  return should_close || window.IsShouldClose();
}


void Ui::SetShouldClose() {
  should_close = true;
}


TaskWindow& Ui::GetTaskWindow() {
  return window;
}


const std::string& Ui::GetInfoBarText() const {
  return info_bar_text;
}


const Config& Ui::GetConfig() const {
  return *config;
}


const Theme& Ui::GetTheme() const {
  return *theme;
}


const Icons& Ui::GetIcons() const {
  return icons;
}


bool Ui::Action_Close(ActionExecutor* ae) {
  Ui* self = static_cast<Ui*>(ae);
  self->SetShouldClose();
  return true;
}
