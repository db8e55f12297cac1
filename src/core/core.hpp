//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#pragma once

// -----------------------------------------------------------------------------
// Include required headers.
// -----------------------------------------------------------------------------

#include <stdio.h>
#include <stdlib.h>
#include <stdint.h>
#include <string.h>

#include <optional>
#include <memory>

#include <vector>
#include <string>
#include <string_view>
#include <map>

#include <algorithm>

#include <nlohmann/json.hpp>
using Json = nlohmann::json;

#include <ticklist.hpp>


// -----------------------------------------------------------------------------
// Common macros.
// -----------------------------------------------------------------------------


#define MIN(a, b) (((a) < (b)) ? (a) : (b))
#define MAX(a, b) (((a) > (b)) ? (a) : (b))

#define BETWEEN(a, b, c) ((a) <= (b) && (b) <= (c))

#define CLAMP(a, b, c) \
  (b) < (a)            \
  ? (a)                \
  : ((b) > (c)         \
     ? (c)             \
     : (b))


#define NO_OP do {} while (false)

#define OOPS "Oops a bug!! report please."


// Assertions are only for the invariants of the code (bugs) and compiled out
// in the release builds, never use them for the runtime errors.
#ifdef DEBUG

#define ASSERT(condition, message)                                   \
  do {                                                               \
    if (!(condition)) {                                              \
      fprintf(stderr, "Assertion failed: %s\n\tat %s() (%s:%i)\n"    \
                      "\tcondition: %s\n",                           \
        message, __func__, __FILE__, __LINE__, #condition);          \
      __builtin_trap();                                              \
    }                                                                \
  } while (false)

#define ASSERT_INDEX(index, size) \
  ASSERT((index) >= 0 && (index) < (size), "Index out of bounds.")

#define UNREACHABLE()                                                \
  do {                                                               \
    fprintf(stderr, "Execution reached an unreachable path\n"        \
      "\tat %s() (%s:%i)\n", __func__, __FILE__, __LINE__);          \
    __builtin_trap();                                                \
  } while (false)

#else // #ifdef DEBUG

#define ASSERT(condition, message) NO_OP
#define ASSERT_INDEX(index, size) NO_OP
#define UNREACHABLE() __builtin_unreachable()

#endif // #ifdef DEBUG


// This will mark a class non-copiable by deleting the copy constructor and
// copy assignment.
#define NO_COPY_CONSTRUCTOR(T) \
  T (const T&) = delete; \
  T& operator= (const T&) = delete


// -----------------------------------------------------------------------------
// Application specific macros.
// -----------------------------------------------------------------------------


#define BUFF_CELL(buff, x, y)\
  (buff).cells[ (buff).width * ((y)) + (x)  ]


// Note that the caller should make sure x, y are in the bounds of the buffer,
// the draw primitives bellow do the clipping before using this.
#define SET_CELL(buff, x, y, c, style)             \
  do {                                             \
    Cell& cell  = BUFF_CELL((buff), (x), (y));     \
    cell.ch     = (c);                             \
    cell.fg     = (style).fg.value_or(0xd4d4d4);   \
    cell.bg     = (style).bg.value_or(0x1e1e1e);   \
    cell.attrib = (style).attrib;                  \
  } while (false)


// Attribute of the cells.
#define TICKLIST_CELL_BOLD      0x01
#define TICKLIST_CELL_UNDERLINE 0x02
#define TICKLIST_CELL_ITALIC    0x04
#define TICKLIST_CELL_REVERSE   0x08


// -----------------------------------------------------------------------------
// Core types, typedefs and structs.
// -----------------------------------------------------------------------------


// The key event is serialized into a single integer to be used in map keys and
// compact form where the ctrl/alt/shift are set as bits in the integer.
//
//   0000 0000 0000 0000   0000 0000 0000 0000
//             ^       ^      ^ ^^^-- keycode  mask = 0x3ff, shift = 0
//             '-------'      | |`---- ctrl    mask = 0x400
//                 |          | '----- alt     mask = 0x800
//                 |          '------- shift   mask = 0x1000
//                 '------------------ ascii   mask = 0xff0000, shift = 16
//
typedef uint32_t event_t;


// The color value is stored as an integer (0xrrggbb).
typedef uint32_t Color;


struct Position {
  Position(int x=0, int y=0) : x(x), y(y) {}
  union {
    int row;
    int y;
  };
  union {
    int x;
    int col;
  };
};


struct Area {
  Area(int width=0, int height=0) : width(width), height(height) {}
  int width;
  int height;
};


// Style is a foreground, background color and attribute (bold, italic, etc).
// Each ui element ("ui.text", "task.done", "ui.statusline") has it's own style.
struct Style {
  std::optional<Color> fg;
  std::optional<Color> bg;
  uint8_t attrib = 0;

  // Apply this style with the given style, which will override the fg, bg and
  // bitwise or the attribute.
  Style Apply(const Style& other) const;
};


// The UI is considered as a grid of cells, each cell has foreground and
// background colors. The color values are rgb values structured as 0xrrggbb.
typedef struct {
  uint32_t ch;     // Unicode codepoint.
  Color    fg;     // Foreground color.
  Color    bg;     // Background color.
  uint8_t  attrib; // Attribute of the cell. Set with TICKLIST_CELL_* macros.
} Cell;


// FrameBuffer is filled with the cell values by the ui at the draw call which
// then will be displaied by the front end.
typedef struct {
  std::vector<Cell> cells;
  int width;
  int height;
} FrameBuffer;


// The core is independent of the front end, each front end converts its own
// events into this.
struct Event {

  // Printable keys have their ascii value (upper case for the letters) and
  // the other keys are after 256, so they never collide.
  typedef enum {
    KEY_NULL          = 0,
    KEY_SPACE         = ' ',
    KEY_MINUS         = '-',
    KEY_SLASH         = '/',
    KEY_ZERO          = '0',
    KEY_LEFT_BRACKET  = '[',
    KEY_BACKSLASH     = '\\',
    KEY_RIGHT_BRACKET = ']',

    KEY_A = 'A', KEY_B, KEY_C, KEY_D, KEY_E, KEY_F, KEY_G, KEY_H, KEY_I,
    KEY_J, KEY_K, KEY_L, KEY_M, KEY_N, KEY_O, KEY_P, KEY_Q, KEY_R, KEY_S,
    KEY_T, KEY_U, KEY_V, KEY_W, KEY_X, KEY_Y, KEY_Z,

    KEY_ESCAPE = 256,
    KEY_ENTER,
    KEY_TAB,
    KEY_BACKSPACE,
    KEY_DELETE,
    KEY_RIGHT,
    KEY_LEFT,
    KEY_DOWN,
    KEY_UP,
    KEY_PAGE_UP,
    KEY_PAGE_DOWN,
    KEY_HOME,
    KEY_END,
  } Keycode;

  struct Resize {
    unsigned int width;
    unsigned int height;
  };

  // Note that it should be either unicode, or normal key. And if unicode is set
  // the reset of the values should be 0 (ignored otherwise). and if unicode is
  // zero the key code will be evaluvated.
  struct Key {
    int unicode;

    Keycode code;
    bool alt;
    bool ctrl;
    bool shift;
  };

  enum class Type {
    CLOSE,
    RESIZE,
    KEY,
  };

  Type type;

  union {
    Resize     resize;
    Key        key;
  };

  Event(Event::Type type) : type(type), key(Key()) {}

};


// The input modes. A binding registered with Mode::NONE is active regardless of
// the mode of the action executor.
enum class Mode {
  NONE,
  NORMAL,
  INSERT,
};

const char* ModeToString(Mode mode);

// Returns false if the name isn't a mode name ("normal", "insert").
bool ModeFromString(const std::string& name, Mode* mode);


// The application's global configuration, loaded from the config json file
// (see Platform::LoadConfig()) on top of the default values here.
struct Config {

  // A key binding defined by the user, registered after the default bindings
  // so it'll override the default one if the key combination is the same.
  struct Binding {
    Mode mode;
    std::string keys;   // Key combination string like "dd", "<C-x>".
    std::string action; // Name of a registered action.
  };

  // The directory where the tasks.md file lives. An empty value means the
  // platform's default data directory.
  std::string todo_path;

  std::string theme = "default";
  Json theme_overrides = Json::object();

  int scrolloff = 2;  // Margin between the cursor and the view edge (vertical).
  bool grouped_view = false;

  std::vector<Binding> bindings;

  // !! WARNING !! This will throw std::runtime_error if a value has a wrong
  // type, the caller should catch and report. Non fatal issues (unknown keys)
  // are pushed to the warnings.
  void LoadJson(const Json& json, std::vector<std::string>* warnings);
};


// -----------------------------------------------------------------------------
// KeyTree.
// -----------------------------------------------------------------------------


// Use This macros on ActionExecutor classes to define the GetClassName method.
#define DEFINE_GET_CLASS_NAME(T)               \
  public:                                      \
  static const std::string& ClassName() {      \
    static const std::string& class_name = #T; \
    return class_name;                         \
  }                                            \
                                               \
  const std::string& GetClassName() const override { \
    return ClassName();                        \
  }                                            \
  private:


// An action executor is anything that key bindings can run actions on (the ui
// and the task window). Bindings are looked up with the executor's class name
// and its current mode.

class ActionExecutor {
public:
  virtual ~ActionExecutor() = default;
  virtual const std::string& GetClassName() const = 0;

  Mode GetMode() const;
  void SetMode(Mode mode);

protected:
  Mode mode = Mode::NONE;
};


typedef std::string ActExName;
typedef std::string ActionName;
typedef std::pair<ActExName, Mode> BindingKey;
typedef std::pair<ActExName, ActionName> ActionKey;
// An action returns true if the event is consumed.
typedef bool (*FuncAction)(ActionExecutor*);


// A trie of encoded key events, so a binding can be a sequence of keys ("gg",
// "dd"). The actions are registered by name first and then bound to the keys.
class KeyTree {
public:

  // The bindings of a node are keyed by (executor class, mode) so the same
  // keys can do different things in normal and insert mode.
  struct Node {
    std::map<event_t, std::unique_ptr<Node>> children;
    std::map<BindingKey, FuncAction> bindings;
  };

  KeyTree();
  NO_COPY_CONSTRUCTOR(KeyTree);

  void RegisterAction(const ActExName& class_name, const ActionName& action_name, FuncAction action);
  bool HasAction(const ActExName& class_name, const ActionName& action_name) const;

  // Returns false if the key combination cannot be parsed or the action isn't
  // registered. If registered without specifing a mode, Mode::NONE will be used.
  bool RegisterBinding(const ActExName& actex_name, const std::string& key_combination, const std::string& action_name);
  bool RegisterBinding(const ActExName& actex_name, Mode mode, const std::string& key_combination, const std::string& action_name);

private:
  std::map<ActionKey, FuncAction> actions;
  std::unique_ptr<Node> root;

  friend class KeyTreeCursor;
};


// Walks the key tree one event at a time while a key sequence is typed. The
// ui owns one cursor and resets it once an action runs or the sequence breaks.
class KeyTreeCursor {
public:
  KeyTreeCursor(const KeyTree* tree);

  // Advances the cursor with the event if the executor (in its current mode)
  // or a mode-less binding can continue from here. Returns false otherwise and
  // for a null executor.
  bool ConsumeEvent(const ActionExecutor* actex, const Event& event);

  // Runs the action bound at the current node for the executor's mode, then
  // for the mode-less binding. Returns true if an action ran and consumed it.
  bool TryEvent(ActionExecutor* actex);

  // True if longer sequences continue from the current node.
  bool HasMore() const;

  void ResetCursor();
  bool IsCursorRoot() const;

  // The events consumed since the cursor left the root.
  const std::vector<event_t>& GetRecordedEvents() const;

private:
  const KeyTree* tree = nullptr;
  KeyTree::Node* node;
  std::vector<event_t> recorded_events;

private:
  bool CanConsume(const ActExName& actex_name, Mode mode, const KeyTree::Node* curr) const;
};


// -----------------------------------------------------------------------------
// Theme.
// -----------------------------------------------------------------------------


class Icons {
public:
  int hl = 0x2500; // ─

  int trim_indicator = 0x2026; // …

  // Task state glyphs.
  int task_todo      = '-';
  int task_doing     = '~';
  int task_done      = 0x2713; // ✓
  int task_important = '!';
};


class Theme {

public:

  // Load the theme from a json object. The keys are ui element names like
  // "ui.text", "task.done" and the value is either a color string ("#rrggbb"
  // or a palette name) or a table with "fg", "bg" and "modifiers". Invalid
  // entries are skipped and reported to the warnings (if not nullptr).
  Theme(const Json& json, std::vector<std::string>* warnings = nullptr);

  // Returns the Style for the given name. For a key like "ui.statusline.insert"
  // if not exists, we again search for "ui.statusline" and then "ui". If
  // nothing matched the returned style will be empty.
  Style GetStyle(const std::string& name) const;

  // Converts a hex string of color values and returns as the equelevent numeric value.
  // as 0x00rrggbb value.
  static bool StringToColor(const char* str, Color* rgb);

  // Pre-computed styles of the ui elements.
  Style text;
  Style background;
  Style style;          // text applied on the background.
  Style header;
  Style lines;
  Style selection;
  Style group_header;
  Style statusline;
  Style prompt;
  Style cursor;
  Style info;
  Style warning;
  Style error;
  Style task_todo;
  Style task_doing;
  Style task_done;
  Style task_important;

private:
  // An entry is a pair of ui element name and the style for that element.
  std::map<std::string, Style> entries;

  void ExtractJson(const Json& json, std::vector<std::string>* warnings);
  void UpdateUiEntries();
};


// ----------------------------------------------------------------------------
// Abstract Frontend and Ui interface.
// ----------------------------------------------------------------------------


// The abstract class representing the front end. Any front end implementation
// should be able to provide events and handle drawings.
class IFrontEnd {
public:
  virtual bool Initialize() = 0;
  virtual bool Cleanup() = 0;

  // Wait for at most timeout_ms milliseconds for the events, returns an empty
  // list if nothing happened. A negative timeout will block till an event.
  virtual std::vector<Event> GetEvents(int timeout_ms) = 0;

  // The size of the drawable area. The frame buffer we draw should match it.
  virtual Area GetDrawArea() = 0;

  virtual void Display(FrameBuffer& buff) = 0;

  virtual ~IFrontEnd() = default;
};


// An abstract interface for the Ui class defined in the ui directory. A
// Ui is simply something that should be able to handle events and draw
// itself on a frame buffer.
class IUi {
public:
  virtual ~IUi() = default;

  virtual bool HandleEvent(const Event& event) = 0;
  virtual void Draw(FrameBuffer& buff) = 0;
};


// ----------------------------------------------------------------------------
// Util function definitions.
// ----------------------------------------------------------------------------


// String related util functions.
bool IsCharWhitespace(int c); // Returns the given codepoint [\t\n\r' '].
bool StartsWith(std::string_view str, std::string_view suffix);
std::vector<std::string> StringSplit(const std::string& str, char delim);
std::string StringTrim(const std::string& str);

// UTF8 helper functions.
int Utf8CharLength(char c);
int Utf8CharToUnicode(uint32_t *out, const char *c);
int Utf8Strlen(const char* str);
std::string Utf8UnicodeToString(uint32_t c);

// Draw a NULL terminated text (utf8) to the specified position and width.
void DrawTextLine(
    FrameBuffer& buff,
    const char* text,
    Position pos,
    int width,          // If the text goes beyond the width it'll terminate.
    Style style,
    const Icons& icons, // Needed to draw text terminated indicator.
    bool fill_area);    // If true all the width is filled with the bg othereise only the text is drawn with the given bg.

// Draws an icon which is a single codepoint.
void DrawIcon(FrameBuffer& buff, int icon, Position pos, Style style);

void DrawRectangleFill(FrameBuffer& buff, Position pos, Area area, Style style);
void DrawHorizontalLine(FrameBuffer& buff, Position pos, int width, Style style, const Icons& icons);


// On a successfull parse, it'll return true and push all the keys are parsed
// from that string.
//
// - Note that it'll not clear the events vector, but just push along with
//   whatever is already in the vector, so make sure it's empty before calling.
//
// - Note that an empty string is valid here and result empty events.
//
bool ParseKeyBindingString(std::vector<event_t>& events, const char* binding);

// Packs the key code, modifiers and unicode value into a single key tree event.
event_t EncodeKeyEvent(Event::Key key);
