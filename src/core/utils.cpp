//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#include "core.hpp"

#include <ctype.h>


// The non ascii characters are all encoded as this so they can't collide with
// a binding (bindings are ascii only) and will be inserted as text.
#define NON_ASCII_CODEPOINT 0xff


event_t EncodeKeyEvent(Event::Key key) {
  uint32_t ret = 0x0;
  if (key.unicode != 0) {
    uint32_t c = (key.unicode < 0x80) ? key.unicode : NON_ASCII_CODEPOINT;
    ret |= (c << 16);
  } else {
    ret |= key.code;
    ret |= key.ctrl  ? 0x400  : 0;
    ret |= key.alt   ? 0x800  : 0;
    ret |= key.shift ? 0x1000 : 0;
  }
  return ret;
}


// -----------------------------------------------------------------------------
// String functions.
// -----------------------------------------------------------------------------

bool StartsWith(std::string_view str, std::string_view prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}


bool IsCharWhitespace(int c) {
  return (c == ' ' || c == '\t' || c == '\n' || c == '\r');
}


std::vector<std::string> StringSplit(const std::string& str, char delim) {
  std::vector<std::string> ret;
  std::string_view rest = str;
  while (true) {
    size_t pos = rest.find(delim);
    ret.emplace_back(rest.substr(0, pos));
    if (pos == std::string_view::npos) break;
    rest.remove_prefix(pos + 1);
  }
  return ret;
}


std::string StringTrim(const std::string& str) {
  size_t begin = 0, end = str.size();
  while (begin < end && IsCharWhitespace(str[begin])) begin++;
  while (end > begin && IsCharWhitespace(str[end-1])) end--;
  return str.substr(begin, end - begin);
}


// -----------------------------------------------------------------------------
// Draw primitives.
// -----------------------------------------------------------------------------


void DrawTextLine(
    FrameBuffer& buff,
    const char* text,
    Position pos,
    int width,
    Style style,
    const Icons& icons,
    bool fill_area) {

  if (text == NULL) return;
  if (pos.col < 0 || pos.row < 0) return;
  if (pos.col >= buff.width || pos.row >= buff.height) return;
  if (pos.col + width > buff.width) width = buff.width - pos.col;
  if (width <= 0) return;

  int length = Utf8Strlen(text);
  int text_len = MIN(length, width);
  int trim_indicator = icons.trim_indicator;

  bool trimming = (length > width);
  if (trimming) text_len -= 1;

  // Current x position we're drawing.
  int x = pos.col;
  const char* c = text;

  for (; x < pos.col + text_len; x++) {
    uint32_t ch;
    c += Utf8CharToUnicode(&ch, c);
    if (ch == '\n' || ch == '\t') ch = ' ';
    SET_CELL(buff, x, pos.row, ch, style);
  }

  if (trimming) SET_CELL(buff, x++, pos.row, trim_indicator, style);
  if (fill_area) {
    while (x < (pos.col + width)) {
      SET_CELL(buff, x++, pos.row, ' ', style);
    }
  }
}


void DrawIcon(FrameBuffer& buff, int icon, Position pos, Style style) {
  if (pos.x < 0 || pos.y < 0) return;
  if (pos.x >= buff.width || pos.y >= buff.height) return;
  SET_CELL(buff, pos.x, pos.y, icon, style);
}


void DrawRectangleFill(FrameBuffer& buff, Position pos, Area area, Style style) {

  // Clip the rectangle to our frame and if the entire rectangle is out of the
  // current frame or the size after clip is zero we don't have to draw.
  if (pos.x >= buff.width || pos.y >= buff.height) return;
  pos.x = MAX(pos.x, 0);
  pos.y = MAX(pos.y, 0);
  area.width  = MIN(area.width, buff.width-pos.x);
  area.height = MIN(area.height, buff.height-pos.y);
  if (area.width <= 0 || area.height <= 0) return;

  for (int y = pos.y; y < pos.y+area.height; y++) {
    for (int x = pos.x; x < pos.x+area.width; x++) {
      SET_CELL(buff, x, y, ' ', style);
    }
  }
}


void DrawHorizontalLine(FrameBuffer& buff, Position pos, int width, Style style, const Icons& icons) {
  // Clip the line and if it's out of the current frame, we don't have to draw.
  if (pos.x >= buff.width || pos.y >= buff.height) return;
  pos.x = MAX(pos.x, 0);
  pos.y = MAX(pos.y, 0);
  width = MIN(width, buff.width-pos.x);
  if (width <= 0) return;

  for (int x = pos.x; x < pos.x+width; x++) {
    SET_CELL(buff, x, pos.y, icons.hl, style);
  }
}


// ----------------------------------------------------------------------------
// Utf8 helper functions.
// ----------------------------------------------------------------------------

// Only the sequences up to 4 bytes are valid (codepoint <= 0x10ffff), an
// invalid lead byte is treated as a single byte character.
int Utf8CharLength(char c) {
  unsigned char byte = (unsigned char) c;
  if (byte < 0x80) return 1;
  if ((byte & 0xe0) == 0xc0) return 2;
  if ((byte & 0xf0) == 0xe0) return 3;
  if ((byte & 0xf8) == 0xf0) return 4;
  return 1;
}


int Utf8CharToUnicode(uint32_t *out, const char *c) {
  if (*c == '\0') return -1;

  static const unsigned char lead_mask[] = { 0x00, 0x7f, 0x1f, 0x0f, 0x07 };

  int len = Utf8CharLength(*c);
  uint32_t result = (unsigned char) c[0] & lead_mask[len];
  for (int i = 1; i < len; i++) {
    if (c[i] == '\0') { len = i; break; } // Truncated sequence.
    result = (result << 6) | ((unsigned char) c[i] & 0x3f);
  }

  *out = result;
  return len;
}


int Utf8Strlen(const char* str) {
  int length = 0;
  while (*str) {
    int len = Utf8CharLength(*str);
    for (int i = 0; i < len && *str; i++) str++;
    length++;
  }
  return length;
}


std::string Utf8UnicodeToString(uint32_t c) {
  std::string ret;
  if (c < 0x80) {
    ret += (char) c;
  } else if (c < 0x800) {
    ret += (char) (0xc0 | (c >> 6));
    ret += (char) (0x80 | (c & 0x3f));
  } else if (c < 0x10000) {
    ret += (char) (0xe0 | (c >> 12));
    ret += (char) (0x80 | ((c >> 6) & 0x3f));
    ret += (char) (0x80 | (c & 0x3f));
  } else {
    ret += (char) (0xf0 | ((c >> 18) & 0x07));
    ret += (char) (0x80 | ((c >> 12) & 0x3f));
    ret += (char) (0x80 | ((c >> 6) & 0x3f));
    ret += (char) (0x80 | (c & 0x3f));
  }
  return ret;
}


// ----------------------------------------------------------------------------
// Key combination parsing.
// ----------------------------------------------------------------------------

// Names of the keys written inside angle brackets ("<enter>", "<C-down>").
static const struct {
  const char* name;
  Event::Keycode code;
} special_keys[] = {
  { "esc",       Event::KEY_ESCAPE    },
  { "space",     Event::KEY_SPACE     },
  { "enter",     Event::KEY_ENTER     },
  { "tab",       Event::KEY_TAB       },
  { "backspace", Event::KEY_BACKSPACE },
  { "del",       Event::KEY_DELETE    },
  { "up",        Event::KEY_UP        },
  { "down",      Event::KEY_DOWN      },
  { "left",      Event::KEY_LEFT      },
  { "right",     Event::KEY_RIGHT     },
  { "home",      Event::KEY_HOME      },
  { "end",       Event::KEY_END       },
  { "pageup",    Event::KEY_PAGE_UP   },
  { "pagedown",  Event::KEY_PAGE_DOWN },
};


// Characters which can be bound without the angle brackets.
static bool IsBindableCharacter(char c) {
  if (BETWEEN('a', c, 'z') || BETWEEN('A', c, 'Z') || BETWEEN('0', c, '9')) return true;
  return strchr("',-=./\\;[]`", c) != nullptr;
}


// Parse the inside of "<...>" which is the modifiers followed by a key name
// or a single character.
static bool ParseBracketKey(std::string_view str, Event::Key* key) {

  while (str.size() > 2 && str[1] == '-') {
    switch (str[0]) {
      case 'C': key->ctrl  = true; break;
      case 'A': key->alt   = true; break;
      case 'S': key->shift = true; break;
      default: return false;
    }
    str.remove_prefix(2);
  }

  for (const auto& special : special_keys) {
    if (str == special.name) {
      key->code = special.code;
      return true;
    }
  }

  if (str.size() != 1) return false;
  char c = str[0];

  if (BETWEEN('a', c, 'z') || BETWEEN('A', c, 'Z')) {
    key->code = (Event::Keycode) (Event::KEY_A + (toupper(c) - 'A'));
    return true;
  }
  if (BETWEEN('0', c, '9') || c == '-' || c == '/' || c == '\\' || c == '[' || c == ']') {
    key->code = (Event::Keycode) c;
    return true;
  }

  return false;
}


bool ParseKeyBindingString(std::vector<event_t>& events, const char* binding) {
  std::string_view str = binding;

  while (!str.empty()) {
    Event::Key key {};

    if (str[0] == '<') {
      size_t end = str.find('>');
      if (end == std::string_view::npos) return false;
      if (!ParseBracketKey(str.substr(1, end - 1), &key)) return false;
      str.remove_prefix(end + 1);

    } else {
      if (!IsBindableCharacter(str[0])) return false;
      key.unicode = str[0];
      str.remove_prefix(1);
    }

    events.push_back(EncodeKeyEvent(key));
  }

  return true;
}
