//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#include "frontend.hpp"

// DEFINE TB_OPT_ATTR_W=32, to termbox for true color (see CMakeLists.txt). The
// implementation is compiled as C in termbox2_impl.c.
#include <termbox2/termbox2.h>


// Convert the termbox event into our event, returns false if the event should
// be ignored.
static bool _ConvertEvent(const struct tb_event& ev, Event* out);


Termbox2::~Termbox2() {
  if (initialized) Cleanup();
}


bool Termbox2::Initialize() {
  int code = tb_init();
  if (code < 0) {
    fprintf(stderr, "termbox init failed, code: %d\n", code);
    return false;
  }
  initialized = true;

  tb_set_input_mode(TB_INPUT_ESC);
  tb_set_output_mode(TB_OUTPUT_TRUECOLOR);
  return true;
}


bool Termbox2::Cleanup() {
  if (!initialized) return true;
  initialized = false;
  return tb_shutdown() == TB_OK;
}


Area Termbox2::GetDrawArea() {
  return Area(tb_width(), tb_height());
}


void Termbox2::Display(FrameBuffer& buff) {

  int width = MIN(buff.width, tb_width());
  int height = MIN(buff.height, tb_height());

  tb_clear();

  // This should be optimized with memmove of the buffer with the termbox
  // buffer and they provide an api to do so.
  for (int y = 0; y < height; y++) {
    for (int x = 0; x < width; x++) {
      Cell& cell = buff.cells[y*buff.width + x];

      // FIXME(mess): Since termbox treat 0 as the default terminal color, we
      // cannot use black with 0, so I'm using 0x000001 as black (truecolor).
      // Find a better way.
      Color fg = (cell.fg == 0) ? 0x000001 : cell.fg;
      Color bg = (cell.bg == 0) ? 0x000001 : cell.bg;

      uintattr_t attrib = 0;
      attrib |= (cell.attrib & TICKLIST_CELL_BOLD)      ? TB_BOLD : 0;
      attrib |= (cell.attrib & TICKLIST_CELL_UNDERLINE) ? TB_UNDERLINE : 0;
      attrib |= (cell.attrib & TICKLIST_CELL_ITALIC)    ? TB_ITALIC : 0;
      attrib |= (cell.attrib & TICKLIST_CELL_REVERSE)   ? TB_REVERSE : 0;
      tb_set_cell(x, y, cell.ch, fg | attrib, bg);
    }
  }

  tb_present();
}


std::vector<Event> Termbox2::GetEvents(int timeout_ms) {

  std::vector<Event> events;

  struct tb_event ev;
  int code = (timeout_ms < 0) ? tb_poll_event(&ev) : tb_peek_event(&ev, timeout_ms);

  // Timed out or interrupted by a signal, the caller will check what happened.
  if (code != TB_OK) return events;

  do {
    Event e(Event::Type::KEY);
    if (_ConvertEvent(ev, &e)) events.push_back(e);

    // Drain all the pending events (pasted text comes in a single read).
  } while (tb_peek_event(&ev, 0) == TB_OK);

  return events;
}


static bool _ConvertEvent(const struct tb_event& ev, Event* out) {

  switch (ev.type) {
    case TB_EVENT_KEY: {

      Event e(Event::Type::KEY);
      e.key.unicode = (int) ev.ch;

      e.key.alt     = (ev.mod & TB_MOD_ALT) != 0;
      e.key.ctrl    = (ev.mod & TB_MOD_CTRL) != 0;
      e.key.shift   = (ev.mod & TB_MOD_SHIFT) != 0;

      switch (ev.key) {
        case 0                       : break;
        case TB_KEY_DELETE           : e.key.code = Event::KEY_DELETE; break;
        case TB_KEY_HOME             : e.key.code = Event::KEY_HOME; break;
        case TB_KEY_END              : e.key.code = Event::KEY_END; break;
        case TB_KEY_PGUP             : e.key.code = Event::KEY_PAGE_UP; break;
        case TB_KEY_PGDN             : e.key.code = Event::KEY_PAGE_DOWN; break;
        case TB_KEY_ARROW_UP         : e.key.code = Event::KEY_UP; break;
        case TB_KEY_ARROW_DOWN       : e.key.code = Event::KEY_DOWN; break;
        case TB_KEY_ARROW_LEFT       : e.key.code = Event::KEY_LEFT; break;
        case TB_KEY_ARROW_RIGHT      : e.key.code = Event::KEY_RIGHT; break;
        case TB_KEY_SPACE            : e.key.code = Event::KEY_SPACE; break;

        // The terminal sends the same byte for these and their ctrl
        // combinations (ctrl+h, ctrl+i, ctrl+m, ctrl+[), they're keys.
        case TB_KEY_BACKSPACE        :
        case TB_KEY_BACKSPACE2       : e.key.ctrl = false; e.key.code = Event::KEY_BACKSPACE; break;
        case TB_KEY_TAB              : e.key.ctrl = false; e.key.code = Event::KEY_TAB; break;
        case TB_KEY_ENTER            : e.key.ctrl = false; e.key.code = Event::KEY_ENTER; break;
        case TB_KEY_ESC              : e.key.ctrl = false; e.key.code = Event::KEY_ESCAPE; break;

        case TB_KEY_CTRL_BACKSLASH   : e.key.ctrl = true; e.key.code = Event::KEY_BACKSLASH; break;
        case TB_KEY_CTRL_RSQ_BRACKET : e.key.ctrl = true; e.key.code = Event::KEY_RIGHT_BRACKET; break;
        case TB_KEY_CTRL_SLASH       : e.key.ctrl = true; e.key.code = Event::KEY_SLASH; break;

        default: {
          // The rest of the control codes (0x01 - 0x1a) are ctrl+<letter>.
          if (TB_KEY_CTRL_A <= ev.key && ev.key <= TB_KEY_CTRL_Z) {
            e.key.ctrl = true;
            e.key.code = (Event::Keycode) (Event::KEY_A + (ev.key - TB_KEY_CTRL_A));
            break;
          }
          return false; // Function keys etc. aren't bindable.
        }
      }

      // Space is a key not a character, so it can be bound as <space>.
      if (e.key.unicode == ' ') {
        e.key.unicode = 0;
        e.key.code = Event::KEY_SPACE;
      }

      // A character event shouldn't carry the modifiers.
      if (e.key.unicode != 0) {
        e.key.code  = Event::KEY_NULL;
        e.key.alt   = false;
        e.key.ctrl  = false;
        e.key.shift = false;
      } else if (e.key.code == Event::KEY_NULL) {
        return false;
      }

      *out = e;
      return true;
    } break;

    case TB_EVENT_RESIZE: {
      Event e(Event::Type::RESIZE);
      e.resize.width  = ev.w;
      e.resize.height = ev.h;
      *out = e;
      return true;
    } break;

  }

  return false;
}
