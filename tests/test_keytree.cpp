//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#include <doctest/doctest.h>

#include "core/core.hpp"
#include "test_utils.hpp"


class Counter : public ActionExecutor {
  DEFINE_GET_CLASS_NAME(Counter);

public:
  int hits = 0;
  int others = 0;

  static bool Action_Hit(Counter* self) { self->hits++; return true; }
  static bool Action_Other(Counter* self) { self->others++; return true; }
};


static std::vector<event_t> Parse(const char* binding) {
  std::vector<event_t> events;
  REQUIRE(ParseKeyBindingString(events, binding));
  return events;
}


static bool IsInvalid(const char* binding) {
  std::vector<event_t> events;
  return !ParseKeyBindingString(events, binding);
}


// Feed a single event the way the ui does and returns true if an action ran.
static bool Feed(KeyTreeCursor& cursor, Counter& counter, const Event& event) {
  if (!cursor.ConsumeEvent(&counter, event)) {
    cursor.ResetCursor();
    return false;
  }
  if (cursor.TryEvent(&counter)) {
    cursor.ResetCursor();
    return true;
  }
  if (!cursor.HasMore()) cursor.ResetCursor();
  return false;
}


TEST_CASE("parsing single characters") {
  std::vector<event_t> events = Parse("dd");
  REQUIRE(events.size() == 2);
  CHECK(events[0] == events[1]);
  CHECK(events[0] == EncodeKeyEvent(CharEvent('d').key));

  CHECK(Parse("G")[0] == EncodeKeyEvent(CharEvent('G').key));
  CHECK(Parse("G")[0] != Parse("g")[0]);
  CHECK(Parse("").empty());
}


TEST_CASE("parsing special keys and modifiers") {
  CHECK(Parse("<enter>")[0] == EncodeKeyEvent(KeyEvent(Event::KEY_ENTER).key));
  CHECK(Parse("<esc>")[0] == EncodeKeyEvent(KeyEvent(Event::KEY_ESCAPE).key));
  CHECK(Parse("<space>")[0] == EncodeKeyEvent(CharEvent(' ').key));
  CHECK(Parse("<C-c>")[0] == EncodeKeyEvent(KeyEvent(Event::KEY_C, true).key));
  CHECK(Parse("<S-down>")[0] == EncodeKeyEvent(KeyEvent(Event::KEY_DOWN, false, true).key));

  std::vector<event_t> events = Parse("g<C-x>");
  REQUIRE(events.size() == 2);
  CHECK(events[0] == EncodeKeyEvent(CharEvent('g').key));
  CHECK(events[1] == EncodeKeyEvent(KeyEvent(Event::KEY_X, true).key));
}


TEST_CASE("invalid binding strings are rejected") {
  CHECK(IsInvalid("<foo>"));
  CHECK(IsInvalid("<C-a"));
  CHECK(IsInvalid("<"));
  CHECK(IsInvalid("a b"));
  CHECK(IsInvalid("\xc3\xa9")); // é
}


TEST_CASE("non ascii characters are encoded the same") {
  Event a = CharEvent(0xe9);   // é
  Event b = CharEvent(0x4e2d); // 中
  CHECK(EncodeKeyEvent(a.key) == EncodeKeyEvent(b.key));
  CHECK(EncodeKeyEvent(a.key) != EncodeKeyEvent(CharEvent('i').key));
}


TEST_CASE("binding requires a registered action") {
  KeyTree tree;
  tree.RegisterAction(Counter::ClassName(), "hit", (FuncAction) Counter::Action_Hit);

  CHECK(tree.HasAction(Counter::ClassName(), "hit"));
  CHECK_FALSE(tree.HasAction(Counter::ClassName(), "miss"));

  CHECK(tree.RegisterBinding(Counter::ClassName(), "x", "hit"));
  CHECK_FALSE(tree.RegisterBinding(Counter::ClassName(), "y", "miss"));
  CHECK_FALSE(tree.RegisterBinding(Counter::ClassName(), "<bad>", "hit"));
  CHECK_FALSE(tree.RegisterBinding(Counter::ClassName(), "", "hit"));
}


TEST_CASE("sequence binding runs only after the whole sequence") {
  KeyTree tree;
  tree.RegisterAction(Counter::ClassName(), "hit", (FuncAction) Counter::Action_Hit);
  tree.RegisterAction(Counter::ClassName(), "other", (FuncAction) Counter::Action_Other);
  REQUIRE(tree.RegisterBinding(Counter::ClassName(), "dd", "hit"));
  REQUIRE(tree.RegisterBinding(Counter::ClassName(), "x", "other"));

  Counter counter;
  KeyTreeCursor cursor(&tree);

  CHECK_FALSE(Feed(cursor, counter, CharEvent('d')));
  CHECK_FALSE(cursor.IsCursorRoot());
  CHECK(cursor.GetRecordedEvents().size() == 1);

  CHECK(Feed(cursor, counter, CharEvent('d')));
  CHECK(counter.hits == 1);
  CHECK(cursor.IsCursorRoot());

  // An unbound key in the middle of the sequence drops it.
  CHECK_FALSE(Feed(cursor, counter, CharEvent('d')));
  CHECK_FALSE(Feed(cursor, counter, CharEvent('x')));
  CHECK(cursor.IsCursorRoot());
  CHECK(counter.hits == 1);
  CHECK(counter.others == 0);
}


TEST_CASE("mode specific bindings") {
  KeyTree tree;
  tree.RegisterAction(Counter::ClassName(), "hit", (FuncAction) Counter::Action_Hit);
  tree.RegisterAction(Counter::ClassName(), "other", (FuncAction) Counter::Action_Other);
  REQUIRE(tree.RegisterBinding(Counter::ClassName(), Mode::NORMAL, "q", "hit"));
  REQUIRE(tree.RegisterBinding(Counter::ClassName(), Mode::INSERT, "q", "other"));
  REQUIRE(tree.RegisterBinding(Counter::ClassName(), Mode::NORMAL, "dd", "hit"));
  REQUIRE(tree.RegisterBinding(Counter::ClassName(), "<C-c>", "other"));

  Counter counter;
  KeyTreeCursor cursor(&tree);

  counter.SetMode(Mode::NORMAL);
  CHECK(Feed(cursor, counter, CharEvent('q')));
  CHECK(counter.hits == 1);

  counter.SetMode(Mode::INSERT);
  CHECK(Feed(cursor, counter, CharEvent('q')));
  CHECK(counter.others == 1);

  // "d" only leads to a normal mode binding.
  CHECK_FALSE(cursor.ConsumeEvent(&counter, CharEvent('d')));
  CHECK(cursor.IsCursorRoot());

  // Mode independent binding works in every mode.
  CHECK(Feed(cursor, counter, KeyEvent(Event::KEY_C, true)));
  CHECK(counter.others == 2);
  counter.SetMode(Mode::NORMAL);
  CHECK(Feed(cursor, counter, KeyEvent(Event::KEY_C, true)));
  CHECK(counter.others == 3);
}


TEST_CASE("rebinding a key replaces the action") {
  KeyTree tree;
  tree.RegisterAction(Counter::ClassName(), "hit", (FuncAction) Counter::Action_Hit);
  tree.RegisterAction(Counter::ClassName(), "other", (FuncAction) Counter::Action_Other);
  REQUIRE(tree.RegisterBinding(Counter::ClassName(), Mode::NORMAL, "x", "hit"));
  REQUIRE(tree.RegisterBinding(Counter::ClassName(), Mode::NORMAL, "x", "other"));

  Counter counter;
  counter.SetMode(Mode::NORMAL);
  KeyTreeCursor cursor(&tree);

  CHECK(Feed(cursor, counter, CharEvent('x')));
  CHECK(counter.hits == 0);
  CHECK(counter.others == 1);
}


TEST_CASE("mode names") {
  Mode mode;
  REQUIRE(ModeFromString("normal", &mode));
  CHECK(mode == Mode::NORMAL);
  REQUIRE(ModeFromString("insert", &mode));
  CHECK(mode == Mode::INSERT);
  CHECK_FALSE(ModeFromString("visual", &mode));
  CHECK(std::string(ModeToString(Mode::INSERT)) == "insert");
}
