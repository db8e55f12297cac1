//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#include <doctest/doctest.h>

#include "tasks/tasklist.hpp"


static TaskList MakeList(std::initializer_list<const char*> texts) {
  TaskList list;
  for (const char* text : texts) list.Add(text);
  list.ClearDirty();
  return list;
}


TEST_CASE("add appends a todo task and selects it") {
  TaskList list;
  REQUIRE(list.Empty());

  CHECK(list.Add("  Buy milk  "));
  REQUIRE(list.Size() == 1);
  CHECK(list.Get(0) == Task("Buy milk", TaskState::TODO));
  CHECK(list.GetCursor() == 0);
  CHECK(list.IsDirty());

  CHECK(list.Add("Walk the dog"));
  CHECK(list.GetCursor() == 1);
}


TEST_CASE("add rejects an empty or blank text") {
  TaskList list;
  CHECK_FALSE(list.Add(""));
  CHECK_FALSE(list.Add("   \t "));
  CHECK(list.Empty());
  CHECK_FALSE(list.IsDirty());
}


TEST_CASE("toggle flips between done and todo") {
  TaskList list = MakeList({ "A" });

  CHECK(list.Toggle(0));
  CHECK(list.Get(0).state == TaskState::DONE);
  CHECK(list.CountCompleted() == 1);

  CHECK(list.Toggle(0));
  CHECK(list.Get(0).state == TaskState::TODO);
  CHECK(list.CountCompleted() == 0);

  // Non done states toggle to done.
  list.Cycle(0); // DOING
  CHECK(list.Toggle(0));
  CHECK(list.Get(0).state == TaskState::DONE);
}


TEST_CASE("cycle goes through all the states") {
  TaskList list = MakeList({ "A" });

  list.Cycle(0); CHECK(list.Get(0).state == TaskState::DOING);
  list.Cycle(0); CHECK(list.Get(0).state == TaskState::DONE);
  list.Cycle(0); CHECK(list.Get(0).state == TaskState::IMPORTANT);
  list.Cycle(0); CHECK(list.Get(0).state == TaskState::TODO);
}


TEST_CASE("invalid index leaves the list unchanged") {
  TaskList list = MakeList({ "A", "B" });
  std::vector<Task> before = list.GetTasks();

  CHECK_FALSE(list.Toggle(2));
  CHECK_FALSE(list.Cycle(-1));
  CHECK_FALSE(list.Edit(5, "X"));
  CHECK_FALSE(list.Remove(2));
  CHECK_FALSE(list.Move(3, -1));

  CHECK(list.GetTasks() == before);
  CHECK_FALSE(list.IsDirty());
}


TEST_CASE("edit replaces the text and keeps the state") {
  TaskList list = MakeList({ "A", "B" });
  list.Toggle(1);
  list.ClearDirty();

  CHECK(list.Edit(1, " Bee "));
  CHECK(list.Get(1) == Task("Bee", TaskState::DONE));
  CHECK(list.IsDirty());
}


TEST_CASE("edit with the same text is not a change") {
  TaskList list = MakeList({ "A" });
  CHECK(list.Edit(0, "A"));
  CHECK_FALSE(list.IsDirty());
}


TEST_CASE("edit rejects an empty text") {
  TaskList list = MakeList({ "A" });
  CHECK_FALSE(list.Edit(0, "  "));
  CHECK(list.Get(0).text == "A");
}


TEST_CASE("remove keeps the order of the rest") {
  TaskList list = MakeList({ "A", "B", "C" });
  list.SetCursor(1);

  CHECK(list.Remove(1));
  REQUIRE(list.Size() == 2);
  CHECK(list.Get(0).text == "A");
  CHECK(list.Get(1).text == "C");
  CHECK(list.GetCursor() == 1);
}


TEST_CASE("remove clamps the cursor") {
  TaskList list = MakeList({ "A", "B" });
  list.SetCursor(1);

  CHECK(list.Remove(1));
  CHECK(list.GetCursor() == 0);

  CHECK(list.Remove(0));
  CHECK(list.Empty());
  CHECK(list.GetCursor() == 0);
}


TEST_CASE("move swaps with the neighbour and the cursor follows") {
  TaskList list = MakeList({ "A", "B", "C" });

  CHECK(list.Move(0, +1));
  CHECK(list.Get(0).text == "B");
  CHECK(list.Get(1).text == "A");
  CHECK(list.GetCursor() == 1);

  CHECK(list.Move(1, -1));
  CHECK(list.Get(0).text == "A");
  CHECK(list.GetCursor() == 0);
}


TEST_CASE("move at the edges is rejected") {
  TaskList list = MakeList({ "A", "B" });

  CHECK_FALSE(list.Move(0, -1));
  CHECK_FALSE(list.Move(1, +1));
  CHECK_FALSE(list.Move(0, 2));
  CHECK(list.Get(0).text == "A");
  CHECK_FALSE(list.IsDirty());
}


TEST_CASE("cursor is clamped to the list") {
  TaskList list = MakeList({ "A", "B", "C" });

  list.SetCursor(10);
  CHECK(list.GetCursor() == 2);

  list.SetCursor(-3);
  CHECK(list.GetCursor() == 0);

  TaskList empty;
  empty.SetCursor(4);
  CHECK(empty.GetCursor() == 0);
}


TEST_CASE("markdown representation of the states") {
  CHECK(TaskToMarkdown(Task("A", TaskState::TODO))      == "- [ ] A");
  CHECK(TaskToMarkdown(Task("B", TaskState::DOING))     == "- [~] B");
  CHECK(TaskToMarkdown(Task("C", TaskState::DONE))      == "- [x] C");
  CHECK(TaskToMarkdown(Task("D", TaskState::IMPORTANT)) == "- [!] D");
}


TEST_CASE("parsing markdown task lines") {
  Task task;

  REQUIRE(TaskFromMarkdown("- [x] Buy milk", &task));
  CHECK(task == Task("Buy milk", TaskState::DONE));

  REQUIRE(TaskFromMarkdown("- [X] Upper case", &task));
  CHECK(task.state == TaskState::DONE);

  REQUIRE(TaskFromMarkdown("- [!] Pay rent  ", &task));
  CHECK(task == Task("Pay rent", TaskState::IMPORTANT));

  CHECK_FALSE(TaskFromMarkdown("Buy milk", &task));
  CHECK_FALSE(TaskFromMarkdown("- [?] Unknown", &task));
  CHECK_FALSE(TaskFromMarkdown("- [ ]", &task));
  CHECK_FALSE(TaskFromMarkdown("- [ ]    ", &task));
  CHECK_FALSE(TaskFromMarkdown("* [ ] Star", &task));
}
