//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#pragma once

#include <string>
#include <utility>

#define TICKLIST_VERSION_MAJOR 0
#define TICKLIST_VERSION_MINOR 1
#define TICKLIST_VERSION_PATCH 0
#define TICKLIST_VERSION_STRING "0.1.0"


// The state of a task. Only DONE counts as completed, the other states are
// different flavours of "not done yet" and drawn with their own colors.
enum class TaskState {
  TODO      = 0,
  DOING     = 1,
  DONE      = 2,
  IMPORTANT = 3,
};


// A single todo item. Tasks are positional, the list they live in decides the
// order and there is no id.
struct Task {
  Task(std::string text = "", TaskState state = TaskState::TODO)
    : text(std::move(text)), state(state) {}

  std::string text;
  TaskState state;

  bool IsCompleted() const { return state == TaskState::DONE; }

  bool operator ==(const Task& other) const {
    return text == other.text && state == other.state;
  }
};
