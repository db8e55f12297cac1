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


// The terminal front end. The terminal is restored when the instance goes out
// of scope (if Cleanup() wasn't called already), so every exit path of the
// main loop leaves a usable terminal.
class Termbox2 : public IFrontEnd {
public:
  Termbox2() = default;
  ~Termbox2();
  NO_COPY_CONSTRUCTOR(Termbox2);

  bool Initialize() override;
  std::vector<Event> GetEvents(int timeout_ms) override;
  Area GetDrawArea() override;
  void Display(FrameBuffer& buff) override;
  bool Cleanup() override;

private:
  bool initialized = false;
};
