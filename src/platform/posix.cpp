//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#if defined(__unix__) || defined(__APPLE__)

#include <signal.h>
#include <stdlib.h>
#include <pwd.h>
#include <unistd.h>

#include "platform.hpp"


// Set by the signal handler, and only read by the main loop.
static volatile sig_atomic_t termination_requested = 0;


static void _TerminationHandler(int signum) {
  (void) signum;
  termination_requested = 1;
}


Path Platform::GetHomeDirectory() {
  const char* home = getenv("HOME");
  if (home != NULL && *home != '\0') return Path(home);

  struct passwd* pw = getpwuid(getuid());
  if (pw != NULL && pw->pw_dir != NULL) return Path(pw->pw_dir);

  return Path();
}


void Platform::InstallTerminationHandler() {
  struct sigaction sa;
  memset(&sa, 0, sizeof sa);
  sa.sa_handler = _TerminationHandler;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, NULL);
  sigaction(SIGTERM, &sa, NULL);
  sigaction(SIGHUP, &sa, NULL);

  // Writing to a closed terminal shouldn't kill us before the final save.
  signal(SIGPIPE, SIG_IGN);
}


bool Platform::IsTerminationRequested() {
  return termination_requested != 0;
}


#endif // defined(__unix__) || defined(__APPLE__)
