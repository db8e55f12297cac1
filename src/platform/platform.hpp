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

#include <filesystem>
namespace fs = std::filesystem;


class Path {

public:
  Path() = default;
  Path(std::string path);
  Path(const char* path);

  std::string String() const;

  std::string FileName() const;

  bool Empty() const;
  bool Exists() const;

  bool IsDirectory() const;
  bool IsRegularFile() const;

  Path operator /(const std::string& inner) const;

  // Replace a leading "~" with the home directory ("~user" is not supported).
  static Path ExpandUser(const std::string& path);
  static fs::path Normalize(const fs::path& path);

private:
  fs::path path;
};


// A platform is an an "abstract" interface to comminicate to the host system.
// Loading files, resources, locating the user directories are all provided by
// the platform.
class Platform {

public:
  // --------------------------------------------------------------------------
  // Os dependent functions each os should implement this functionalities.
  // --------------------------------------------------------------------------

  // Returns $HOME if set otherwise the home directory of the user from the
  // password database. Returns an empty path if both are failed.
  static Path GetHomeDirectory();

  // Install the handlers for the termination signals (SIGTERM, SIGHUP), the
  // handler only records the signal and the main loop should poll it with
  // IsTerminationRequested() and end gracefully.
  static void InstallTerminationHandler();
  static bool IsTerminationRequested();

  // --------------------------------------------------------------------------
  // Os independent but still we need this from the host system.
  // --------------------------------------------------------------------------

  // $XDG_CONFIG_HOME/ticklist/config.json or ~/.config/ticklist/config.json.
  static Path GetConfigPath();

  // $XDG_DATA_HOME/ticklist or ~/.local/share/ticklist.
  static Path GetDataDirectory();

  // !! WARNING !! This will throw an error if loading the file is failed, or
  // failed to parse the json. The caller should catch and handle.
  //
  // Load the configuration file which is json (comments are allowed) and
  // returns the json object. If the file doesn't exists, a default config will
  // be written to the path and returned (failing to write it is only a warning).
  static Json LoadConfig(const Path& path, std::vector<std::string>* warnings);

  // Returns the default config json source (written to the config path on the
  // first run).
  static const char* GetDefaultConfigSource();

  // Load all the themes in memory and return them as json object, that will be
  // used to construct the Theme instance.
  static std::map<std::string, Json> LoadThemes();

  // !! WARNING !! This will throw on failure.
  static void ReadFile(std::string& ret, const Path& path);

  // !! WARNING !! This will throw on failure.
  //
  // Write the content to "<path>.tmp" and rename it over the path, so the file
  // at the path is either the old one or the new one and never a partial
  // write. The parent directories are created if not exists. On failure the
  // temporary file is removed and the existing file is untouched.
  static void WriteFileAtomic(const Path& path, const std::string& content);
};
