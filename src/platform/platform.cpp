//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#include "platform.hpp"

#include <errno.h>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>


Path::Path(std::string path) {
  this->path = Normalize(fs::path(path));
}


Path::Path(const char* path) : Path(std::string(path)) {
}


std::string Path::String() const {
  return path.string();
}


std::string Path::FileName() const {
  return path.filename().string();
}


bool Path::Empty() const {
  return path.empty();
}


bool Path::Exists() const {
  std::error_code ec;
  return fs::exists(path, ec);
}


bool Path::IsDirectory() const {
  std::error_code ec;
  return fs::is_directory(path, ec);
}


bool Path::IsRegularFile() const {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}


Path Path::operator /(const std::string& inner) const {
  return Path((path / inner).string());
}


Path Path::ExpandUser(const std::string& path) {
  if (path == "~" || StartsWith(path, "~/")) {
    Path home = Platform::GetHomeDirectory();
    if (path == "~") return home;
    return home / path.substr(2);
  }
  return Path(path);
}


fs::path Path::Normalize(const fs::path& path) {
  if (path.empty()) return path;
  std::error_code ec;
  fs::path canonical = std::filesystem::weakly_canonical(path, ec);
  if (ec) canonical = path.lexically_normal();
  return canonical.make_preferred();
}


// -----------------------------------------------------------------------------
// Platform.
// -----------------------------------------------------------------------------


Path Platform::GetConfigPath() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  Path dir = (xdg != NULL && *xdg != '\0')
    ? Path(xdg)
    : GetHomeDirectory() / ".config";
  return dir / "ticklist" / "config.json";
}


Path Platform::GetDataDirectory() {
  const char* xdg = std::getenv("XDG_DATA_HOME");
  Path dir = (xdg != NULL && *xdg != '\0')
    ? Path(xdg)
    : GetHomeDirectory() / ".local" / "share";
  return dir / "ticklist";
}


void Platform::ReadFile(std::string& ret, const Path& path) {

  if (!path.Exists()) {
    throw std::runtime_error("Path \"" + path.String() + "\" not exists.");
  }

  if (path.IsDirectory()) {
    throw std::runtime_error("Path \"" + path.String() + "\" is a directory.");
  }

  std::ifstream file(path.String(), std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Error opening file at: \"" + path.String() + "\" (" + strerror(errno) + ").");
  }

  std::stringstream ss;
  ss << file.rdbuf();
  if (file.bad()) {
    throw std::runtime_error("Error reading file at: \"" + path.String() + "\".");
  }

  ret = ss.str();
}


void Platform::WriteFileAtomic(const Path& path, const std::string& content) {
  std::error_code ec;

  const fs::path target = path.String();
  const fs::path parent = target.parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("Failed to create directory \"" + parent.string() + "\": " + ec.message() + ".");
    }
  }

  const fs::path tmp = target.string() + ".tmp";

  // Keep the permissions of the file we're replacing.
  fs::perms target_perms = fs::perms::unknown;
  if (fs::exists(target, ec) && !ec) {
    target_perms = fs::status(target, ec).permissions();
    if (ec) target_perms = fs::perms::unknown;
  }
  ec.clear();

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw std::runtime_error("Failed to open \"" + tmp.string() + "\" for writing (" + strerror(errno) + ").");
    }
    out << content;
    out.flush();
    if (!out.good()) {
      out.close();
      fs::remove(tmp, ec);
      throw std::runtime_error("Failed to write \"" + tmp.string() + "\".");
    }
  }

  if (target_perms != fs::perms::unknown) {
    fs::permissions(tmp, target_perms, ec);
    ec.clear();
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    std::string message = ec.message();
    fs::remove(tmp, ec);
    throw std::runtime_error("Failed to replace \"" + target.string() + "\": " + message + ".");
  }
}
