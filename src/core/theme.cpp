//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#include "core.hpp"


#define THEME_WARNING(...)                      \
  do {                                          \
    if (warnings == nullptr) break;             \
    char buff[256];                             \
    snprintf(buff, sizeof buff, __VA_ARGS__);   \
    warnings->push_back(buff);                  \
  } while (false)


static bool ResolveColorFromString(
    const std::map<std::string, Color>& palette,
    const std::string& name,
    Color* color) {

  if (name.size() >= 1 && name.at(0) == '#') {
    return Theme::StringToColor(name.c_str(), color);
  }

  auto iter = palette.find(name);
  if (iter == palette.end()) return false;
  *color = iter->second;
  return true;
}


Style Style::Apply(const Style& other) const {
  Style ret = *this;
  if (other.fg != std::nullopt) ret.fg = other.fg;
  if (other.bg != std::nullopt) ret.bg = other.bg;
  ret.attrib |= other.attrib;
  return ret;
}


Theme::Theme(const Json& json, std::vector<std::string>* warnings) {
  if (json.is_object()) {
    ExtractJson(json, warnings);
  } else {
    THEME_WARNING("Invalid theme, expected a json object.");
  }
  UpdateUiEntries();
}


static const struct {
  const char* name;
  uint8_t attrib;
} modifiers[] = {
  { "bold",      TICKLIST_CELL_BOLD      },
  { "italic",    TICKLIST_CELL_ITALIC    },
  { "underline", TICKLIST_CELL_UNDERLINE },
  { "reversed",  TICKLIST_CELL_REVERSE   },
};


void Theme::ExtractJson(const Json& json, std::vector<std::string>* warnings) {

  // The palette names are resolved while reading the entries so it has to be
  // populated first.
  std::map<std::string, Color> palette;
  if (json.contains("palette") && json["palette"].is_object()) {
    for (auto& [name, value] : json["palette"].items()) {
      Color rgb;
      if (!value.is_string() || !StringToColor(value.get<std::string>().c_str(), &rgb)) {
        THEME_WARNING("Invalid color value for palette key %s.", name.c_str());
        continue;
      }
      palette[name] = rgb;
    }
  }

  for (auto& [key, value] : json.items()) {
    if (key == "palette") continue;

    // "ui.text" : "#d4d4d4" is a shorthand for the fg color.
    if (value.is_string()) {
      std::string name = value.get<std::string>();
      Color rgb;
      if (!ResolveColorFromString(palette, name, &rgb)) {
        THEME_WARNING("Invalid palette key / or color value (%s) for %s.", name.c_str(), key.c_str());
        continue;
      }
      entries[key].fg = rgb;
      continue;
    }

    if (!value.is_object()) {
      THEME_WARNING("Invalid theme entry for %s.", key.c_str());
      continue;
    }

    // The entry is overriden as a whole (if exists already).
    Style style;

    std::pair<const char*, std::optional<Color>*> colors[] = {
      { "fg", &style.fg },
      { "bg", &style.bg },
    };
    for (auto& [field, color] : colors) {
      if (!value.contains(field) || !value[field].is_string()) continue;
      std::string name = value[field].get<std::string>();
      Color rgb;
      if (!ResolveColorFromString(palette, name, &rgb)) {
        THEME_WARNING("Invalid palette key / or color value (%s) for %s.", name.c_str(), key.c_str());
        continue;
      }
      *color = rgb;
    }

    if (value.contains("modifiers") && value["modifiers"].is_array()) {
      for (auto& mod : value["modifiers"]) {
        if (!mod.is_string()) continue;
        const std::string mod_name = mod.get<std::string>();
        bool found = false;
        for (const auto& modifier : modifiers) {
          if (mod_name != modifier.name) continue;
          style.attrib |= modifier.attrib;
          found = true;
        }
        if (!found) THEME_WARNING("Invalid modifier value (%s) for %s.", mod_name.c_str(), key.c_str());
      }
    }

    entries[key] = style;
  }
}


void Theme::UpdateUiEntries() {
  text             = GetStyle("ui.text");
  background       = GetStyle("ui.background");
  style            = background.Apply(text);
  header           = style.Apply(GetStyle("ui.header"));
  lines            = style.Apply(GetStyle("ui.lines"));
  selection        = GetStyle("ui.selection");
  group_header     = style.Apply(GetStyle("ui.group"));
  statusline       = style.Apply(GetStyle("ui.statusline"));
  prompt           = style.Apply(GetStyle("ui.prompt"));
  cursor           = GetStyle("ui.cursor");
  info             = style.Apply(GetStyle("ui.info"));
  warning          = style.Apply(GetStyle("warning"));
  error            = style.Apply(GetStyle("error"));
  task_todo        = style.Apply(GetStyle("task.todo"));
  task_doing       = style.Apply(GetStyle("task.doing"));
  task_done        = style.Apply(GetStyle("task.done"));
  task_important   = style.Apply(GetStyle("task.important"));
}


Style Theme::GetStyle(const std::string& capture_) const {
  std::string capture = capture_; // We need to modify.
  while (true) {
    auto iter = entries.find(capture);
    if (iter != entries.end()) {
      return iter->second;
    }
    size_t pos = capture.find_last_of('.');
    if (pos == std::string::npos) return Style();
    capture.erase(pos, capture.size() - pos);
  }
  UNREACHABLE();
  return Style();
}


bool Theme::StringToColor(const char* str, Color* rgb) {
  ASSERT(str != nullptr && rgb != nullptr, OOPS);
  if (*str != '#') return false;

  str++; // Skip the '#'.

  for (int i = 0; i < 6; i++) {
    char c = str[i];
    if (!(BETWEEN('0', c, '9') || BETWEEN('a', c, 'f') || BETWEEN('A', c, 'F'))) return false;
  }
  if (str[6] != '\0') return false;

#define HEX_TO_INT(c)         \
  BETWEEN('0', (c), '9')      \
    ? ((c) - '0')             \
    : (BETWEEN('a', (c), 'f') \
        ? ((c) - 'a' + 10)    \
        : ((c) - 'A' + 10))

  uint8_t hex[6];
  for (int i = 0; i < 6; i++) hex[i] = HEX_TO_INT(str[i]);
#undef HEX_TO_INT

  uint8_t r = hex[0] << 4 | hex[1];
  uint8_t g = hex[2] << 4 | hex[3];
  uint8_t b = hex[4] << 4 | hex[5];

  *rgb = (r<<16) | (g<<8) | b;

  return true;
}
