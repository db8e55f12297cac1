//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#include "ui.hpp"


void InputLine::SetText(const std::string& text) {
  this->text = text;
  CursorEnd();
}


const std::string& InputLine::GetText() const {
  return text;
}


int InputLine::GetCursor() const {
  return cursor;
}


int InputLine::GetLength() const {
  return Utf8Strlen(text.c_str());
}


void InputLine::Clear() {
  text.clear();
  cursor = 0;
}


void InputLine::Insert(uint32_t codepoint) {
  // Control characters can't be part of a task line.
  if (codepoint < 0x20 || codepoint == 0x7f) return;
  Insert(Utf8UnicodeToString(codepoint));
}


void InputLine::Insert(const std::string& str) {
  if (str.empty()) return;
  text.insert(ByteIndex(cursor), str);
  cursor += Utf8Strlen(str.c_str());
}


bool InputLine::Backspace() {
  if (cursor == 0) return false;
  size_t begin = ByteIndex(cursor - 1);
  size_t end = ByteIndex(cursor);
  text.erase(begin, end - begin);
  cursor--;
  return true;
}


bool InputLine::Delete() {
  if (cursor >= GetLength()) return false;
  size_t begin = ByteIndex(cursor);
  size_t end = ByteIndex(cursor + 1);
  text.erase(begin, end - begin);
  return true;
}


bool InputLine::CursorLeft() {
  if (cursor == 0) return false;
  cursor--;
  return true;
}


bool InputLine::CursorRight() {
  if (cursor >= GetLength()) return false;
  cursor++;
  return true;
}


void InputLine::CursorHome() {
  cursor = 0;
}


void InputLine::CursorEnd() {
  cursor = GetLength();
}


size_t InputLine::ByteIndex(int index) const {
  size_t byte = 0;
  for (int i = 0; i < index && byte < text.size(); i++) {
    byte += Utf8CharLength(text[byte]);
  }
  return MIN(byte, text.size());
}
