//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#include "core.hpp"


// -----------------------------------------------------------------------------
// Mode.
// -----------------------------------------------------------------------------


const char* ModeToString(Mode mode) {
  switch (mode) {
    case Mode::NONE:   return "none";
    case Mode::NORMAL: return "normal";
    case Mode::INSERT: return "insert";
  }
  UNREACHABLE();
  return "";
}


bool ModeFromString(const std::string& name, Mode* mode) {
  if (name == "normal") { *mode = Mode::NORMAL; return true; }
  if (name == "insert") { *mode = Mode::INSERT; return true; }
  return false;
}


// -----------------------------------------------------------------------------
// ActionExecutor.
// -----------------------------------------------------------------------------


Mode ActionExecutor::GetMode() const {
  return mode;
}


void ActionExecutor::SetMode(Mode mode) {
  this->mode = mode;
}


// -----------------------------------------------------------------------------
// KeyTree.
// -----------------------------------------------------------------------------


KeyTree::KeyTree() {
  root = std::make_unique<Node>();
}


void KeyTree::RegisterAction(const ActExName& class_name, const ActionName& action_name, FuncAction action) {
  ASSERT(action != nullptr, OOPS);
  ActionKey key = std::make_pair(class_name, action_name);
  actions[key] = action;
}


bool KeyTree::HasAction(const ActExName& class_name, const ActionName& action_name) const {
  return actions.find(std::make_pair(class_name, action_name)) != actions.end();
}


bool KeyTree::RegisterBinding(const ActExName& actex_name, const std::string& key_combination, const std::string& action_name) {
  return RegisterBinding(actex_name, Mode::NONE, key_combination, action_name);
}


bool KeyTree::RegisterBinding(const ActExName& actex_name, Mode mode, const std::string& key_combination, const std::string& action_name) {
  std::vector<event_t> events;

  if (!ParseKeyBindingString(events, key_combination.c_str())) return false;
  if (events.empty()) return false;

  ActionKey action_key = std::make_pair(actex_name, action_name);
  auto it = actions.find(action_key);
  if (it == actions.end()) return false;

  Node* curr = root.get();
  for (event_t event : events) {
    if (curr->children.find(event) == curr->children.end()) {
      curr->children[event] = std::make_unique<Node>();
    }
    curr = curr->children[event].get();
  }

  BindingKey binding_key = std::make_pair(actex_name, mode);
  curr->bindings[binding_key] = it->second;
  return true;
}


// ----------------------------------------------------------------------------
// KeyTreeCursor.
// ----------------------------------------------------------------------------


KeyTreeCursor::KeyTreeCursor(const KeyTree* tree) : tree(tree) {
  ResetCursor();
}


void KeyTreeCursor::ResetCursor() {
  ASSERT(tree != nullptr, OOPS);
  node = tree->root.get();
  recorded_events.clear();
}


bool KeyTreeCursor::IsCursorRoot() const {
  ASSERT(tree != nullptr, OOPS);
  return node == tree->root.get();
}


bool KeyTreeCursor::HasMore() const {
  ASSERT(node != nullptr, OOPS);
  return !node->children.empty();
}


const std::vector<event_t>& KeyTreeCursor::GetRecordedEvents() const {
  return recorded_events;
}


bool KeyTreeCursor::CanConsume(const ActExName& actex_name, Mode mode, const KeyTree::Node* curr) const {
  // A subtree is only reachable for the actex if somewhere down there a binding
  // is registered for it's mode (or mode independent binding).
  if (curr->bindings.find(std::make_pair(actex_name, mode)) != curr->bindings.end()) return true;
  if (curr->bindings.find(std::make_pair(actex_name, Mode::NONE)) != curr->bindings.end()) return true;
  for (auto& it : curr->children) {
    if (CanConsume(actex_name, mode, it.second.get())) return true;
  }
  return false;
}


bool KeyTreeCursor::ConsumeEvent(const ActionExecutor* actex, const Event& event) {
  ASSERT(tree != nullptr, OOPS);
  if (actex == nullptr) return false;
  if (event.type != Event::Type::KEY) return false;

  event_t key = EncodeKeyEvent(event.key);

  auto it_node = node->children.find(key);
  if (it_node == node->children.end()) {
    return false;
  }

  const KeyTree::Node* next = it_node->second.get();
  ASSERT(next != nullptr, OOPS);
  if (!CanConsume(actex->GetClassName(), actex->GetMode(), next)) return false;

  node = it_node->second.get();
  recorded_events.push_back(key);

  return true;
}


bool KeyTreeCursor::TryEvent(ActionExecutor* actex) {
  ASSERT(actex != nullptr, OOPS);

  // Mode specific binding first and then the mode independent ones.
  Mode modes[] = { actex->GetMode(), Mode::NONE };
  for (Mode mode : modes) {
    BindingKey key = std::make_pair(actex->GetClassName(), mode);
    auto it_action = node->bindings.find(key);
    if (it_action != node->bindings.end()) {
      FuncAction action = it_action->second;
      ASSERT(action != nullptr, OOPS);
      return action(actex);
    }
  }

  return false;
}
