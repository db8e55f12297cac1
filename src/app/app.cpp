//
//  _   _    _   _ _    _
// | |_(_)__| |_| (_)__| |_   ticklist, a terminal todo list.
// |  _| / _| / /| | (_-<  _|  version 0.1.0
//  \__|_\__|_\_\|_|_/__/\__|
//
// Copyright (c) 2024 Thakee Nathees
// Licenced under: MIT

#include "app.hpp"


App::App(Config config_, Path tasks_path, std::unique_ptr<IFrontEnd> frontend, std::vector<std::string> warnings_)
  : config(std::move(config_)), tasks_path(std::move(tasks_path)), frontend(std::move(frontend)) {

  ASSERT(this->frontend != nullptr, "No frontend is available.");

  for (const std::string& warning : warnings_) AddWarning(warning);

  // Theme, the overrides from the config are merged on top of the selected one.
  std::map<std::string, Json> themes = Platform::LoadThemes();
  auto it = themes.find(config.theme);
  if (it == themes.end()) {
    AddWarning("Unknown theme \"" + config.theme + "\", using the default theme.");
    it = themes.find("default");
  }
  Json theme_json = (it != themes.end()) ? it->second : Json::object();
  theme_json.merge_patch(config.theme_overrides);

  std::vector<std::string> theme_warnings;
  theme = std::make_unique<Theme>(theme_json, &theme_warnings);
  for (const std::string& warning : theme_warnings) AddWarning(warning);

  // Key bindings.
  std::vector<std::string> binding_warnings;
  RegisterActions(keytree);
  RegisterDefaultBindings(keytree);
  RegisterConfigBindings(keytree, config, &binding_warnings);
  for (const std::string& warning : binding_warnings) AddWarning(warning);

  ui = std::make_unique<Ui>(&keytree, &tasks, &config, theme.get());
}


void App::AddWarning(const std::string& message) {
  warnings.push_back(message);
}


const std::vector<std::string>& App::GetWarnings() const {
  return warnings;
}


TaskList& App::GetTasks() {
  return tasks;
}


Ui& App::GetUi() {
  return *ui;
}


void App::Load() {
  std::vector<std::string> load_warnings;
  tasks.Load(tasks_path, &load_warnings);
  for (const std::string& warning : load_warnings) {
    AddWarning(tasks_path.FileName() + ": " + warning);
  }
}


bool App::Save() {
  std::string error;
  if (!tasks.Save(tasks_path, &error)) {
    save_error = error;
    ui->Error("Save failed: " + error);
    return false;
  }
  save_error.clear();
  tasks.ClearDirty();
  return true;
}


void App::PrepareFrameBuffer() {
  Area area = frontend->GetDrawArea();

  // Resize the buffer.
  if ((int) buff.cells.size() != area.width * area.height) {
    buff.cells.resize(MAX(0, area.width * area.height));
  }
  buff.width  = area.width;
  buff.height = area.height;
}


int App::MainLoop() {

  if (!frontend->Initialize()) {
    fprintf(stderr, "Terminal initialize failed.\n");
    return 1;
  }

  // Show the last warning, all of them will be printed to stderr at exit.
  if (!warnings.empty()) {
    std::string message = warnings.back();
    if (warnings.size() > 1) {
      message += " (+" + std::to_string(warnings.size() - 1) + " more warnings)";
    }
    ui->Warning(message);
  }

  bool redraw = true;

  while (!ui->IsShouldClose()) {

    // SIGINT, SIGTERM, SIGHUP.
    if (Platform::IsTerminationRequested()) break;

    // Draw call.
    if (redraw) {
      PrepareFrameBuffer();
      ui->Draw(buff);
      frontend->Display(buff);
      redraw = false;
    }

    // Handle Events.
    std::vector<Event> events = frontend->GetEvents(EVENT_TIMEOUT_MS);
    for (const Event& event : events) {
      if (event.type == Event::Type::CLOSE) {
        ui->SetShouldClose();
        break;
      }
      if (event.type == Event::Type::KEY) ui->HandleEvent(event);
      redraw = true;
      if (ui->IsShouldClose()) break;
    }

    // Persist after every change, a failed save is retried on the next event.
    if (!events.empty() && tasks.IsDirty()) Save();
  }

  bool saved = !tasks.IsDirty() || Save();

  frontend->Cleanup();

  for (const std::string& warning : warnings) {
    fprintf(stderr, "warning: %s\n", warning.c_str());
  }

  if (!saved) {
    fprintf(stderr, "error: failed to save tasks to \"%s\": %s\n",
      tasks_path.String().c_str(), save_error.c_str());
    return 1;
  }

  return 0;
}
