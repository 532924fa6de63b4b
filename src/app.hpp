#pragma once
/*
 * App
 *
 * Purpose: interactive host around one Editor: key loop, rendering, file load/save,
 *          rc file and a one-line find prompt.
 * Design: terminal and key source are injected, so the whole loop runs headless in tests.
 * Host keys (checked before the editor's bindings): primary+s save, primary+q quit
 *          (twice when modified), primary+f find prompt.
 */
#include <filesystem>
#include <optional>
#include <string>
#include "editor.hpp"
#include "settings.hpp"
#include "renderer.hpp"
#include "key_source.hpp"
#include "iterminal.hpp"
#include "clipboard.hpp"

class App {
public:
  App(ITerminal& term, IKeySource& keys, EditorOptions opts = {});
  ~App();
  App(const App&) = delete;
  App& operator=(const App&) = delete;

  /* a missing file opens as an empty buffer bound to that path */
  bool open(const std::filesystem::path& path);
  bool save();
  void load_rc();
  bool load_rc(const std::filesystem::path& path);

  /* until quit or the key source runs dry */
  void run();
  /* false once the app wants to quit */
  bool handle_key(const KeyEvent& ev);
  void render();

  Editor& editor() { return ed_; }
  const std::string& note() const { return note_; }
  bool prompting() const { return prompting_; }
  bool quitting() const { return quit_; }

private:
  enum class HostAction { None, Save, Quit, FindPrompt };

  HostAction host_action(const KeyEvent& ev) const;
  void handle_prompt_key(const KeyEvent& ev);
  std::string file_label() const;

  ITerminal& term_;
  IKeySource& keys_;
  Editor ed_;
  Settings settings_;
  Renderer renderer_;
  Viewport vp_;
  MemoryClipboard clipboard_;
  Editor::ListenerId listener_ = 0;

  std::optional<std::filesystem::path> path_;
  std::string note_;
  bool prompting_ = false;
  std::string prompt_;
  bool quit_ = false;
  bool quit_armed_ = false;
};
