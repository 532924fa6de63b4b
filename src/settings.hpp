#pragma once
/*
 * Settings
 *
 * Purpose: rc-file interpreter that configures an Editor at runtime.
 * Syntax (one command per line, leading ':' allowed):
 *   set undodepth 200 | set pagelines 30 | set platform mac
 *   bind [--platform P] <chord> <command> ["description"]
 *   unbind [--platform P] <chord>
 *   unbindall | defaults
 * Blank lines and lines starting with '#', '"' or '//' are skipped.
 */
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <filesystem>
#include "cmd_registry.hpp"
#include "editor.hpp"

class Settings {
public:
  explicit Settings(Editor& ed);

  /* comments and blank lines succeed without doing anything */
  bool execute_line(std::string_view line, std::string& msg);
  /* keeps going after a bad line; each failure becomes "line N: ..." in errors */
  size_t load_string(std::string_view text, std::vector<std::string>& errors);
  bool load_file(const std::filesystem::path& path, std::vector<std::string>& errors, std::string& msg);

  /* $HOME/.heditrc */
  static std::optional<std::filesystem::path> default_rc_path();
  const CommandRegistry& registry() const { return registry_; }

private:
  void register_commands();
  bool take_platform_flag(std::vector<std::string>& args, std::optional<Platform>& platform, std::string& msg) const;

  Editor& ed_;
  CommandRegistry registry_;
};

/* whitespace split; "double quoted" words keep their spaces */
bool split_words(std::string_view line, std::vector<std::string>& out, std::string& msg);
