#include "settings.hpp"
#include <cctype>
#include <cstdlib>
#include "file_io.hpp"

static std::string_view trim(std::string_view s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

static bool parse_count(const std::string& s, size_t& out) {
  if (s.empty()) return false;
  size_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    v = v * 10 + static_cast<size_t>(c - '0');
    if (v > 1000000) return false;
  }
  if (v == 0) return false;
  out = v;
  return true;
}

bool split_words(std::string_view line, std::vector<std::string>& out, std::string& msg) {
  out.clear();
  size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && std::isspace((unsigned char)line[i])) i++;
    if (i >= line.size()) break;
    std::string word;
    if (line[i] == '"') {
      size_t close = line.find('"', i + 1);
      if (close == std::string_view::npos) { msg = "unterminated quote"; return false; }
      word = std::string(line.substr(i + 1, close - i - 1));
      i = close + 1;
    } else {
      while (i < line.size() && !std::isspace((unsigned char)line[i])) word.push_back(line[i++]);
    }
    out.push_back(std::move(word));
  }
  return true;
}

Settings::Settings(Editor& ed) : ed_(ed) { register_commands(); }

std::optional<std::filesystem::path> Settings::default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return std::nullopt;
  return std::filesystem::path(home) / ".heditrc";
}

bool Settings::take_platform_flag(std::vector<std::string>& args, std::optional<Platform>& platform, std::string& msg) const {
  platform.reset();
  if (args.empty() || args[0] != "--platform") return true;
  if (args.size() < 2) { msg = "--platform needs a value"; return false; }
  Platform p;
  if (!parse_platform(args[1], p)) { msg = "unknown platform: " + args[1]; return false; }
  platform = p;
  args.erase(args.begin(), args.begin() + 2);
  return true;
}

void Settings::register_commands() {
  registry_.register_command("set", [this](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 2) { msg = "usage: set <option> <value>"; return false; }
    EditorOptions opts = ed_.options();
    const std::string& name = args[0];
    const std::string& value = args[1];
    if (name == "undodepth") {
      if (!parse_count(value, opts.undo_depth)) { msg = "invalid undodepth: " + value; return false; }
    } else if (name == "pagelines") {
      if (!parse_count(value, opts.page_lines)) { msg = "invalid pagelines: " + value; return false; }
    } else if (name == "platform") {
      if (!parse_platform(value, opts.platform)) { msg = "unknown platform: " + value; return false; }
    } else {
      msg = "unknown option: " + name;
      return false;
    }
    ed_.set_options(opts);
    msg = name + "=" + value;
    return true;
  });
  registry_.register_command("bind", [this](const std::vector<std::string>& in, std::string& msg) {
    std::vector<std::string> args = in;
    std::optional<Platform> platform;
    if (!take_platform_flag(args, platform, msg)) return false;
    if (args.size() < 2 || args.size() > 3) { msg = "usage: bind [--platform P] <chord> <command> [description]"; return false; }
    Chord chord;
    if (!parse_chord(args[0], chord)) { msg = "invalid chord: " + args[0]; return false; }
    Command cmd;
    if (!parse_command(args[1], cmd)) { msg = "unknown editor command: " + args[1]; return false; }
    ShortcutBinding b;
    b.chord = chord;
    b.action = cmd;
    b.description = args.size() == 3 ? args[2] : args[1];
    b.platform = platform;
    ed_.shortcuts().bind(std::move(b));
    msg = "bound " + chord_to_string(chord);
    return true;
  });
  registry_.register_command("unbind", [this](const std::vector<std::string>& in, std::string& msg) {
    std::vector<std::string> args = in;
    std::optional<Platform> platform;
    if (!take_platform_flag(args, platform, msg)) return false;
    if (args.size() != 1) { msg = "usage: unbind [--platform P] <chord>"; return false; }
    Chord chord;
    if (!parse_chord(args[0], chord)) { msg = "invalid chord: " + args[0]; return false; }
    if (!ed_.shortcuts().unbind(chord, platform)) { msg = "no binding for " + args[0]; return false; }
    msg = "unbound " + chord_to_string(chord);
    return true;
  });
  registry_.register_command("unbindall", [this](const std::vector<std::string>& args, std::string& msg) {
    if (!args.empty()) { msg = "usage: unbindall"; return false; }
    ed_.shortcuts().clear();
    msg = "all bindings removed";
    return true;
  });
  registry_.register_command("defaults", [this](const std::vector<std::string>& args, std::string& msg) {
    if (!args.empty()) { msg = "usage: defaults"; return false; }
    ed_.shortcuts().clear();
    ed_.shortcuts().load_defaults();
    msg = "default bindings restored";
    return true;
  });
}

bool Settings::execute_line(std::string_view line, std::string& msg) {
  std::string_view s = trim(line);
  if (s.empty() || s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s = trim(s.substr(1));
  std::vector<std::string> words;
  if (!split_words(s, words, msg)) return false;
  if (words.empty()) return true;
  std::string name = words.front();
  words.erase(words.begin());
  return registry_.execute(name, words, msg);
}

size_t Settings::load_string(std::string_view text, std::vector<std::string>& errors) {
  size_t failures = 0;
  size_t line_no = 0;
  size_t st = 0;
  while (st <= text.size()) {
    size_t pos = text.find('\n', st);
    std::string_view line = pos == std::string_view::npos ? text.substr(st) : text.substr(st, pos - st);
    ++line_no;
    std::string msg;
    if (!execute_line(line, msg)) {
      errors.push_back("line " + std::to_string(line_no) + ": " + msg);
      ++failures;
    }
    if (pos == std::string_view::npos) break;
    st = pos + 1;
  }
  return failures;
}

bool Settings::load_file(const std::filesystem::path& path, std::vector<std::string>& errors, std::string& msg) {
  std::string text;
  if (!read_text_file(path, text, msg)) return false;
  size_t failures = load_string(text, errors);
  msg = failures == 0 ? "loaded " + path.string()
                      : "loaded " + path.string() + " with " + std::to_string(failures) + " error(s)";
  return true;
}
