#include "ncurses_terminal.hpp"
#include "ncurses_key_source.hpp"
#include "app.hpp"
#include "config.hpp"
#include <optional>
#include <filesystem>

int main(int argc, char** argv) {
  std::optional<std::filesystem::path> path;
  if (argc >= 2) path = std::filesystem::path(argv[1]);
  EditorOptions opts;
  opts.platform = static_cast<Platform>(HEDIT_HOST_PLATFORM);
  NcursesSession session;
  NcursesTerminal term;
  NcursesKeySource keys;
  App app(term, keys, opts);
  app.load_rc();
  /* open failures land on the status line */
  if (path) app.open(*path);
  app.run();
  return 0;
}
