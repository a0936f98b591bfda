#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "file_port.hpp"
#include "editor.hpp"
#include "config.hpp"
#include <cstdio>
#include <cstring>
#include <exception>
#include <filesystem>

static void usage(FILE* out) {
  std::fprintf(out, "usage: kiln <file>\n");
}

int main(int argc, char** argv) {
  if (argc >= 2 && (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0)) {
    usage(stdout);
    return 0;
  }
  if (argc >= 2 && (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0)) {
    std::printf("kiln %s\n", KILN_VERSION);
    return 0;
  }
  if (argc != 2) {
    usage(stderr);
    return 2;
  }
  std::filesystem::path path(argv[1]);
  try {
    Terminal guard;
    NcursesTerminal term;
    PosixFilePort files;
    Editor ed(term, files, path);
    ed.run();
  } catch (const std::exception& e) {
    // guard is gone by now, so stderr lands on a cooked terminal
    std::fprintf(stderr, "kiln: %s\n", e.what());
    return 1;
  }
  return 0;
}
