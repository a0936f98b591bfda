#include "file_port.hpp"
#include "file_reader.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using Lines = std::vector<std::string>;

static fs::path scratch_dir() {
  fs::path d = fs::temp_directory_path() / ("kiln_test_" + std::to_string(::getpid()));
  fs::create_directories(d);
  return d;
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static void spit(const fs::path& p, const std::string& s) {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out << s;
}

static void test_split_lines() {
  Lines out;
  split_lines("a\nb\r\n\nc", out);
  assert((out == Lines{"a", "b", "", "c"}));
  out.clear();
  split_lines("a\nb\n", out);
  assert((out == Lines{"a", "b"}));
  out.clear();
  split_lines("", out);
  assert(out.empty());
  out.clear();
  split_lines("\n", out);
  assert((out == Lines{""}));
}

static void test_missing_file_is_new(const fs::path& dir) {
  PosixFilePort port;
  Lines lines{"junk"};
  std::string msg;
  assert(port.load(dir / "does_not_exist.txt", lines, msg));
  assert(lines.empty());
  assert(msg.rfind("new file: ", 0) == 0);
}

static void test_load_existing(const fs::path& dir) {
  fs::path p = dir / "in.txt";
  spit(p, "first\r\nsecond\n\tthird\n");
  PosixFilePort port;
  Lines lines;
  std::string msg;
  assert(port.load(p, lines, msg));
  assert((lines == Lines{"first", "second", "\tthird"}));
}

static void test_unreadable_is_failure(const fs::path& dir) {
  PosixFilePort port;
  Lines lines;
  std::string msg;
  // a directory exists but can not be loaded as text
  assert(!port.load(dir, lines, msg));
  assert(!msg.empty());
  if (::geteuid() != 0) {
    fs::path p = dir / "locked.txt";
    spit(p, "secret\n");
    ::chmod(p.string().c_str(), 0);
    msg.clear();
    assert(!port.load(p, lines, msg));
    assert(msg.rfind("can not open file: ", 0) == 0);
    ::chmod(p.string().c_str(), 0644);
  }
}

static void test_save_roundtrip(const fs::path& dir) {
  fs::path p = dir / "out.txt";
  spit(p, "old contents that are longer than the new ones\n");
  ::chmod(p.string().c_str(), 0600);
  PosixFilePort port;
  std::string msg;
  assert(port.save(p, Lines{"alpha", "", "\tbeta"}, msg));
  assert(slurp(p) == "alpha\n\n\tbeta\n");
  assert(msg == "saved file: " + p.string() + " (13 bytes)");
  struct stat st{};
  assert(::stat(p.string().c_str(), &st) == 0);
  assert((st.st_mode & 0777) == 0600);

  Lines back;
  assert(port.load(p, back, msg));
  assert((back == Lines{"alpha", "", "\tbeta"}));
}

static void test_save_no_lines_is_empty_file(const fs::path& dir) {
  fs::path p = dir / "empty.txt";
  PosixFilePort port;
  std::string msg;
  assert(port.save(p, Lines{}, msg));
  assert(fs::exists(p));
  assert(fs::file_size(p) == 0);
}

static void test_newline_only_file_survives_load_and_save(const fs::path& dir) {
  fs::path p = dir / "nl.txt";
  spit(p, "\n");
  PosixFilePort port;
  Lines lines;
  std::string msg;
  assert(port.load(p, lines, msg));
  assert((lines == Lines{""}));
  assert(port.save(p, lines, msg));
  assert(slurp(p) == "\n");
}

static void test_save_leaves_neighbour_tmp_alone(const fs::path& dir) {
  fs::path p = dir / "notes.txt";
  fs::path neighbour = dir / "notes.txt.tmp";
  spit(neighbour, "keep me\n");
  PosixFilePort port;
  std::string msg;
  assert(port.save(p, Lines{"a"}, msg));
  assert(slurp(p) == "a\n");
  assert(slurp(neighbour) == "keep me\n");
  // only the target and the unrelated neighbour remain
  int entries = 0;
  for (const auto& e : fs::directory_iterator(dir)) {
    if (e.path().filename().string().rfind("notes.txt", 0) == 0) entries++;
  }
  assert(entries == 2);
}

static void test_save_large_lines(const fs::path& dir) {
  fs::path p = dir / "big.txt";
  Lines lines;
  lines.push_back(std::string(200 * 1024, 'x'));
  for (int i = 0; i < 5000; ++i) lines.push_back("line " + std::to_string(i));
  PosixFilePort port;
  std::string msg;
  assert(port.save(p, lines, msg));
  Lines back;
  assert(port.load(p, back, msg));
  assert(back == lines);
}

static void test_save_into_missing_dir_fails(const fs::path& dir) {
  PosixFilePort port;
  std::string msg;
  assert(!port.save(dir / "no_such_dir" / "f.txt", Lines{"x"}, msg));
  assert(msg.rfind("write file failed: ", 0) == 0);
}

int main() {
  fs::path dir = scratch_dir();
  test_split_lines();
  test_missing_file_is_new(dir);
  test_load_existing(dir);
  test_unreadable_is_failure(dir);
  test_save_roundtrip(dir);
  test_save_no_lines_is_empty_file(dir);
  test_newline_only_file_survives_load_and_save(dir);
  test_save_leaves_neighbour_tmp_alone(dir);
  test_save_large_lines(dir);
  test_save_into_missing_dir_fails(dir);
  std::error_code ec;
  fs::remove_all(dir, ec);
  return 0;
}
