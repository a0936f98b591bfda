#pragma once
/*
 * FilePort
 *
 * Purpose: load/save the whole buffer as lines. Errors come back as false plus
 * a message for the status bar; nothing here throws.
 * load: a path that does not exist is a new, empty file (true, no lines).
 * save: every line is written with a trailing '\n'; no lines is an empty file.
 * PosixFilePort writes a mkstemp() sibling <path>.XXXXXX, syncs it, then
 * renames it over <path>.
 */
#include <filesystem>
#include <string>
#include <vector>

class IFilePort {
public:
  virtual ~IFilePort() = default;
  virtual bool load(const std::filesystem::path& path, std::vector<std::string>& lines, std::string& msg) = 0;
  virtual bool save(const std::filesystem::path& path, const std::vector<std::string>& lines, std::string& msg) = 0;
};

class PosixFilePort : public IFilePort {
public:
  bool load(const std::filesystem::path& path, std::vector<std::string>& lines, std::string& msg) override;
  bool save(const std::filesystem::path& path, const std::vector<std::string>& lines, std::string& msg) override;
};
