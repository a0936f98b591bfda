#pragma once
/*
 * FileReader
 *
 * Purpose: read a file via mmap and split it into lines; normalize CRLF.
 * Usage: mmap_readlines(path, out_lines, msg); returns false with msg on failure.
 * Note: a final trailing newline does not produce an extra empty line, and an
 * empty file yields no lines at all.
 */
#include <vector>
#include <string>
#include <string_view>
#include <filesystem>

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);

void split_lines(std::string_view data, std::vector<std::string>& out_lines);
