#pragma once

#include <string>
#include <vector>
#include <filesystem>

// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
std::string now_iso();

// Numeric parses that return fallback instead of throwing.
int safe_stoi(const std::string& s, int fallback = 0);
double safe_stod(const std::string& s, double fallback = 0.0);

inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// "a, b,,c" -> {"a", "b", "c"}
std::vector<std::string> split_list(const std::string& s, char delim = ',');

std::string to_lower(std::string s);
std::string to_upper(std::string s);

// Single-quotes a word for a remote POSIX shell.
std::string shell_quote(const std::string& s);

// "~" and "~/x" resolve against the local home directory.
std::string expand_home(const std::string& path);

// Hex digest of a local file via md5sum, empty when unavailable.
std::string compute_file_md5(const std::filesystem::path& path);

// Digest column of a "hash  name" md5sum line.
std::string parse_md5sum_output(const std::string& output);
