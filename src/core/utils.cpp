#include "utils.hpp"
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <stdexcept>

std::string now_iso() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm utc;
    gmtime_r(&t, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

double safe_stod(const std::string& s, double fallback) {
    try {
        return std::stod(s);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

std::vector<std::string> split_list(const std::string& s, char delim) {
    std::vector<std::string> out;
    size_t pos = 0;
    for (;;) {
        size_t next = s.find(delim, pos);
        std::string piece = s.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        trim(piece);
        if (!piece.empty()) out.push_back(std::move(piece));
        if (next == std::string::npos) break;
        pos = next + 1;
    }
    return out;
}

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string to_upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::string shell_quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '\'';
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += '\'';
    return out;
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() == 1) return platform::home_dir().string();
    if (path[1] != '/') return path;
    return (platform::home_dir() / path.substr(2)).string();
}

std::string parse_md5sum_output(const std::string& output) {
    std::string line = output;
    trim(line);
    return line.substr(0, line.find_first_of(" \t"));
}

std::string compute_file_md5(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return "";
    auto r = platform::run_captured("md5sum", {path.string()}, 60 * 1000);
    if (r.exit_code != 0) return "";
    return parse_md5sum_output(r.stdout_data);
}
