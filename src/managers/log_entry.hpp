#pragma once

#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <core/types.hpp>

// One captured line with what could be read out of it.
struct LogEntry {
    std::string host;
    std::string timestamp;      // from the line when present, else capture time
    std::string level;          // CRITICAL, ERROR, WARNING, DEBUG or INFO
    std::string message;        // the whole line
    std::string source_file;
};

// Keyword scan in order ERROR, WARNING, DEBUG, CRITICAL; INFO when none hit.
std::string detect_log_level(const std::string& line);

// The first [...] of the line as YYYY-MM-DDTHH:MM:SS, when it holds
// "%Y-%m-%d %H:%M:%S", "%Y/%m/%d %H:%M:%S" or "%b %d %H:%M:%S" (current year).
std::optional<std::string> bracketed_timestamp(const std::string& line);

LogEntry parse_log_entry(const std::string& host, const std::string& line,
                         const std::string& source_file);

enum class LogExportFormat { Json, Csv, Text };

std::optional<LogExportFormat> log_export_format_from_string(const std::string& s);

nlohmann::json to_json(const LogEntry& e);

// "<timestamp> [LEVEL] host: message"
std::string format_log_entry(const LogEntry& e);

std::string render_log_entries(const std::vector<LogEntry>& entries, LogExportFormat format);

Result<void> write_log_entries(const std::vector<LogEntry>& entries, LogExportFormat format,
                               const std::filesystem::path& path);
