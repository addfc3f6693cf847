#include "log_entry.hpp"
#include "metrics_export.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <ctime>
#include <fstream>
#include <sstream>

namespace {

struct LevelKeywords {
    const char* level;
    std::vector<const char*> keywords;
};

const LevelKeywords LEVELS[] = {
    {"ERROR",    {"ERROR", "error", "ERR", "err"}},
    {"WARNING",  {"WARNING", "warning", "WARN", "warn"}},
    {"DEBUG",    {"DEBUG", "debug"}},
    {"CRITICAL", {"CRITICAL", "critical", "FATAL", "fatal"}},
};

const char* const TIMESTAMP_FORMATS[] = {
    "%Y-%m-%d %H:%M:%S",
    "%Y/%m/%d %H:%M:%S",
    "%b %d %H:%M:%S",
};

int current_year() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    return tm.tm_year + 1900;
}

} // namespace

std::string detect_log_level(const std::string& line) {
    for (const auto& l : LEVELS) {
        for (const char* k : l.keywords) {
            if (line.find(k) != std::string::npos) return l.level;
        }
    }
    return "INFO";
}

std::optional<std::string> bracketed_timestamp(const std::string& line) {
    auto open = line.find('[');
    if (open == std::string::npos) return std::nullopt;
    auto close = line.find(']', open + 1);
    if (close == std::string::npos) return std::nullopt;
    std::string text = line.substr(open + 1, close - open - 1);

    for (const char* format : TIMESTAMP_FORMATS) {
        std::tm tm{};
        tm.tm_year = -1;
        const char* end = strptime(text.c_str(), format, &tm);
        if (!end || *end != '\0') continue;
        int year = tm.tm_year == -1 ? current_year() : tm.tm_year + 1900;
        return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}", year, tm.tm_mon + 1, tm.tm_mday,
                           tm.tm_hour, tm.tm_min, tm.tm_sec);
    }
    return std::nullopt;
}

LogEntry parse_log_entry(const std::string& host, const std::string& line,
                         const std::string& source_file) {
    LogEntry e;
    e.host = host;
    e.timestamp = bracketed_timestamp(line).value_or(now_iso());
    e.level = detect_log_level(line);
    e.message = line;
    e.source_file = source_file;
    return e;
}

std::optional<LogExportFormat> log_export_format_from_string(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "json") return LogExportFormat::Json;
    if (lower == "csv") return LogExportFormat::Csv;
    if (lower == "text" || lower == "txt") return LogExportFormat::Text;
    return std::nullopt;
}

nlohmann::json to_json(const LogEntry& e) {
    return nlohmann::json{
        {"host", e.host},
        {"timestamp", e.timestamp},
        {"level", e.level},
        {"message", e.message},
        {"source_file", e.source_file},
    };
}

std::string format_log_entry(const LogEntry& e) {
    return fmt::format("{} [{}] {}: {}", e.timestamp, e.level, e.host, e.message);
}

std::string render_log_entries(const std::vector<LogEntry>& entries, LogExportFormat format) {
    std::ostringstream out;
    switch (format) {
        case LogExportFormat::Json: {
            nlohmann::json doc = nlohmann::json::array();
            for (const auto& e : entries) doc.push_back(to_json(e));
            out << doc.dump(2) << "\n";
            break;
        }
        case LogExportFormat::Csv:
            out << "timestamp,host,level,message,source_file\n";
            for (const auto& e : entries) {
                out << csv_escape(e.timestamp) << "," << csv_escape(e.host) << ","
                    << csv_escape(e.level) << "," << csv_escape(e.message) << ","
                    << csv_escape(e.source_file) << "\n";
            }
            break;
        case LogExportFormat::Text:
            for (const auto& e : entries) out << format_log_entry(e) << "\n";
            break;
    }
    return out.str();
}

Result<void> write_log_entries(const std::vector<LogEntry>& entries, LogExportFormat format,
                               const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);

    std::ofstream out(path);
    if (!out) return Result<void>::Err("Cannot write " + path.string(), ErrorKind::CommandFailed);
    out << render_log_entries(entries, format);
    if (!out) return Result<void>::Err("Write failed for " + path.string(), ErrorKind::CommandFailed);

    fleetrun_log(fmt::format("Exported {} log entries to {}", entries.size(), path.string()));
    return Result<void>::Ok();
}
