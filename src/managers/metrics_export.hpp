#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <core/types.hpp>
#include <traffic/probe.hpp>
#include "metrics_store.hpp"

enum class ExportFormat { Json, Csv, Prometheus };

std::optional<ExportFormat> export_format_from_string(const std::string& s);

nlohmann::json to_json(const CommandResult& c);
nlohmann::json to_json(const OperationResult& r);
nlohmann::json to_json(const OperationRecord& r);
nlohmann::json to_json(const HostMetrics& m);
nlohmann::json to_json(const ProbeSample& s);
nlohmann::json to_json(const ProbeSummary& s);

// {"operations": [...], "hosts": {...}, "summary": {...}, "traffic": [...]}
nlohmann::json metrics_document(const MetricsSnapshot& snapshot);

// Per-host results of one invocation, keyed by host.
nlohmann::json results_document(const std::map<std::string, OperationResult>& results);

// RFC 4180 quoting for one field.
std::string csv_escape(const std::string& s);

// CSV and Prometheus text are rendered from the JSON document only.
std::string render_csv(const nlohmann::json& doc);
std::string render_prometheus(const nlohmann::json& doc);
std::string render(const nlohmann::json& doc, ExportFormat format);

Result<void> write_export(const nlohmann::json& doc, ExportFormat format,
                          const std::filesystem::path& path);
