#pragma once

#include <string>
#include <vector>
#include <managers/fleet_service.hpp>
#include <managers/metrics_store.hpp>
#include <traffic/traffic_engine.hpp>

// "ok", or "failed after N retries with <kind>: <error>"
std::string describe_outcome(const OperationResult& r);

// One row per host, then the totals line.
void print_results(const std::string& title, const ResultMap& results);

// Per-host output blocks (exec, chain and interactive).
void print_outputs(const ResultMap& results);

void print_summary(const ResultMap& results);

void print_traffic(const std::vector<TrafficResult>& results);

void print_host_metrics(const std::map<std::string, HostMetrics>& hosts);

// Progress callback that reports retries as they start.
ProgressCallback retry_reporter();
