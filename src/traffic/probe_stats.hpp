#pragma once

#include <vector>
#include "probe.hpp"

// Percentile p (0..100) of values by linear interpolation between closest
// ranks. NaN for no values.
double percentile(std::vector<double> values, double p);

// Sample standard deviation; 0 for fewer than two values.
double stddev(const std::vector<double>& values);

// Mean absolute difference of consecutive values, unset below two values.
std::optional<double> jitter(const std::vector<double>& values);

// Aggregate the samples of one pairing.
ProbeSummary summarize(const ProbeSpec& spec, const std::vector<ProbeSample>& samples,
                       bool cancelled);
