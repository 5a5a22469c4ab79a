#pragma once

#include <string>
#include <utility>
#include <vector>
#include "analysis_config.hpp"
#include "metrics.hpp"

// Per-metric statistics across every analyzed file
struct AggregatedMetric {
    std::string name;
    MetricCategory category = MetricCategory::Complexity;
    double average = 0.0;
    double min = 0.0;
    double max = 0.0;
    double median = 0.0;
    double weight = 0.0;
};

// Configured weight of a category
double categoryWeight(MetricCategory category, const MetricWeights& weights);

// Category-weighted mean of normalized scores; 100 for no metrics or zero total weight
double calculateScore(const std::vector<MetricResult>& metrics, const MetricWeights& weights);

// Normalized scores grouped by metric name, in first-seen order
std::vector<AggregatedMetric> aggregateMetrics(const std::vector<std::vector<MetricResult>>& perFileMetrics,
                                               const MetricWeights& weights);

// Mean of (score, weight) pairs; weights below 1 count as 1. 100 when empty.
double overallScore(const std::vector<std::pair<double, double>>& weightedScores);
