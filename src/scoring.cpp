#include "scoring.hpp"
#include <algorithm>
#include <numeric>
#include <unordered_map>
#include <utility>

double categoryWeight(MetricCategory category, const MetricWeights& weights) {
    switch (category) {
        case MetricCategory::Complexity: return weights.complexity;
        case MetricCategory::Size: return weights.size;
        case MetricCategory::Duplication: return weights.duplication;
        case MetricCategory::Documentation: return weights.documentation;
        case MetricCategory::Naming: return weights.naming;
        case MetricCategory::Structure: return weights.structure;
        case MetricCategory::Error: return weights.error;
    }
    return 0.0;
}

double calculateScore(const std::vector<MetricResult>& metrics, const MetricWeights& weights) {
    if (metrics.empty()) {
        return 100.0;
    }

    double weightedSum = 0.0;
    double totalWeight = 0.0;
    for (const auto& metric : metrics) {
        const double weight = categoryWeight(metric.category, weights);
        weightedSum += metric.normalizedScore * weight;
        totalWeight += weight;
    }
    if (totalWeight <= 0.0) {
        return 100.0;
    }
    return weightedSum / totalWeight;
}

std::vector<AggregatedMetric> aggregateMetrics(const std::vector<std::vector<MetricResult>>& perFileMetrics,
                                               const MetricWeights& weights) {
    std::vector<AggregatedMetric> aggregated;
    std::vector<std::vector<double>> scores;
    std::unordered_map<std::string, size_t> index;

    for (const auto& fileMetrics : perFileMetrics) {
        for (const auto& metric : fileMetrics) {
            auto it = index.find(metric.name);
            if (it == index.end()) {
                it = index.emplace(metric.name, aggregated.size()).first;
                AggregatedMetric entry;
                entry.name = metric.name;
                entry.category = metric.category;
                entry.weight = categoryWeight(metric.category, weights);
                aggregated.push_back(entry);
                scores.emplace_back();
            }
            scores[it->second].push_back(metric.normalizedScore);
        }
    }

    for (size_t i = 0; i < aggregated.size(); ++i) {
        auto& values = scores[i];
        std::sort(values.begin(), values.end());
        const size_t n = values.size();

        aggregated[i].average = std::accumulate(values.begin(), values.end(), 0.0) / n;
        aggregated[i].min = values.front();
        aggregated[i].max = values.back();
        aggregated[i].median = n % 2 == 0 ? (values[n / 2 - 1] + values[n / 2]) / 2.0 : values[n / 2];
    }
    return aggregated;
}

double overallScore(const std::vector<std::pair<double, double>>& weightedScores) {
    if (weightedScores.empty()) {
        return 100.0;
    }
    double weightedSum = 0.0;
    double totalWeight = 0.0;
    for (const auto& [score, weight] : weightedScores) {
        const double w = std::max(1.0, weight);
        weightedSum += score * w;
        totalWeight += w;
    }
    return weightedSum / totalWeight;
}
