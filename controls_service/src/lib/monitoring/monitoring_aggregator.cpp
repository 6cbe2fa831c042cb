#include "monitoring_aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace payment_controls {

namespace {

struct ControlTally {
    std::size_t hits = 0;
    std::size_t labelled = 0;  // hits joined back to a batch row
    std::size_t fraud = 0;
};

}  // namespace

double RoundTo(double value, int digits) {
    const double scale = std::pow(10.0, digits);
    // Default FE_TONEAREST: exact halves go to the even neighbour.
    return std::nearbyint(value * scale) / scale;
}

std::vector<ControlMetric> MonitoringAggregator::Aggregate(const TransactionBatch& batch,
                                                           const std::vector<Hit>& hits) {
    std::map<std::string, ControlTally> tallies;
    for (const auto& hit : hits) {
        auto& tally = tallies[hit.control_id];
        ++tally.hits;
        if (const auto* tx = batch.Find(hit.tx_id, hit.rail)) {
            ++tally.labelled;
            if (tx->is_fraud_pattern()) {
                ++tally.fraud;
            }
        }
    }

    const auto population = static_cast<double>(batch.Size());
    std::vector<ControlMetric> metrics;
    metrics.reserve(tallies.size());
    for (const auto& [control_id, tally] : tallies) {
        ControlMetric metric;
        metric.control_id = control_id;
        metric.hits = tally.hits;
        metric.hit_rate = population > 0 ? RoundTo(tally.hits / population, 4) : 0.0;
        metric.precision_proxy = tally.labelled > 0
            ? RoundTo(static_cast<double>(tally.fraud) / tally.labelled, 4)
            : 0.0;
        metrics.push_back(std::move(metric));
    }

    std::stable_sort(metrics.begin(), metrics.end(),
                     [](const ControlMetric& lhs, const ControlMetric& rhs) {
                         return lhs.hits > rhs.hits;
                     });
    return metrics;
}

}  // namespace payment_controls
