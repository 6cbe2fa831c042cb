#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "rule_evaluator/rule_evaluator.hpp"
#include "transaction_batch/transaction_batch.hpp"

namespace payment_controls {

struct ControlMetric {
    std::string control_id;
    std::size_t hits = 0;
    double hit_rate = 0.0;         // hits / whole batch, rounded to 4 places
    double precision_proxy = 0.0;  // share of hits labelled is_fraud_pattern, rounded to 4 places
};

// Half to even, to `digits` decimal places.
double RoundTo(double value, int digits);

/**
 * MonitoringAggregator
 *
 * Per-control noise and label correlation. The hit rate denominator is the
 * whole batch across all rails, so rates stay comparable between rails (and
 * controls on small rails read low). The precision proxy uses the synthetic
 * label generated with the data; it is not an observed precision.
 */
class MonitoringAggregator {
public:
    // Only controls with at least one hit appear. Sorted by hits descending,
    // then by control_id.
    static std::vector<ControlMetric> Aggregate(const TransactionBatch& batch,
                                                const std::vector<Hit>& hits);
};

}  // namespace payment_controls
