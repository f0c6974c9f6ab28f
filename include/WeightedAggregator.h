#pragma once

#include "FeedRecords.h"

#include <map>
#include <string>
#include <vector>

/**
 * @brief Relative weight per food type, each within [0, 1].
 * @details Food types without an entry weigh kDefaultWeight (equal weighting).
 *          Weights need not sum to 1; aggregation normalizes by adjusted quantity.
 */
class RelativeWeightMap {
public:
    static constexpr double kDefaultWeight = 1.0;

    /**
     * @throws FeedMix::ConfigurationException when `weight` is not finite or lies outside [0, 1].
     */
    void set(const std::string& foodType, double weight);

    double weightFor(const std::string& foodType) const;
    bool contains(const std::string& foodType) const { return weights_.count(foodType) != 0; }
    bool empty() const noexcept { return weights_.empty(); }

    const std::map<std::string, double>& entries() const noexcept { return weights_; }

private:
    std::map<std::string, double> weights_;
};

struct AggregationResult {
    std::vector<BatchAggregate> aggregates;
    Diagnostics diagnostics;
};

class WeightedAggregator {
public:
    /**
     * @brief Collapses ingredient rows into one weighted deviation per batch code.
     * @details adjusted = planned_kg * weight(food_type); contribution = adjusted * |pct_difference|;
     *          weighted_avg_pct = sum(contribution) / sum(adjusted).
     * @post Sorted by batch code. Batches whose adjusted total is zero are omitted and each
     *       recorded as one DivisionUndefinedError diagnostic.
     */
    static AggregationResult aggregate(const std::vector<IngredientRecord>& records,
                                       const RelativeWeightMap& weights);
};
