#include "WeightedAggregator.h"
#include "FeedMixExceptions.h"

#include <cmath>

void RelativeWeightMap::set(const std::string& foodType, double weight) {
    if (!std::isfinite(weight) || weight < 0.0 || weight > 1.0) {
        throw FeedMix::ConfigurationException("weight for food type '" + foodType + "' must be within [0,1]");
    }
    weights_[foodType] = weight;
}

double RelativeWeightMap::weightFor(const std::string& foodType) const {
    const auto it = weights_.find(foodType);
    return it == weights_.end() ? kDefaultWeight : it->second;
}

AggregationResult WeightedAggregator::aggregate(const std::vector<IngredientRecord>& records,
                                                const RelativeWeightMap& weights) {
    // Ordered by batch code, which fixes the output order.
    std::map<std::string, BatchAggregate> groups;
    for (const auto& record : records) {
        auto [it, inserted] = groups.try_emplace(record.batchCode);
        BatchAggregate& agg = it->second;
        if (inserted) {
            agg.batchCode = record.batchCode;
            agg.date = record.date;
            agg.operatorName = record.operatorName;
            agg.dietName = record.dietName;
        }

        const double adjusted = record.plannedKg * weights.weightFor(record.foodType);
        agg.totalAdjustedQty += adjusted;
        agg.totalContribution += adjusted * std::abs(record.pctDifference);
        ++agg.ingredientCount;
    }

    AggregationResult result;
    result.aggregates.reserve(groups.size());
    for (auto& [code, agg] : groups) {
        if (agg.totalAdjustedQty == 0.0) {
            result.diagnostics.add(DiagnosticKind::DIVISION_UNDEFINED,
                                   code,
                                   "Batch excluded: total adjusted quantity is zero across " +
                                       std::to_string(agg.ingredientCount) + " ingredient rows");
            continue;
        }
        agg.weightedAvgPct = agg.totalContribution / agg.totalAdjustedQty;
        if (!std::isfinite(agg.weightedAvgPct)) {
            result.diagnostics.add(DiagnosticKind::DIVISION_UNDEFINED,
                                   code,
                                   "Batch excluded: weighted average is not finite");
            continue;
        }
        result.aggregates.push_back(std::move(agg));
    }
    return result;
}
