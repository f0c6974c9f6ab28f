#include "RecordFilter.h"

#include <algorithm>
#include <iterator>
#include <set>

namespace {
bool isUnrestricted(const std::vector<std::string>& allowed) {
    if (allowed.empty()) return true;
    return std::find(allowed.begin(), allowed.end(), FilterCriteria::kAllSentinel) != allowed.end();
}

bool allows(const std::vector<std::string>& allowed, const std::string& value) {
    if (isUnrestricted(allowed)) return true;
    return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

const std::string& dimensionValue(const IngredientRecord& record, FilterDimension dimension) {
    switch (dimension) {
        case FilterDimension::OPERATOR: return record.operatorName;
        case FilterDimension::FOOD: return record.foodName;
        case FilterDimension::DIET: return record.dietName;
        case FilterDimension::FOOD_TYPE: return record.foodType;
    }
    return record.foodType;
}
} // namespace

bool RecordFilter::matches(const IngredientRecord& record, const FilterCriteria& criteria) {
    if (criteria.startDate && record.date < *criteria.startDate) return false;
    if (criteria.endDate && record.date > *criteria.endDate) return false;
    return allows(criteria.operators, record.operatorName) &&
           allows(criteria.foods, record.foodName) &&
           allows(criteria.diets, record.dietName);
}

std::vector<IngredientRecord> RecordFilter::apply(const std::vector<IngredientRecord>& records,
                                                  const FilterCriteria& criteria) {
    std::vector<IngredientRecord> out;
    out.reserve(records.size());
    std::copy_if(records.begin(), records.end(), std::back_inserter(out), [&criteria](const IngredientRecord& r) {
        return matches(r, criteria);
    });
    return out;
}

std::vector<std::string> RecordFilter::distinctValues(const std::vector<IngredientRecord>& records,
                                                      FilterDimension dimension) {
    std::set<std::string> unique;
    for (const auto& record : records) {
        const std::string& value = dimensionValue(record, dimension);
        if (!value.empty()) unique.insert(value);
    }
    return std::vector<std::string>(unique.begin(), unique.end());
}

std::optional<std::pair<CalendarDate, CalendarDate>> RecordFilter::dateSpan(const std::vector<IngredientRecord>& records) {
    if (records.empty()) return std::nullopt;
    CalendarDate lo = records.front().date;
    CalendarDate hi = records.front().date;
    for (const auto& record : records) {
        if (record.date < lo) lo = record.date;
        if (record.date > hi) hi = record.date;
    }
    return std::make_pair(lo, hi);
}
