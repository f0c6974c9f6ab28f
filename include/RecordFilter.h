#pragma once

#include "CalendarDate.h"
#include "FeedRecords.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Selection applied to ingredient records before aggregation.
 * @details An empty set, or one containing kAllSentinel, leaves that dimension unrestricted.
 *          Dimensions combine with AND; values inside a dimension combine with OR.
 */
struct FilterCriteria {
    static constexpr const char* kAllSentinel = "ALL";

    std::vector<std::string> operators;
    std::vector<std::string> foods;
    std::vector<std::string> diets;
    std::optional<CalendarDate> startDate;
    std::optional<CalendarDate> endDate;
};

enum class FilterDimension { OPERATOR, FOOD, DIET, FOOD_TYPE };

class RecordFilter {
public:
    /**
     * @brief Returns the records matching `criteria`, in input order.
     * @post Date bounds are inclusive; an absent bound is open.
     */
    static std::vector<IngredientRecord> apply(const std::vector<IngredientRecord>& records,
                                               const FilterCriteria& criteria);

    static bool matches(const IngredientRecord& record, const FilterCriteria& criteria);

    // Sorted distinct values, the choices a front end offers for each selector.
    static std::vector<std::string> distinctValues(const std::vector<IngredientRecord>& records,
                                                   FilterDimension dimension);

    static std::optional<std::pair<CalendarDate, CalendarDate>> dateSpan(const std::vector<IngredientRecord>& records);
};
