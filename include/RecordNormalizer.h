#pragma once

#include "CSVUtils.h"
#include "CalendarDate.h"
#include "FeedRecords.h"

#include <string>
#include <vector>

/**
 * @brief Source header names for each logical ingredient column.
 * @details `food` is optional; when empty the food type doubles as the food name.
 */
struct ColumnMapping {
    std::string batchCode = "batch_code";
    std::string foodType = "food_type";
    std::string food;
    std::string plannedKg = "planned_kg";
    std::string realizedKg = "realized_kg";
    std::string pctDifference = "pct_difference";
    std::string operatorName = "operator";
    std::string dietName = "diet_name";
    std::string date = "date";

    std::vector<std::string> requiredHeaders() const;
};

enum class NumericLocale { AUTO, US, EUROPEAN };

struct NormalizerOptions {
    NumericLocale numericLocale = NumericLocale::AUTO;
    CalendarDate::OrderHint dateOrder = CalendarDate::OrderHint::DMY;
    // Dropped rows beyond this many are folded into one summary diagnostic.
    size_t maxRowDiagnostics = 20;
};

struct NormalizationResult {
    std::vector<IngredientRecord> records;
    size_t sourceRows = 0;
    // Includes the malformed rows.
    size_t droppedRows = 0;
    size_t malformedRows = 0;
    size_t blankRows = 0;
    Diagnostics diagnostics;
};

class RecordNormalizer {
public:
    /**
     * @brief Resolves the mapped columns once, then coerces every row into an IngredientRecord.
     * @post Rows with a non-numeric quantity or percentage, an unparseable date or a blank batch code
     *       are dropped and reported as CoercionWarning diagnostics. Fully blank rows are skipped silently.
     * @throws FeedMix::MissingColumnException listing every mapped header absent from `table`.
     */
    static NormalizationResult normalize(const CSVUtils::RawTable& table,
                                         const ColumnMapping& mapping,
                                         const NormalizerOptions& options = NormalizerOptions{});

    /**
     * @brief Parses a numeric cell: optional '+', trailing '%', thousands/decimal separators per `locale`.
     * @post Returns false for empty, missing-marker or non-finite values.
     */
    static bool parseNumber(const std::string& raw, NumericLocale locale, double& out);
};
