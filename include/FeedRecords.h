#pragma once

#include "CalendarDate.h"

#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief One ingredient line of a mixing batch after normalization.
 * @details Every numeric field is finite; rows that failed coercion never become records.
 */
struct IngredientRecord {
    std::string batchCode;
    std::string foodType;
    std::string foodName;
    double plannedKg = 0.0;
    double realizedKg = 0.0;
    double pctDifference = 0.0;
    std::string operatorName;
    std::string dietName;
    CalendarDate date;
};

/**
 * @brief Weighted deviation of one batch.
 * @details weightedAvgPct == totalContribution / totalAdjustedQty.
 */
struct BatchAggregate {
    std::string batchCode;
    double weightedAvgPct = 0.0;
    CalendarDate date;
    std::string operatorName;
    std::string dietName;
    double totalAdjustedQty = 0.0;
    double totalContribution = 0.0;
    size_t ingredientCount = 0;
};

enum class DiagnosticKind { COERCION_WARNING, DIVISION_UNDEFINED, EMPTY_RESULT };

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::COERCION_WARNING;
    std::string subject;
    std::string message;
};

/**
 * @brief Recoverable conditions raised during one analysis run, in the order they occurred.
 */
class Diagnostics {
public:
    void add(DiagnosticKind kind, std::string subject, std::string message);
    void append(const Diagnostics& other);

    const std::vector<Diagnostic>& entries() const noexcept { return entries_; }
    size_t count(DiagnosticKind kind) const;
    bool empty() const noexcept { return entries_.empty(); }

    static const char* kindName(DiagnosticKind kind);

private:
    std::vector<Diagnostic> entries_;
};
