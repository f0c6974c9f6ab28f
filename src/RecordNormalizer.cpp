#include "RecordNormalizer.h"
#include "CommonUtils.h"
#include "FeedMixExceptions.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <utility>
#ifdef FEEDMIX_USE_OPENMP
#include <omp.h>
#endif

namespace {
bool isMissingToken(const std::string& s) {
    if (s.empty()) return true;
    const std::string lower = CommonUtils::toLower(s);
    return lower == "na" || lower == "n/a" || lower == "null" || lower == "none" ||
           lower == "nan" || lower == "-" || lower == "missing";
}

std::string stripSeparators(const std::string& input, NumericLocale locale) {
    std::string cleaned;
    cleaned.reserve(input.size());
    for (char ch : input) {
        if (!std::isspace(static_cast<unsigned char>(ch)) && ch != '_') cleaned.push_back(ch);
    }

    const auto dropCommas = [](const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (char ch : s) {
            if (ch != ',') out.push_back(ch);
        }
        return out;
    };
    const auto europeanToDot = [](const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (char ch : s) {
            if (ch == '.') continue;
            out.push_back(ch == ',' ? '.' : ch);
        }
        return out;
    };

    if (locale == NumericLocale::US) return dropCommas(cleaned);
    if (locale == NumericLocale::EUROPEAN) return europeanToDot(cleaned);

    const size_t lastDot = cleaned.find_last_of('.');
    const size_t lastComma = cleaned.find_last_of(',');
    if (lastDot != std::string::npos && lastComma != std::string::npos) {
        return (lastComma > lastDot) ? europeanToDot(cleaned) : dropCommas(cleaned);
    }
    if (lastComma != std::string::npos) {
        const size_t commaCount = static_cast<size_t>(std::count(cleaned.begin(), cleaned.end(), ','));
        const size_t digitsAfter = cleaned.size() - lastComma - 1;
        std::string intPart = cleaned.substr(0, lastComma);
        if (!intPart.empty() && (intPart[0] == '-' || intPart[0] == '+')) intPart.erase(0, 1);
        // "1,234" reads as a thousands group; "12,5" and "0,125" read as decimals.
        const bool thousandsGroup = commaCount > 1 || (digitsAfter == 3 && !intPart.empty() && intPart != "0");
        if (thousandsGroup) return dropCommas(cleaned);
        std::string out = cleaned;
        out[lastComma] = '.';
        return out;
    }
    return cleaned;
}

struct RowOutcome {
    bool blank = false;
    bool ok = false;
    std::string reason;
    IngredientRecord record;
};

struct ResolvedColumns {
    size_t batchCode = 0;
    size_t foodType = 0;
    int food = -1;
    size_t plannedKg = 0;
    size_t realizedKg = 0;
    size_t pctDifference = 0;
    size_t operatorName = 0;
    size_t dietName = 0;
    size_t date = 0;
};

ResolvedColumns resolveColumns(const CSVUtils::RawTable& table, const ColumnMapping& mapping) {
    std::vector<std::string> missing;
    auto require = [&](const std::string& header) -> size_t {
        const int idx = table.findColumn(header);
        if (idx < 0) {
            missing.push_back(header);
            return 0;
        }
        return static_cast<size_t>(idx);
    };

    ResolvedColumns cols;
    cols.plannedKg = require(mapping.plannedKg);
    cols.realizedKg = require(mapping.realizedKg);
    cols.pctDifference = require(mapping.pctDifference);
    cols.foodType = require(mapping.foodType);
    cols.batchCode = require(mapping.batchCode);
    cols.operatorName = require(mapping.operatorName);
    cols.dietName = require(mapping.dietName);
    cols.date = require(mapping.date);
    if (!mapping.food.empty()) {
        const int idx = table.findColumn(mapping.food);
        if (idx < 0) missing.push_back(mapping.food);
        cols.food = idx;
    }

    if (!missing.empty()) throw FeedMix::MissingColumnException(std::move(missing));
    return cols;
}

const std::string& cell(const std::vector<std::string>& row, size_t idx) {
    static const std::string kEmpty;
    return idx < row.size() ? row[idx] : kEmpty;
}

RowOutcome coerceRow(const std::vector<std::string>& row,
                     const ResolvedColumns& cols,
                     const ColumnMapping& mapping,
                     const NormalizerOptions& options) {
    RowOutcome outcome;
    outcome.blank = std::all_of(row.begin(), row.end(), [](const std::string& v) {
        return CommonUtils::trim(v).empty();
    });
    if (outcome.blank) return outcome;

    IngredientRecord& rec = outcome.record;
    rec.batchCode = CommonUtils::trim(cell(row, cols.batchCode));
    if (rec.batchCode.empty()) {
        outcome.reason = "blank " + mapping.batchCode;
        return outcome;
    }

    const struct {
        size_t column;
        const std::string& header;
        double& target;
    } numericFields[] = {
        {cols.plannedKg, mapping.plannedKg, rec.plannedKg},
        {cols.realizedKg, mapping.realizedKg, rec.realizedKg},
        {cols.pctDifference, mapping.pctDifference, rec.pctDifference},
    };
    for (const auto& field : numericFields) {
        const std::string& raw = cell(row, field.column);
        if (!RecordNormalizer::parseNumber(raw, options.numericLocale, field.target)) {
            outcome.reason = "non-numeric " + field.header + " '" + CommonUtils::trim(raw) + "'";
            return outcome;
        }
    }

    const std::string& rawDate = cell(row, cols.date);
    if (!CalendarDate::parse(rawDate, options.dateOrder, rec.date)) {
        outcome.reason = "unparseable " + mapping.date + " '" + CommonUtils::trim(rawDate) + "'";
        return outcome;
    }

    rec.foodType = CommonUtils::trim(cell(row, cols.foodType));
    rec.foodName = cols.food >= 0 ? CommonUtils::trim(cell(row, static_cast<size_t>(cols.food))) : rec.foodType;
    rec.operatorName = CommonUtils::trim(cell(row, cols.operatorName));
    rec.dietName = CommonUtils::trim(cell(row, cols.dietName));
    outcome.ok = true;
    return outcome;
}
} // namespace

std::vector<std::string> ColumnMapping::requiredHeaders() const {
    std::vector<std::string> out = {plannedKg, realizedKg, pctDifference, foodType,
                                    batchCode, operatorName, dietName, date};
    if (!food.empty()) out.push_back(food);
    return out;
}

bool RecordNormalizer::parseNumber(const std::string& raw, NumericLocale locale, double& out) {
    std::string s = CommonUtils::trim(raw);
    if (isMissingToken(s)) return false;

    if (s.front() == '+') s.erase(s.begin());
    if (!s.empty() && s.back() == '%') s = CommonUtils::trim(s.substr(0, s.size() - 1));
    if (s.empty()) return false;

    const std::string cleaned = stripSeparators(s, locale);
    if (cleaned.empty()) return false;

    double value = 0.0;
    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, value, std::chars_format::general);
    if (ec != std::errc{} || p != e || !std::isfinite(value)) return false;
    out = value;
    return true;
}

NormalizationResult RecordNormalizer::normalize(const CSVUtils::RawTable& table,
                                                const ColumnMapping& mapping,
                                                const NormalizerOptions& options) {
    const ResolvedColumns cols = resolveColumns(table, mapping);

    std::vector<RowOutcome> outcomes(table.rows.size());
    const long long rowCount = static_cast<long long>(table.rows.size());
    #ifdef FEEDMIX_USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (long long r = 0; r < rowCount; ++r) {
        outcomes[static_cast<size_t>(r)] = coerceRow(table.rows[static_cast<size_t>(r)], cols, mapping, options);
    }

    NormalizationResult result;
    result.sourceRows = table.rows.size() + table.malformedLines.size();
    result.malformedRows = table.malformedLines.size();
    result.records.reserve(table.rows.size());

    // (source line, reason) of every dropped row, in file order.
    std::vector<std::pair<size_t, std::string>> dropped;
    for (size_t line : table.malformedLines) dropped.emplace_back(line, "unbalanced quote");
    for (size_t r = 0; r < outcomes.size(); ++r) {
        RowOutcome& outcome = outcomes[r];
        if (outcome.blank) {
            ++result.blankRows;
            continue;
        }
        if (outcome.ok) {
            result.records.push_back(std::move(outcome.record));
            continue;
        }
        // Tables assembled in memory carry no line numbers; assume one line per row after the header.
        const size_t line = r < table.rowLines.size() ? table.rowLines[r] : r + 2;
        dropped.emplace_back(line, std::move(outcome.reason));
    }
    std::stable_sort(dropped.begin(), dropped.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    result.droppedRows = dropped.size();
    for (size_t i = 0; i < dropped.size() && i < options.maxRowDiagnostics; ++i) {
        result.diagnostics.add(DiagnosticKind::COERCION_WARNING,
                               "line " + std::to_string(dropped[i].first),
                               "Row dropped: " + dropped[i].second);
    }

    if (result.droppedRows > options.maxRowDiagnostics) {
        const size_t folded = result.droppedRows - options.maxRowDiagnostics;
        result.diagnostics.add(DiagnosticKind::COERCION_WARNING,
                               "rows",
                               std::to_string(folded) + " further rows dropped (" +
                                   std::to_string(result.droppedRows) + " in total)");
    }
    return result;
}
