#include "CSVUtils.h"
#include "CommonUtils.h"
#include "FeedMixExceptions.h"

#include <algorithm>
#include <fstream>
#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;

    const std::streampos start = is.tellg();
    for (unsigned char expected : kBom) {
        const int ch = is.peek();
        if (ch == EOF || static_cast<unsigned char>(ch) != expected) {
            is.clear();
            is.seekg(start);
            return;
        }
        is.get();
    }
}

std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed,
                                      bool* limitExceeded,
                                      const ParseLimits& limits,
                                      size_t* consumedLines) {
    if (malformed) *malformed = false;
    if (limitExceeded) *limitExceeded = false;
    if (consumedLines) *consumedLines = 0;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawDelimiter = false;
    size_t physicalLines = 1;
    char c;

    auto pushField = [&]() {
        row.push_back(fieldQuoted ? val : trimUnquotedField(val));
        val.clear();
        fieldQuoted = false;
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns && limitExceeded) {
            *limitExceeded = true;
        }
    };

    while (is.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    val += '"';
                } else {
                    inQuotes = false;
                }
            } else if (c == '\r' || c == '\n') {
                if (c == '\r' && is.peek() == '\n') is.get();
                if (consumedLines) ++(*consumedLines);
                if (limits.maxPhysicalLinesPerRecord > 0 && ++physicalLines > limits.maxPhysicalLinesPerRecord) {
                    if (malformed) *malformed = true;
                    return {};
                }
                val += '\n';
            } else {
                val += c;
            }
        } else if (c == '"' && CommonUtils::trim(val).empty()) {
            val.clear();
            inQuotes = true;
            fieldQuoted = true;
        } else if (c == delimiter) {
            pushField();
            sawDelimiter = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            if (consumedLines) ++(*consumedLines);
            break;
        } else {
            val += c;
        }

        if (limits.maxFieldBytes > 0 && val.size() > limits.maxFieldBytes) {
            if (limitExceeded) *limitExceeded = true;
            return {};
        }
        if (limitExceeded && *limitExceeded) return {};
    }

    if (inQuotes && malformed) *malformed = true;

    if (!sawDelimiter && !fieldQuoted && CommonUtils::trim(val).empty() && row.empty()) {
        return {};
    }
    pushField();
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out;
    out.reserve(header.size());
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < header.size(); ++i) {
        std::string name = CommonUtils::trim(header[i]);
        if (name.empty()) name = "column_" + std::to_string(i + 1);

        const std::string base = name;
        size_t suffix = 2;
        while (seen.count(name) != 0) {
            name = base + "_" + std::to_string(suffix++);
        }
        seen.insert(name);
        out.push_back(std::move(name));
    }
    return out;
}

int RawTable::findColumn(const std::string& name) const {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) return static_cast<int>(i);
    }
    const std::string wanted = CommonUtils::toLower(CommonUtils::trim(name));
    for (size_t i = 0; i < header.size(); ++i) {
        if (CommonUtils::toLower(header[i]) == wanted) return static_cast<int>(i);
    }
    return -1;
}

RawTable loadTable(std::istream& is, const TableLoadOptions& options) {
    skipBOM(is);

    size_t lineNo = 0;
    size_t consumed = 0;
    for (size_t i = 0; i < options.skipRows && is.peek() != EOF; ++i) {
        parseCSVLine(is, options.delimiter, nullptr, nullptr, options.limits, &consumed);
        lineNo += std::max<size_t>(consumed, 1);
    }

    RawTable table;
    bool malformed = false;
    bool limitExceeded = false;
    std::vector<std::string> header;
    while (header.empty() && is.peek() != EOF) {
        header = parseCSVLine(is, options.delimiter, &malformed, &limitExceeded, options.limits, &consumed);
        lineNo += std::max<size_t>(consumed, 1);
        if (limitExceeded) throw FeedMix::DatasetException("Header line exceeds parse limits");
        if (malformed) break;
    }
    if (header.empty() || malformed) {
        throw FeedMix::DatasetException("Malformed or empty CSV header");
    }

    std::vector<size_t> keep;
    for (size_t c = 0; c < header.size(); ++c) {
        if (options.removeFirstColumn && c == 0) continue;
        const std::string name = CommonUtils::trim(header[c]);
        const bool removed = std::find(options.columnsToRemove.begin(),
                                       options.columnsToRemove.end(),
                                       name) != options.columnsToRemove.end();
        if (!removed) keep.push_back(c);
    }

    std::vector<std::string> keptHeader;
    keptHeader.reserve(keep.size());
    for (size_t c : keep) keptHeader.push_back(header[c]);
    table.header = normalizeHeader(keptHeader);

    while (is.peek() != EOF) {
        const std::streampos recordStart = is.tellg();
        const size_t recordLine = lineNo + 1;
        std::vector<std::string> row =
            parseCSVLine(is, options.delimiter, &malformed, &limitExceeded, options.limits, &consumed);
        if (limitExceeded) {
            throw FeedMix::DatasetException("Line " + std::to_string(recordLine) + " exceeds parse limits");
        }
        if (malformed) {
            ++table.malformedRows;
            table.malformedLines.push_back(recordLine);
            if (recordStart == std::streampos(-1)) break;
            // Resynchronize on the next physical line.
            is.clear();
            is.seekg(recordStart);
            std::string skipped;
            std::getline(is, skipped);
            lineNo = recordLine;
            continue;
        }
        lineNo += std::max<size_t>(consumed, 1);
        if (row.empty()) continue;

        std::vector<std::string> projected;
        projected.reserve(keep.size());
        for (size_t c : keep) {
            projected.push_back(c < row.size() ? row[c] : std::string());
        }
        table.rows.push_back(std::move(projected));
        table.rowLines.push_back(recordLine);
    }
    return table;
}

RawTable loadTableFile(const std::string& path, const TableLoadOptions& options) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw FeedMix::IOException("Could not open file: " + path);
    return loadTable(in, options);
}

std::string escapeField(const std::string& value, char delimiter) {
    const bool needsQuotes = value.find(delimiter) != std::string::npos ||
                             value.find('"') != std::string::npos ||
                             value.find('\n') != std::string::npos ||
                             value.find('\r') != std::string::npos;
    if (!needsQuotes) return value;

    std::string out = "\"";
    for (char ch : value) {
        if (ch == '"') out += "\"\"";
        else out.push_back(ch);
    }
    out += "\"";
    return out;
}
} // namespace CSVUtils
