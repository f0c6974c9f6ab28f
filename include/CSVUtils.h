#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Tokenization, header normalization and table loading.
// No semantic typing happens here; RecordNormalizer owns that.

struct ParseLimits {
    size_t maxFieldBytes = 1024 * 1024;        // 1 MiB
    size_t maxColumns = 4096;
    // A quoted field running past this many lines is treated as an unterminated quote.
    size_t maxPhysicalLinesPerRecord = 64;
};

struct TableLoadOptions {
    char delimiter = ',';
    // Non-data rows above the header line (report titles, export banners).
    size_t skipRows = 0;
    // Spreadsheet exports often carry an index column before the data.
    bool removeFirstColumn = false;
    std::vector<std::string> columnsToRemove;
    ParseLimits limits;
};

struct RawTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
    // 1-based source line on which each entry of `rows` starts.
    std::vector<size_t> rowLines;
    size_t malformedRows = 0;
    // Source lines of records dropped for unbalanced quotes; reading resumes on the next line.
    std::vector<size_t> malformedLines;

    /**
     * @brief Returns index of the column whose header equals `name` or -1 when absent.
     * @details Matching is exact first, then case-insensitive.
     */
    int findColumn(const std::string& name) const;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one logical CSV record, which may span several physical lines inside quotes.
 * @details `malformed` is set for a quote still open at end of input or after
 *          `limits.maxPhysicalLinesPerRecord` lines. `consumedLines` receives the number of
 *          line breaks read.
 * @post Returns an empty vector at end of input or on a blank line.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed = nullptr,
                                      bool* limitExceeded = nullptr,
                                      const ParseLimits& limits = ParseLimits{},
                                      size_t* consumedLines = nullptr);

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

/**
 * @brief Loads a whole table, applying the row/column trimming in `options`.
 * @details A record with an unbalanced quote is dropped alone: reading restarts on the
 *          physical line after the one it began on.
 * @throws FeedMix::DatasetException when no header line can be read or a row exceeds limits.
 */
RawTable loadTable(std::istream& is, const TableLoadOptions& options);

/**
 * @throws FeedMix::IOException when the file cannot be opened.
 */
RawTable loadTableFile(const std::string& path, const TableLoadOptions& options);

std::string escapeField(const std::string& value, char delimiter = ',');
}
