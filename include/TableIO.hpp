#ifndef TABLE_IO_HPP
#define TABLE_IO_HPP

/**
 * @file TableIO.hpp
 * @brief Minimal comma-separated table reader/writer used for the facility,
 * receptor and result tables
 */

#include <initializer_list>
#include <string>
#include <vector>
#include <ostream>

namespace FIOGT {

/**
 * @brief In-memory CSV table with a header row
 */
struct CSVTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    // Index of a column, or -1 when absent (header names are trimmed, case-sensitive)
    int column(const std::string& name) const;

    // First column found among the candidate names, or -1
    int findColumn(std::initializer_list<std::string> candidates) const;

    // Cell value or empty string when the row is short
    const std::string& cell(size_t row, int col) const;
};

/**
 * @brief Read a CSV file with a header row
 * @throws DataValidationError if the file cannot be opened or has no header
 */
CSVTable readCSV(const std::string& filename);

/**
 * @brief Split one CSV record; double-quoted fields may contain commas
 */
std::vector<std::string> splitCSVLine(const std::string& line);

/**
 * @brief Quote a field when it contains separators or quotes
 */
std::string csvField(const std::string& value);

/**
 * @brief Parse a numeric cell; empty, malformed or non-finite cells return false
 */
bool parseNumber(const std::string& text, double& value);

} // namespace FIOGT

#endif // TABLE_IO_HPP
