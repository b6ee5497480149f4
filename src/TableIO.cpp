#include "TableIO.hpp"
#include "FIOGT.hpp"
#include <fstream>
#include <sstream>
#include <cmath>
#include <cstdlib>

namespace FIOGT {

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

const std::string kEmptyCell;

} // namespace

int CSVTable::column(const std::string& name) const {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) return static_cast<int>(i);
    }
    return -1;
}

int CSVTable::findColumn(std::initializer_list<std::string> candidates) const {
    for (const auto& name : candidates) {
        int idx = column(name);
        if (idx >= 0) return idx;
    }
    return -1;
}

const std::string& CSVTable::cell(size_t row, int col) const {
    if (col < 0 || row >= rows.size()) return kEmptyCell;
    const auto& r = rows[row];
    if (static_cast<size_t>(col) >= r.size()) return kEmptyCell;
    return r[col];
}

std::vector<std::string> splitCSVLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(trim(current));
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(trim(current));
    return fields;
}

CSVTable readCSV(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw DataValidationError("Cannot open table: " + filename);
    }

    CSVTable table;
    std::string line;

    // Header (skip a UTF-8 byte order mark if present)
    while (std::getline(file, line)) {
        if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            line = line.substr(3);
        }
        if (!trim(line).empty()) break;
    }
    if (trim(line).empty()) {
        throw DataValidationError("Table has no header row: " + filename);
    }
    table.header = splitCSVLine(line);

    while (std::getline(file, line)) {
        if (trim(line).empty()) continue;
        table.rows.push_back(splitCSVLine(line));
    }

    return table;
}

std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

bool parseNumber(const std::string& text, double& value) {
    std::string t = trim(text);
    if (t.empty()) return false;

    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (end == t.c_str() || *end != '\0') return false;
    // "nan" and "inf" are read as missing
    if (!std::isfinite(v)) return false;
    value = v;
    return true;
}

} // namespace FIOGT
