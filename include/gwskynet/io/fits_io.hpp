#pragma once

#include "gwskynet/core/types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gwskynet::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;

    // Integer or floating-point keyword, as double.
    std::optional<double> get_number(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

// Binary table with upper-cased column names. Integer columns (e.g. UNIQ)
// are kept separately so 64-bit indices survive exactly.
struct FitsTable {
    FitsHeader header;
    std::map<std::string, std::vector<double>> double_columns;
    std::map<std::string, std::vector<int64_t>> int_columns;
};

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path);

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header);

// Reads the first binary-table HDU. Vector-valued columns are flattened
// row by row.
FitsTable read_fits_table(const fs::path& path);

void write_fits_table(const fs::path& path, const FitsTable& table,
                      const std::string& extname);

} // namespace gwskynet::io
