#pragma once

#include "types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);
bool get_env_bool(const std::string& name, bool default_value);

// Time utilities
std::string current_iso8601();
std::string format_timestamp_ms(int64_t epoch_ms);

// Math utilities. All statistics use the population (divide by n) form.
double mean(const std::vector<double>& values);
double std_dev(const std::vector<double>& values);

// Pearson correlation; 0 when either series is constant or sizes differ
double correlation(const std::vector<double>& x, const std::vector<double>& y);

// Ordinary least squares of y against x
RegressionResult linear_regression(const std::vector<double>& x, const std::vector<double>& y);

// Fraction of consecutive steps where values[i] > values[i-1]; 0 for fewer than two values
double rising_fraction(const std::vector<double>& values);

// Successive differences values[i] - values[i-1]
std::vector<double> deltas(const std::vector<double>& values);

// Last `count` values (or all of them when there are fewer)
std::vector<double> tail(const std::vector<double>& values, size_t count);

} // namespace util
