#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace util {

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

int get_env_int(const std::string& name, int default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid integer value for env var " + name + ": " + value);
    }
}

bool get_env_bool(const std::string& name, bool default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        return false;
    }
    throw std::runtime_error("Invalid boolean value for env var " + name + ": " + value);
}

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    return format_timestamp_ms(ms);
}

std::string format_timestamp_ms(int64_t epoch_ms) {
    std::time_t secs = static_cast<std::time_t>(epoch_ms / 1000);
    int64_t ms = epoch_ms % 1000;
    if (ms < 0) {
        ms += 1000;
        --secs;
    }

    std::tm tm{};
    gmtime_r(&secs, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return ss.str();
}

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double std_dev(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double m = mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - m) * (v - m);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

double correlation(const std::vector<double>& x, const std::vector<double>& y) {
    return linear_regression(x, y).r_value;
}

RegressionResult linear_regression(const std::vector<double>& x, const std::vector<double>& y) {
    RegressionResult result;
    const size_t n = x.size();
    if (n == 0 || n != y.size()) {
        return result;
    }

    double x_mean = mean(x);
    double y_mean = mean(y);

    double xx_sum = 0.0;
    double yy_sum = 0.0;
    double xy_sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double dx = x[i] - x_mean;
        double dy = y[i] - y_mean;
        xx_sum += dx * dx;
        yy_sum += dy * dy;
        xy_sum += dx * dy;
    }

    result.slope = xx_sum == 0.0 ? 0.0 : xy_sum / xx_sum;
    result.intercept = y_mean - result.slope * x_mean;

    double denom = std::sqrt(xx_sum * yy_sum);
    result.r_value = denom == 0.0 ? 0.0 : xy_sum / denom;
    return result;
}

double rising_fraction(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    size_t rising = 0;
    for (size_t i = 1; i < values.size(); ++i) {
        if (values[i] > values[i - 1]) {
            ++rising;
        }
    }
    return static_cast<double>(rising) / static_cast<double>(values.size() - 1);
}

std::vector<double> deltas(const std::vector<double>& values) {
    std::vector<double> out;
    if (values.size() < 2) {
        return out;
    }
    out.reserve(values.size() - 1);
    for (size_t i = 1; i < values.size(); ++i) {
        out.push_back(values[i] - values[i - 1]);
    }
    return out;
}

std::vector<double> tail(const std::vector<double>& values, size_t count) {
    if (values.size() <= count) {
        return values;
    }
    return std::vector<double>(values.end() - static_cast<std::ptrdiff_t>(count), values.end());
}

} // namespace util
