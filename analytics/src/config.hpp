#pragma once

#include "types.hpp"
#include <string>

enum class TrendModel {
    Regression,
    Windowed
};

enum class AnomalyMode {
    Ratio,
    ZScore
};

enum class PressureModel {
    Composite,
    Flow
};

std::string to_string(TrendModel model);
std::string to_string(AnomalyMode mode);
std::string to_string(PressureModel model);
TrendModel parse_trend_model(const std::string& name);
AnomalyMode parse_anomaly_mode(const std::string& name);
PressureModel parse_pressure_model(const std::string& name);

struct Config {
    // Service configuration
    std::string service_name = "analytics";
    std::string listen_addr = "0.0.0.0";
    int listen_port = 8083;
    std::string log_level = "info";

    // Run metadata
    std::string data_source_name = "Binance";
    Interval interval = Interval::H1;
    int klines_limit = 50;
    int depth_limit = 1000;

    // Strategy selection
    TrendModel trend_model = TrendModel::Regression;
    AnomalyMode anomaly_mode = AnomalyMode::Ratio;
    PressureModel pressure_model = PressureModel::Composite;

    // Analyze symbols on separate tasks
    bool parallel_symbols = true;

    // Load from a JSON file; keys missing from the file keep their defaults
    void load(const std::string& path);

    // Load from environment variables
    void load_from_env();

    void validate() const;
};
