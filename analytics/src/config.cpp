#include "config.hpp"
#include "util.hpp"
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

std::string to_string(TrendModel model) {
    return model == TrendModel::Regression ? "regression" : "windowed";
}

std::string to_string(AnomalyMode mode) {
    return mode == AnomalyMode::Ratio ? "ratio" : "zscore";
}

std::string to_string(PressureModel model) {
    return model == PressureModel::Composite ? "composite" : "flow";
}

TrendModel parse_trend_model(const std::string& name) {
    if (name == "regression") return TrendModel::Regression;
    if (name == "windowed") return TrendModel::Windowed;
    throw std::runtime_error("Unknown trend model: " + name);
}

AnomalyMode parse_anomaly_mode(const std::string& name) {
    if (name == "ratio") return AnomalyMode::Ratio;
    if (name == "zscore") return AnomalyMode::ZScore;
    throw std::runtime_error("Unknown anomaly mode: " + name);
}

PressureModel parse_pressure_model(const std::string& name) {
    if (name == "composite") return PressureModel::Composite;
    if (name == "flow") return PressureModel::Flow;
    throw std::runtime_error("Unknown pressure model: " + name);
}

void Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in config file " + path + ": " + e.what());
    }

    service_name = j.value("service_name", service_name);
    listen_addr = j.value("listen_addr", listen_addr);
    listen_port = j.value("listen_port", listen_port);
    log_level = j.value("log_level", log_level);

    data_source_name = j.value("data_source_name", data_source_name);
    if (j.contains("interval")) {
        interval = parse_interval(j.at("interval").get<std::string>());
    }
    klines_limit = j.value("klines_limit", klines_limit);
    depth_limit = j.value("depth_limit", depth_limit);

    if (j.contains("trend_model")) {
        trend_model = parse_trend_model(j.at("trend_model").get<std::string>());
    }
    if (j.contains("anomaly_mode")) {
        anomaly_mode = parse_anomaly_mode(j.at("anomaly_mode").get<std::string>());
    }
    if (j.contains("pressure_model")) {
        pressure_model = parse_pressure_model(j.at("pressure_model").get<std::string>());
    }
    parallel_symbols = j.value("parallel_symbols", parallel_symbols);
}

void Config::load_from_env() {
    // Service configuration
    service_name = util::get_env_var("SERVICE_NAME", service_name);
    listen_addr = util::get_env_var("LISTEN_ADDR", listen_addr);
    listen_port = util::get_env_int("LISTEN_PORT", listen_port);
    log_level = util::get_env_var("LOG_LEVEL", log_level);

    data_source_name = util::get_env_var("DATA_SOURCE_NAME", data_source_name);
    interval = parse_interval(util::get_env_var("INTERVAL", to_string(interval)));
    klines_limit = util::get_env_int("KLINES_LIMIT", klines_limit);
    depth_limit = util::get_env_int("DEPTH_LIMIT", depth_limit);

    trend_model = parse_trend_model(util::get_env_var("TREND_MODEL", to_string(trend_model)));
    anomaly_mode = parse_anomaly_mode(util::get_env_var("ANOMALY_MODE", to_string(anomaly_mode)));
    pressure_model = parse_pressure_model(util::get_env_var("PRESSURE_MODEL", to_string(pressure_model)));
    parallel_symbols = util::get_env_bool("PARALLEL_SYMBOLS", parallel_symbols);
}

void Config::validate() const {
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT must be between 1 and 65535");
    }

    if (klines_limit < 1) {
        throw std::runtime_error("KLINES_LIMIT must be positive");
    }

    if (depth_limit < 0) {
        throw std::runtime_error("DEPTH_LIMIT cannot be negative");
    }

    spdlog::info("Configuration validated: trend={}, anomalies={}, pressure={}",
                 to_string(trend_model), to_string(anomaly_mode), to_string(pressure_model));
}
