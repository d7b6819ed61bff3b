#pragma once

#include "config.hpp"
#include "market_analyzer.hpp"
#include <memory>
#include <string>

struct ApiResponse {
    int status = 200;
    std::string body;
};

// HTTP surface of the service: GET /health and POST /analyze
class ApiServer {
public:
    ApiServer(const Config& config, const MarketAnalyzer& analyzer);
    ~ApiServer();

    void start();
    void stop();

    // Request handling without the transport, used by the /analyze route
    ApiResponse handle_analyze(const std::string& body) const;
    ApiResponse handle_health() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
