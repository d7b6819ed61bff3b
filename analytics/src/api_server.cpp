#include "api_server.hpp"
#include "snapshot.hpp"
#include "util.hpp"
#include <httplib.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <thread>

using json = nlohmann::json;

namespace {
    ApiResponse error_response(int status, const std::string& message) {
        json body = {{"error", message}};
        return ApiResponse{status, body.dump(2)};
    }
}

class ApiServer::Impl {
public:
    Impl(const Config& config, const MarketAnalyzer& analyzer)
        : config_(config), analyzer_(analyzer), running_(false) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            return;
        }

        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            ApiResponse reply = health();
            res.status = reply.status;
            res.set_content(reply.body, "application/json");
        });

        server_.Post("/analyze", [this](const httplib::Request& req, httplib::Response& res) {
            ApiResponse reply = analyze(req.body);
            res.status = reply.status;
            res.set_content(reply.body, "application/json");
        });

        if (!server_.bind_to_port(config_.listen_addr.c_str(), config_.listen_port)) {
            throw std::runtime_error(fmt::format("Cannot bind {}:{}", config_.listen_addr, config_.listen_port));
        }

        running_ = true;
        server_thread_ = std::thread([this]() {
            spdlog::info("API server listening on {}:{}", config_.listen_addr, config_.listen_port);
            server_.listen_after_bind();
        });
    }

    void stop() {
        if (running_) {
            running_ = false;
            server_.stop();
            if (server_thread_.joinable()) {
                server_thread_.join();
            }
            spdlog::info("API server stopped");
        }
    }

    ApiResponse health() const {
        json status;
        status["service"] = config_.service_name;
        status["status"] = "healthy";
        status["timestamp"] = util::current_iso8601();
        status["models"] = {
            {"trend", to_string(config_.trend_model)},
            {"anomaly", to_string(config_.anomaly_mode)},
            {"pressure", to_string(config_.pressure_model)}
        };
        return ApiResponse{200, status.dump(2)};
    }

    ApiResponse analyze(const std::string& body) const {
        try {
            AnalysisRequest request = parse_snapshot(json::parse(body), config_);
            AnalysisReport report = analyzer_.analyze(request);
            return ApiResponse{200, report.to_json().dump(2)};
        } catch (const json::parse_error& e) {
            spdlog::warn("Rejected /analyze request: {}", e.what());
            return error_response(400, std::string("Invalid JSON: ") + e.what());
        } catch (const InvalidInput& e) {
            spdlog::warn("Rejected /analyze request: {}", e.what());
            return error_response(400, e.what());
        } catch (const std::exception& e) {
            spdlog::error("Analysis failed: {}", e.what());
            return error_response(500, e.what());
        }
    }

private:
    const Config& config_;
    const MarketAnalyzer& analyzer_;
    httplib::Server server_;
    std::atomic<bool> running_;
    std::thread server_thread_;
};

ApiServer::ApiServer(const Config& config, const MarketAnalyzer& analyzer)
    : pImpl_(std::make_unique<Impl>(config, analyzer)) {}

ApiServer::~ApiServer() = default;

void ApiServer::start() {
    pImpl_->start();
}

void ApiServer::stop() {
    pImpl_->stop();
}

ApiResponse ApiServer::handle_analyze(const std::string& body) const {
    return pImpl_->analyze(body);
}

ApiResponse ApiServer::handle_health() const {
    return pImpl_->health();
}
