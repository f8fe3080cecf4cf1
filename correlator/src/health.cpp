#include "health.hpp"
#include <spdlog/spdlog.h>
#include <httplib.h>
#include <thread>
#include <atomic>

class HealthChecker::Impl {
public:
    Impl(const Config& config, ReportFn report)
        : host_(config.health_host), port_(config.health_port), report_(std::move(report)) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            spdlog::warn("Health checker already running");
            return;
        }

        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json report;
            try {
                report = report_();
            } catch (const std::exception& e) {
                report = {{"status", "error"}, {"error", e.what()}};
            }
            res.status = report.value("status", "error") == "ok" ? 200 : 503;
            res.set_content(report.dump(), "application/json");
        });

        server_.Get("/ready", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"status":"ready","service":"correlator"})", "application/json");
        });

        running_ = true;
        health_thread_ = std::thread([this]() {
            spdlog::info("Health server listening on {}:{}", host_, port_);
            if (!server_.listen(host_.c_str(), port_)) {
                spdlog::error("Failed to start health server on {}:{}", host_, port_);
            }
        });
    }

    void stop() {
        if (!running_) return;

        running_ = false;
        server_.stop();
        if (health_thread_.joinable()) {
            health_thread_.join();
        }

        spdlog::info("Health checker stopped");
    }

    bool is_running() const {
        return running_;
    }

private:
    std::string host_;
    int port_;
    ReportFn report_;
    httplib::Server server_;
    std::atomic<bool> running_{false};
    std::thread health_thread_;
};

HealthChecker::HealthChecker(const Config& config, ReportFn report)
    : pImpl_(std::make_unique<Impl>(config, std::move(report))) {}

HealthChecker::~HealthChecker() = default;

void HealthChecker::start() {
    pImpl_->start();
}

void HealthChecker::stop() {
    pImpl_->stop();
}

bool HealthChecker::is_running() const {
    return pImpl_->is_running();
}
