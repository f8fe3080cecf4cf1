#pragma once
#include "config.hpp"
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>

// HTTP liveness endpoint. /health serves the JSON produced by the report
// callback; a report whose "status" is not "ok" is served with 503.
class HealthChecker {
public:
    using ReportFn = std::function<nlohmann::json()>;

    HealthChecker(const Config& config, ReportFn report);
    ~HealthChecker();

    void start();
    void stop();
    bool is_running() const;

    // Non-copyable
    HealthChecker(const HealthChecker&) = delete;
    HealthChecker& operator=(const HealthChecker&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
