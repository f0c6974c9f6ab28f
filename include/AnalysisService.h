#pragma once

#include "AnalysisConfig.h"

#include <atomic>
#include <cstdint>
#include <string>

struct MonitoringSnapshot {
    uint64_t totalRequests = 0;
    uint64_t analyzeRequests = 0;
    uint64_t errorRequests = 0;
    uint64_t totalBatches = 0;
    double averageLatencyMs = 0.0;
};

class RequestMonitor {
public:
    void recordSuccess(const std::string& endpoint, double latencyMs, size_t batchCount);
    void recordError(const std::string& endpoint, double latencyMs);
    MonitoringSnapshot snapshot() const;

private:
    std::atomic<uint64_t> totalRequests{0};
    std::atomic<uint64_t> analyzeRequests{0};
    std::atomic<uint64_t> errorRequests{0};
    std::atomic<uint64_t> totalBatches{0};
    std::atomic<uint64_t> totalLatencyMicros{0};
};

/**
 * @brief Stateless HTTP front end: every POST /api/analyze runs its own pipeline over the request body.
 * @details Query parameters override `defaults` the same way command-line flags override a config file.
 */
class AnalysisService {
public:
    struct Config {
        std::string host = "127.0.0.1";
        int port = 8080;
        size_t threadCount = 4;
    };

    AnalysisService(AnalysisConfig defaults, RequestMonitor& monitor);
    int start(const Config& config);

private:
    AnalysisConfig defaults;
    RequestMonitor& monitor;
};
