#include "AnalysisService.h"

#include "AnalysisJson.h"
#include "FeedMixExceptions.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

#include <httplib.h>

namespace {
using Clock = std::chrono::steady_clock;

void setJsonResponse(httplib::Response& response, int status, const std::string& payload) {
    response.status = status;
    response.set_content(payload, "application/json");
}

long long toLatencyMicros(double latencyMs) {
    if (!std::isfinite(latencyMs) || latencyMs <= 0.0) return 0;
    return static_cast<long long>(std::llround(latencyMs * 1000.0));
}

double elapsedMs(Clock::time_point started) {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

void logMonitoringLine(const std::string& endpoint, double latencyMs, const MonitoringSnapshot& snapshot) {
    std::ostringstream line;
    line << "[FeedMixService][Monitor] endpoint=" << endpoint
         << " total_requests=" << snapshot.totalRequests
         << " errors=" << snapshot.errorRequests
         << " latency_ms=" << latencyMs
         << " avg_latency_ms=" << snapshot.averageLatencyMs
         << " batches=" << snapshot.totalBatches;
    std::cout << line.str() << "\n";
}
} // namespace

void RequestMonitor::recordSuccess(const std::string& endpoint, double latencyMs, size_t batchCount) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    if (endpoint == "/api/analyze") {
        analyzeRequests.fetch_add(1, std::memory_order_relaxed);
    }
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(std::max<long long>(0, toLatencyMicros(latencyMs))),
                                 std::memory_order_relaxed);
    totalBatches.fetch_add(static_cast<uint64_t>(batchCount), std::memory_order_relaxed);
}

void RequestMonitor::recordError(const std::string& endpoint, double latencyMs) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    errorRequests.fetch_add(1, std::memory_order_relaxed);
    if (endpoint == "/api/analyze") {
        analyzeRequests.fetch_add(1, std::memory_order_relaxed);
    }
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(std::max<long long>(0, toLatencyMicros(latencyMs))),
                                 std::memory_order_relaxed);
}

MonitoringSnapshot RequestMonitor::snapshot() const {
    MonitoringSnapshot out;
    out.totalRequests = totalRequests.load(std::memory_order_relaxed);
    out.analyzeRequests = analyzeRequests.load(std::memory_order_relaxed);
    out.errorRequests = errorRequests.load(std::memory_order_relaxed);
    out.totalBatches = totalBatches.load(std::memory_order_relaxed);

    const uint64_t latencyMicros = totalLatencyMicros.load(std::memory_order_relaxed);
    if (out.totalRequests > 0) {
        out.averageLatencyMs = static_cast<double>(latencyMicros) / static_cast<double>(out.totalRequests) / 1000.0;
    }
    return out;
}

AnalysisService::AnalysisService(AnalysisConfig defaultsValue, RequestMonitor& monitorRef)
    : defaults(std::move(defaultsValue)), monitor(monitorRef) {}

int AnalysisService::start(const Config& config) {
    httplib::Server server;
    server.new_task_queue = [threadCount = std::max<size_t>(1, config.threadCount)] {
        return new httplib::ThreadPool(static_cast<int>(threadCount));
    };

    server.Get("/health", [this](const httplib::Request&, httplib::Response& response) {
        const MonitoringSnapshot snapshot = monitor.snapshot();
        std::ostringstream out;
        out << "{\"status\":\"ok\","
            << "\"total_requests\":" << snapshot.totalRequests << ","
            << "\"errors\":" << snapshot.errorRequests << ","
            << "\"avg_latency_ms\":" << AnalysisJson::formatDouble(snapshot.averageLatencyMs)
            << "}";
        setJsonResponse(response, 200, out.str());
    });

    server.Post("/api/analyze", [this](const httplib::Request& request, httplib::Response& response) {
        const auto started = Clock::now();
        try {
            if (request.body.empty()) {
                throw FeedMix::DatasetException("Request body must contain the CSV dataset");
            }

            AnalysisConfig runConfig = defaults;
            runConfig.datasetPath = "(request body)";
            std::vector<std::pair<std::string, std::string>> overrides(request.params.begin(), request.params.end());
            AnalysisConfig::applyOverrides(runConfig, overrides);
            runConfig.validate();

            const AnalysisResult result = AnalysisJson::analyzeCsvText(request.body, runConfig);

            const double latencyMs = elapsedMs(started);
            monitor.recordSuccess("/api/analyze", latencyMs, result.aggregates.size());
            setJsonResponse(response, 200, AnalysisJson::resultToJson(result, runConfig.request));
            logMonitoringLine("/api/analyze", latencyMs, monitor.snapshot());
        } catch (const FeedMix::FeedMixException& e) {
            const double latencyMs = elapsedMs(started);
            monitor.recordError("/api/analyze", latencyMs);
            const int status = dynamic_cast<const FeedMix::MissingColumnException*>(&e) ? 422 : 400;
            setJsonResponse(response, status, AnalysisJson::errorToJson(e.what(), latencyMs));
            logMonitoringLine("/api/analyze", latencyMs, monitor.snapshot());
        } catch (const std::exception& e) {
            const double latencyMs = elapsedMs(started);
            monitor.recordError("/api/analyze", latencyMs);
            setJsonResponse(response, 500, AnalysisJson::errorToJson(e.what(), latencyMs));
            std::cerr << "[FeedMixService][Error] " << e.what() << "\n";
        }
    });

    std::cout << "[FeedMixService] host=" << config.host
              << " port=" << config.port
              << " threads=" << std::max<size_t>(1, config.threadCount)
              << " tolerance=" << defaults.request.toleranceThreshold
              << "\n";

    if (!server.listen(config.host.c_str(), config.port)) {
        std::cerr << "[FeedMixService] failed_to_bind host=" << config.host << " port=" << config.port << "\n";
        return 1;
    }

    return 0;
}
