#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace observability {

// Cumulative millisecond histogram over a fixed set of upper bounds.
struct Histogram {
    std::vector<uint64_t> buckets;
    double sum = 0.0;
    uint64_t count = 0;

    void observe(double ms);
    static const std::vector<double>& bounds();
};

// Process-wide registry rendered as Prometheus text. Series are emitted in key order.
class Metrics {
public:
    static Metrics& instance();

    void inc(const std::string& path, const std::string& method, int code);
    void observe_latency(const std::string& path, const std::string& method, double latency_ms);

    // Wall time of one external directory call, by action name.
    void observe_action(const std::string& action, double latency_ms);

    void count_event(const std::string& event, const std::string& outcome);
    uint64_t event_count(const std::string& event, const std::string& outcome) const;

    void set_gauge(const std::string& name, double value);
    double gauge(const std::string& name) const;

    std::string scrape() const;

private:
    Metrics() = default;

    mutable std::mutex mu_;
    std::map<std::tuple<std::string, std::string, int>, uint64_t> requests_;
    std::map<std::pair<std::string, std::string>, Histogram> request_latency_;
    std::map<std::string, Histogram> action_latency_;
    std::map<std::pair<std::string, std::string>, uint64_t> events_;
    std::map<std::string, double> gauges_;
};

// Escapes \, " and newlines for use inside a label value.
std::string escape_label(const std::string& v);

}
