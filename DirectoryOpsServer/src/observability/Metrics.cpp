#include "Metrics.h"

#include <sstream>

namespace observability {

const std::vector<double>& Histogram::bounds() {
    static const std::vector<double> b = {1, 2, 5, 10, 20, 50, 100, 200, 500, 1000, 2000, 5000, 15000, 60000};
    return b;
}

void Histogram::observe(double ms) {
    const auto& b = bounds();
    if (buckets.size() != b.size()) buckets.assign(b.size(), 0);
    for (size_t i = 0; i < b.size(); ++i) {
        if (ms <= b[i]) buckets[i] += 1;
    }
    sum += ms;
    count += 1;
}

std::string escape_label(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        if (c == '\\') out += "\\\\";
        else if (c == '"') out += "\\\"";
        else if (c == '\n') out += "\\n";
        else out.push_back(c);
    }
    return out;
}

Metrics& Metrics::instance() {
    static Metrics m;
    return m;
}

void Metrics::inc(const std::string& path, const std::string& method, int code) {
    std::lock_guard lock(mu_);
    requests_[std::make_tuple(path, method, code)] += 1;
}

void Metrics::observe_latency(const std::string& path, const std::string& method, double latency_ms) {
    std::lock_guard lock(mu_);
    request_latency_[{path, method}].observe(latency_ms);
}

void Metrics::observe_action(const std::string& action, double latency_ms) {
    std::lock_guard lock(mu_);
    action_latency_[action].observe(latency_ms);
}

void Metrics::count_event(const std::string& event, const std::string& outcome) {
    std::lock_guard lock(mu_);
    events_[{event, outcome}] += 1;
}

uint64_t Metrics::event_count(const std::string& event, const std::string& outcome) const {
    std::lock_guard lock(mu_);
    auto it = events_.find({event, outcome});
    return it == events_.end() ? 0 : it->second;
}

void Metrics::set_gauge(const std::string& name, double value) {
    std::lock_guard lock(mu_);
    gauges_[name] = value;
}

double Metrics::gauge(const std::string& name) const {
    std::lock_guard lock(mu_);
    auto it = gauges_.find(name);
    return it == gauges_.end() ? 0.0 : it->second;
}

namespace {

void write_histogram(std::ostringstream& ss, const std::string& name, const std::string& labels, const Histogram& h) {
    const auto& b = Histogram::bounds();
    for (size_t i = 0; i < b.size() && i < h.buckets.size(); ++i) {
        ss << name << "_bucket{" << labels << ",le=\"" << b[i] << "\"} " << h.buckets[i] << "\n";
    }
    ss << name << "_bucket{" << labels << ",le=\"+Inf\"} " << h.count << "\n";
    ss << name << "_sum{" << labels << "} " << h.sum << "\n";
    ss << name << "_count{" << labels << "} " << h.count << "\n";
}

}

std::string Metrics::scrape() const {
    std::ostringstream ss;
    std::lock_guard lock(mu_);

    ss << "# HELP http_requests_total Total HTTP requests\n";
    ss << "# TYPE http_requests_total counter\n";
    for (const auto& p : requests_) {
        ss << "http_requests_total{path=\"" << escape_label(std::get<0>(p.first)) << "\",method=\""
           << std::get<1>(p.first) << "\",code=\"" << std::get<2>(p.first) << "\"} " << p.second << "\n";
    }

    ss << "# HELP http_request_duration_ms Histogram of request durations\n";
    ss << "# TYPE http_request_duration_ms histogram\n";
    for (const auto& p : request_latency_) {
        write_histogram(ss, "http_request_duration_ms",
                        "path=\"" + escape_label(p.first.first) + "\",method=\"" + p.first.second + "\"", p.second);
    }

    ss << "# HELP ops_action_duration_ms Histogram of external directory call durations\n";
    ss << "# TYPE ops_action_duration_ms histogram\n";
    for (const auto& p : action_latency_) {
        write_histogram(ss, "ops_action_duration_ms", "action=\"" + escape_label(p.first) + "\"", p.second);
    }

    ss << "# HELP ops_events_total Scheduler, recovery, resolver, session and audit events\n";
    ss << "# TYPE ops_events_total counter\n";
    for (const auto& p : events_) {
        ss << "ops_events_total{event=\"" << escape_label(p.first.first) << "\",outcome=\""
           << escape_label(p.first.second) << "\"} " << p.second << "\n";
    }

    for (const auto& g : gauges_) {
        ss << "# TYPE " << g.first << " gauge\n";
        ss << g.first << " " << g.second << "\n";
    }
    return ss.str();
}

}
