#include "Metrics.h"
#include <sstream>

namespace observability {

static const std::vector<double>& latency_buckets() {
    static const std::vector<double> buckets = {1,2,5,10,20,50,100,200,500,1000,2000,5000};
    return buckets;
}

Metrics& Metrics::instance() {
    static Metrics m;
    return m;
}

Metrics::Metrics() {}

void Metrics::inc(const std::string& path, const std::string& method, int code) {
    MetricsKey k{path, method, code};
    std::lock_guard lock(mu_);
    ++map_[k];
}

void Metrics::observe_latency(const std::string& path, const std::string& method, double latency_ms) {
    const auto& buckets = latency_buckets();
    MetricsKey k{path, method, 0};
    std::lock_guard lock(mu_);
    auto it = hist_.find(k);
    if (it == hist_.end()) {
        HistData h;
        h.buckets.assign(buckets.size(), 0);
        it = hist_.emplace(k, std::move(h)).first;
    }
    auto& h = it->second;
    h.count += 1;
    h.sum += latency_ms;
    for (size_t i = 0; i < buckets.size(); ++i) { if (latency_ms <= buckets[i]) { h.buckets[i] += 1; } }
}

void Metrics::inc_mail(const std::string& kind, const std::string& outcome) {
    std::lock_guard lock(mu_);
    ++mail_[{kind, outcome}];
}

void Metrics::inc_booking(const std::string& outcome) {
    std::lock_guard lock(mu_);
    ++bookings_[outcome];
}

std::string Metrics::scrape() const {
    const auto& buckets = latency_buckets();
    std::ostringstream ss;
    std::lock_guard lock(mu_);
    ss << "# HELP http_requests_total Total HTTP requests\n";
    ss << "# TYPE http_requests_total counter\n";
    for (const auto& p : map_) {
        ss << "http_requests_total{path=\"" << p.first.path << "\",method=\"" << p.first.method << "\",code=\"" << p.first.code << "\"} " << p.second << "\n";
    }
    ss << "# HELP http_request_duration_ms Histogram of request durations\n";
    ss << "# TYPE http_request_duration_ms histogram\n";
    for (const auto& p : hist_) {
        const auto& k = p.first;
        const auto& h = p.second;
        for (size_t i = 0; i < buckets.size(); ++i) {
            ss << "http_request_duration_ms_bucket{path=\"" << k.path << "\",method=\"" << k.method << "\",le=\"" << buckets[i] << "\"} " << h.buckets[i] << "\n";
        }
        ss << "http_request_duration_ms_bucket{path=\"" << k.path << "\",method=\"" << k.method << "\",le=\"+Inf\"} " << h.count << "\n";
        ss << "http_request_duration_ms_sum{path=\"" << k.path << "\",method=\"" << k.method << "\"} " << h.sum << "\n";
        ss << "http_request_duration_ms_count{path=\"" << k.path << "\",method=\"" << k.method << "\"} " << h.count << "\n";
    }
    ss << "# HELP booking_emails_total Transactional emails by kind and outcome\n";
    ss << "# TYPE booking_emails_total counter\n";
    for (const auto& p : mail_) {
        ss << "booking_emails_total{kind=\"" << p.first.first << "\",outcome=\"" << p.first.second << "\"} " << p.second << "\n";
    }
    ss << "# HELP booking_requests_total Booking attempts by outcome\n";
    ss << "# TYPE booking_requests_total counter\n";
    for (const auto& p : bookings_) {
        ss << "booking_requests_total{outcome=\"" << p.first << "\"} " << p.second << "\n";
    }
    return ss.str();
}

}
