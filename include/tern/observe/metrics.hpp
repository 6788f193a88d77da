#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tern::observe {

/// One finished attempt, as seen by the metrics stage
struct attempt_record {
    std::string method;
    std::string host;
    /// "2xx".."5xx" for responses, the error kind name otherwise
    std::string outcome;
    std::chrono::microseconds latency{0};
    uint64_t request_bytes = 0;
    uint32_t attempt = 1;
};

/// Where the metrics stage reports. Called from engine threads.
class metrics_sink {
public:
    virtual ~metrics_sink() = default;

    virtual void record_attempt(const attempt_record& rec) = 0;

    /// Response body bytes as the consumer pulls them
    virtual void record_response_bytes(std::string_view host, uint64_t bytes) = 0;
};

/// Default in-process sink: counters and latency histograms with a
/// Prometheus text exposition.
class metrics_registry : public metrics_sink {
public:
    /// Upper bounds in seconds
    static constexpr std::array<double, 12> latency_buckets = {
        0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0, 30.0
    };

    void record_attempt(const attempt_record& rec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[series("tern_attempts_total", {{"method", rec.method}, {"outcome", rec.outcome}})] += 1;
        if (rec.attempt > 1) {
            counters_[series("tern_retries_total", {{"host", rec.host}})] += 1;
        }
        counters_[series("tern_request_bytes_total", {{"host", rec.host}})] += rec.request_bytes;

        auto& h = histograms_[series("tern_attempt_duration_seconds", {{"method", rec.method}})];
        double seconds = std::chrono::duration<double>(rec.latency).count();
        for (size_t i = 0; i < latency_buckets.size(); ++i) {
            if (seconds <= latency_buckets[i]) {
                ++h.buckets[i];
            }
        }
        ++h.count;
        h.sum += seconds;
    }

    void record_response_bytes(std::string_view host, uint64_t bytes) override {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[series("tern_response_bytes_total", {{"host", std::string(host)}})] += bytes;
    }

    /// Current value of a counter series, 0 if never touched
    uint64_t counter(std::string_view name,
                     std::vector<std::pair<std::string, std::string>> labels = {}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(series(name, std::move(labels)));
        return it == counters_.end() ? 0 : it->second;
    }

    /// Number of observations of a histogram series
    uint64_t observations(std::string_view name,
                          std::vector<std::pair<std::string, std::string>> labels = {}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = histograms_.find(series(name, std::move(labels)));
        return it == histograms_.end() ? 0 : it->second.count;
    }

    /// Prometheus text format, version 0.0.4
    std::string render() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string out;
        std::string_view last_family;
        for (const auto& [key, value] : counters_) {
            if (key.name != last_family) {
                fmt::format_to(std::back_inserter(out), "# TYPE {} counter\n", key.name);
                last_family = key.name;
            }
            fmt::format_to(std::back_inserter(out), "{}{} {}\n", key.name, format_labels(key.labels), value);
        }
        last_family = {};
        for (const auto& [key, h] : histograms_) {
            if (key.name != last_family) {
                fmt::format_to(std::back_inserter(out), "# TYPE {} histogram\n", key.name);
                last_family = key.name;
            }
            for (size_t i = 0; i < latency_buckets.size(); ++i) {
                auto labels = key.labels;
                labels.emplace_back("le", fmt::format("{}", latency_buckets[i]));
                fmt::format_to(std::back_inserter(out), "{}_bucket{} {}\n", key.name, format_labels(labels), h.buckets[i]);
            }
            auto labels = key.labels;
            labels.emplace_back("le", "+Inf");
            fmt::format_to(std::back_inserter(out), "{}_bucket{} {}\n", key.name, format_labels(labels), h.count);
            fmt::format_to(std::back_inserter(out), "{}_sum{} {}\n", key.name, format_labels(key.labels), h.sum);
            fmt::format_to(std::back_inserter(out), "{}_count{} {}\n", key.name, format_labels(key.labels), h.count);
        }
        return out;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        histograms_.clear();
    }

private:
    struct series_key {
        std::string name;
        std::vector<std::pair<std::string, std::string>> labels;   ///< sorted by label name

        auto operator<=>(const series_key&) const = default;
    };

    struct histogram {
        std::array<uint64_t, latency_buckets.size()> buckets{};
        uint64_t count = 0;
        double sum = 0.0;
    };

    static series_key series(std::string_view name, std::vector<std::pair<std::string, std::string>> labels) {
        std::sort(labels.begin(), labels.end());
        return series_key{std::string(name), std::move(labels)};
    }

    static std::string escape(std::string_view value) {
        std::string out;
        out.reserve(value.size());
        for (char c : value) {
            switch (c) {
                case '\\': out += "\\\\"; break;
                case '"':  out += "\\\""; break;
                case '\n': out += "\\n"; break;
                default:   out += c;
            }
        }
        return out;
    }

    static std::string format_labels(const std::vector<std::pair<std::string, std::string>>& labels) {
        if (labels.empty()) return {};
        std::string out = "{";
        bool first = true;
        for (const auto& [k, v] : labels) {
            if (!first) out += ',';
            fmt::format_to(std::back_inserter(out), "{}=\"{}\"", k, escape(v));
            first = false;
        }
        out += '}';
        return out;
    }

    mutable std::mutex mutex_;
    std::map<series_key, uint64_t> counters_;
    std::map<series_key, histogram> histograms_;
};

} // namespace tern::observe
