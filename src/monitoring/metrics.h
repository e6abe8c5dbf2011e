#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

class Metrics {
public:
    static Metrics& instance();

    void inc(const std::string& name, int value = 1);
    int64_t value(const std::string& name) const;

    std::string renderPrometheus() const;

private:
    Metrics() = default;
    mutable std::mutex mutex_;
    // ordered so the rendering is stable
    std::map<std::string, int64_t> counters_;
};
