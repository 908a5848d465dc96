#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace relay_guard {

struct RelayMetrics {
    std::atomic<uint64_t> accept_errors{0};
    std::atomic<uint64_t> connection_attempts{0};
    std::atomic<uint64_t> rejected_connections{0};
    std::atomic<uint64_t> dial_failures{0};
    std::atomic<uint64_t> forwarded_connections{0};
    std::atomic<uint64_t> active_connections{0};
    std::atomic<uint64_t> finished_pumps{0};
    std::atomic<uint64_t> bytes_upstream{0};
    std::atomic<uint64_t> bytes_downstream{0};
};

using MetricsPtr = std::shared_ptr<RelayMetrics>;

MetricsPtr make_metrics();

// One-line summary for the shutdown log.
std::string render_summary(const RelayMetrics& metrics);

} // namespace relay_guard
