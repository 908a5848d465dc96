#include "metrics.hpp"

#include <sstream>

namespace relay_guard {

MetricsPtr make_metrics() {
    return std::make_shared<RelayMetrics>();
}

std::string render_summary(const RelayMetrics& metrics) {
    std::ostringstream os;
    os << "Connections: " << metrics.connection_attempts.load()
       << " | Forwarded: " << metrics.forwarded_connections.load()
       << " | Rejected: " << metrics.rejected_connections.load()
       << " | Dial failures: " << metrics.dial_failures.load()
       << " | Accept errors: " << metrics.accept_errors.load()
       << " | Active: " << metrics.active_connections.load()
       << " | Bytes up: " << metrics.bytes_upstream.load()
       << " | Bytes down: " << metrics.bytes_downstream.load();
    return os.str();
}

} // namespace relay_guard
