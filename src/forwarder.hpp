#pragma once

#include "access_registry.hpp"
#include "config.hpp"
#include "event_log.hpp"
#include "metrics.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio.hpp>

namespace relay_guard {

enum class TerminationCause {
    Eof,
    Reset,
    Closed,
    Error
};

const char* to_string(TerminationCause cause);
TerminationCause classify_termination(const boost::system::error_code& ec);

// Handles one accepted client: allow-list check, backend dial, then two
// independent byte pumps. When either pump stops, both sockets are closed.
class ConnectionForwarder : public std::enable_shared_from_this<ConnectionForwarder> {
public:
    ConnectionForwarder(boost::asio::ip::tcp::socket client_socket,
                        const AccessRegistry& registry,
                        Backend backend,
                        std::size_t buffer_size,
                        EventLog& log,
                        MetricsPtr metrics);

    void start();

private:
    using tcp = boost::asio::ip::tcp;
    using Strand = boost::asio::strand<boost::asio::any_io_executor>;
    using Clock = std::chrono::steady_clock;

    struct Pump {
        std::string label;
        tcp::socket* from = nullptr;
        tcp::socket* to = nullptr;
        std::vector<char> buffer;
        std::atomic<uint64_t>* counter = nullptr;
        uint64_t bytes = 0;
        Clock::time_point started;
        bool finished = false;
    };

    void resolve_and_connect();
    void on_resolve(const boost::system::error_code& ec, const tcp::resolver::results_type& endpoints);
    void on_connect(const boost::system::error_code& ec);
    void start_pumps();

    void do_read(Pump& pump);
    void do_write(Pump& pump, std::size_t length);
    void finish_pump(Pump& pump, const boost::system::error_code& ec);
    void close_sockets();

    const AccessRegistry& registry_;
    Backend backend_;
    EventLog& log_;
    MetricsPtr metrics_;
    Strand strand_;

    tcp::socket client_socket_;
    tcp::socket backend_socket_;
    tcp::resolver resolver_;

    boost::asio::ip::address remote_address_;
    std::string remote_label_;
    Pump upstream_;
    Pump downstream_;
    bool established_ = false;
    std::atomic<bool> closed_{false};
};

} // namespace relay_guard
