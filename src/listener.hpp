#pragma once

#include "access_registry.hpp"
#include "config.hpp"
#include "event_log.hpp"
#include "metrics.hpp"
#include "shutdown.hpp"

#include <utility>

#include <boost/asio.hpp>

namespace relay_guard {

// Accepts on the public endpoint and hands every client to its own
// ConnectionForwarder. The pending accept is cancelled as soon as shutdown is
// requested; forwarders already started are left running.
//
// The listener must outlive the io_context's handlers and any shutdown request
// made through `shutdown`.
class Listener {
public:
    // Binds and listens; throws boost::system::system_error on failure.
    Listener(boost::asio::io_context& io,
             const AppConfig& config,
             const AccessRegistry& registry,
             EventLog& log,
             ShutdownCoordinator& shutdown,
             MetricsPtr metrics);

    void start();
    unsigned short bound_port() const;

private:
    using tcp = boost::asio::ip::tcp;

    void do_accept();
    void retry_accept();
    void close_acceptor();

    boost::asio::io_context& io_;
    tcp::acceptor acceptor_;
    boost::asio::steady_timer retry_timer_;
    AppConfig config_;
    const AccessRegistry& registry_;
    EventLog& log_;
    ShutdownCoordinator& shutdown_;
    MetricsPtr metrics_;
};

} // namespace relay_guard
