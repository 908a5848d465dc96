#include "forwarder.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>

#include <iomanip>
#include <sstream>

namespace relay_guard {

const char* to_string(TerminationCause cause) {
    switch (cause) {
        case TerminationCause::Eof: return "eof";
        case TerminationCause::Reset: return "reset";
        case TerminationCause::Closed: return "closed";
        case TerminationCause::Error: return "error";
    }
    return "error";
}

TerminationCause classify_termination(const boost::system::error_code& ec) {
    namespace error = boost::asio::error;
    if (ec == error::eof) return TerminationCause::Eof;
    if (ec == error::connection_reset || ec == error::broken_pipe ||
        ec == error::connection_aborted) {
        return TerminationCause::Reset;
    }
    if (ec == error::operation_aborted || ec == error::bad_descriptor ||
        ec == error::not_connected) {
        return TerminationCause::Closed;
    }
    return TerminationCause::Error;
}

ConnectionForwarder::ConnectionForwarder(boost::asio::ip::tcp::socket client_socket,
                                         const AccessRegistry& registry,
                                         Backend backend,
                                         std::size_t buffer_size,
                                         EventLog& log,
                                         MetricsPtr metrics)
    : registry_(registry),
      backend_(std::move(backend)),
      log_(log),
      metrics_(std::move(metrics)),
      strand_(boost::asio::make_strand(client_socket.get_executor())),
      client_socket_(std::move(client_socket)),
      backend_socket_(client_socket_.get_executor()),
      resolver_(strand_) {
    boost::system::error_code ec;
    auto remote = client_socket_.remote_endpoint(ec);
    if (!ec) {
        remote_address_ = normalize_address(remote.address());
        remote_label_ = remote_address_.to_string() + ":" + std::to_string(remote.port());
    }

    upstream_.label = remote_label_ + " -> DEST";
    upstream_.from = &client_socket_;
    upstream_.to = &backend_socket_;
    upstream_.buffer.resize(buffer_size);
    downstream_.label = "DEST -> " + remote_label_;
    downstream_.from = &backend_socket_;
    downstream_.to = &client_socket_;
    downstream_.buffer.resize(buffer_size);

    if (metrics_) {
        upstream_.counter = &metrics_->bytes_upstream;
        downstream_.counter = &metrics_->bytes_downstream;
        metrics_->connection_attempts.fetch_add(1, std::memory_order_relaxed);
    }
}

void ConnectionForwarder::start() {
    if (remote_label_.empty()) {
        log_.write("Dropped connection: peer address unavailable");
        close_sockets();
        return;
    }
    log_.write("Connection attempt from " + remote_label_);

    if (!registry_.check_allowed(remote_address_)) {
        log_.write("Rejected: " + remote_address_.to_string() + " is not in the allowed list");
        if (metrics_) metrics_->rejected_connections.fetch_add(1, std::memory_order_relaxed);
        close_sockets();
        return;
    }

    resolve_and_connect();
}

void ConnectionForwarder::resolve_and_connect() {
    resolver_.async_resolve(
        backend_.host,
        std::to_string(backend_.port),
        boost::asio::bind_executor(strand_, [self = shared_from_this()](auto ec, auto endpoints) {
            self->on_resolve(ec, endpoints);
        }));
}

void ConnectionForwarder::on_resolve(const boost::system::error_code& ec,
                                     const tcp::resolver::results_type& endpoints) {
    if (ec) {
        on_connect(ec);
        return;
    }
    boost::asio::async_connect(
        backend_socket_,
        endpoints,
        boost::asio::bind_executor(strand_, [self = shared_from_this()](auto connect_ec, auto) {
            self->on_connect(connect_ec);
        }));
}

void ConnectionForwarder::on_connect(const boost::system::error_code& ec) {
    if (ec) {
        log_.write("Error connecting to destination: " + ec.message());
        if (metrics_) metrics_->dial_failures.fetch_add(1, std::memory_order_relaxed);
        close_sockets();
        return;
    }

    log_.write("Connection from " + remote_address_.to_string() + " accepted and forwarded");
    log_.write(remote_label_ + " connected -> " + backend_.host + ":" + std::to_string(backend_.port));
    start_pumps();
}

void ConnectionForwarder::start_pumps() {
    established_ = true;
    if (metrics_) {
        metrics_->forwarded_connections.fetch_add(1, std::memory_order_relaxed);
        metrics_->active_connections.fetch_add(1, std::memory_order_relaxed);
    }
    const auto now = Clock::now();
    upstream_.started = now;
    downstream_.started = now;
    do_read(upstream_);
    do_read(downstream_);
}

void ConnectionForwarder::do_read(Pump& pump) {
    pump.from->async_read_some(
        boost::asio::buffer(pump.buffer),
        boost::asio::bind_executor(strand_, [self = shared_from_this(), &pump](auto ec, auto len) {
            if (!ec) {
                self->do_write(pump, len);
            } else {
                self->finish_pump(pump, ec);
            }
        }));
}

void ConnectionForwarder::do_write(Pump& pump, std::size_t length) {
    boost::asio::async_write(
        *pump.to,
        boost::asio::buffer(pump.buffer.data(), length),
        boost::asio::bind_executor(strand_, [self = shared_from_this(), &pump, length](auto ec, auto) {
            if (!ec) {
                pump.bytes += length;
                if (pump.counter) pump.counter->fetch_add(length, std::memory_order_relaxed);
                self->do_read(pump);
            } else {
                self->finish_pump(pump, ec);
            }
        }));
}

void ConnectionForwarder::finish_pump(Pump& pump, const boost::system::error_code& ec) {
    if (pump.finished) return;
    pump.finished = true;

    const std::chrono::duration<double> elapsed = Clock::now() - pump.started;
    const auto cause = classify_termination(ec);
    std::ostringstream line;
    line << pump.label << " closed | Bytes: " << pump.bytes
         << " | Duration: " << std::fixed << std::setprecision(2) << elapsed.count() << "s"
         << " | Cause: " << to_string(cause);
    if (cause == TerminationCause::Error) {
        line << " (" << ec.message() << ")";
    }
    log_.write(line.str());
    if (metrics_) metrics_->finished_pumps.fetch_add(1, std::memory_order_relaxed);

    close_sockets();
}

void ConnectionForwarder::close_sockets() {
    if (closed_.exchange(true)) return;

    boost::system::error_code ignored;
    resolver_.cancel();
    if (client_socket_.is_open()) {
        client_socket_.shutdown(tcp::socket::shutdown_both, ignored);
        client_socket_.close(ignored);
    }
    if (backend_socket_.is_open()) {
        backend_socket_.shutdown(tcp::socket::shutdown_both, ignored);
        backend_socket_.close(ignored);
    }

    if (established_ && metrics_) {
        metrics_->active_connections.fetch_sub(1, std::memory_order_relaxed);
    }
}

} // namespace relay_guard
