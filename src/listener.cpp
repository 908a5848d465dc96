#include "listener.hpp"

#include "forwarder.hpp"

#include <boost/asio/ip/address.hpp>

#include <chrono>
#include <iostream>
#include <memory>

namespace relay_guard {

namespace {

// Delay before accepting again after an error such as EMFILE.
constexpr std::chrono::milliseconds kAcceptRetryDelay{100};

} // namespace

Listener::Listener(boost::asio::io_context& io,
                   const AppConfig& config,
                   const AccessRegistry& registry,
                   EventLog& log,
                   ShutdownCoordinator& shutdown,
                   MetricsPtr metrics)
    : io_(io),
      acceptor_(boost::asio::make_strand(io)),
      retry_timer_(acceptor_.get_executor()),
      config_(config),
      registry_(registry),
      log_(log),
      shutdown_(shutdown),
      metrics_(std::move(metrics)) {
    const tcp::endpoint endpoint(boost::asio::ip::make_address(config_.listener.address), config_.listener.port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(config_.backlog);
}

void Listener::start() {
    shutdown_.on_shutdown([this](const std::string&) {
        boost::asio::post(acceptor_.get_executor(), [this]() { close_acceptor(); });
    });
    log_.write("Proxy listening on " + std::to_string(bound_port()) + " -> " +
               config_.backend.host + ":" + std::to_string(config_.backend.port));
    do_accept();
}

unsigned short Listener::bound_port() const {
    boost::system::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? config_.listener.port : ep.port();
}

void Listener::do_accept() {
    if (shutdown_.requested()) {
        close_acceptor();
        return;
    }
    acceptor_.async_accept(io_, [this](auto ec, auto socket) -> void {
        if (!ec) {
            std::make_shared<ConnectionForwarder>(std::move(socket), registry_, config_.backend,
                                                  config_.buffer_size, log_, metrics_)
                ->start();
        } else if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
            return;
        } else {
            std::cerr << "[listener] Accept error: " << ec.message() << "\n";
            metrics_->accept_errors++;
            retry_accept();
            return;
        }
        do_accept();
    });
}

void Listener::retry_accept() {
    retry_timer_.expires_after(kAcceptRetryDelay);
    retry_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !acceptor_.is_open()) return;
        do_accept();
    });
}

void Listener::close_acceptor() {
    retry_timer_.cancel();
    if (!acceptor_.is_open()) return;
    boost::system::error_code ignored;
    acceptor_.close(ignored);
}

} // namespace relay_guard
