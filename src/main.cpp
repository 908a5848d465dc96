#include "access_registry.hpp"
#include "allow_list_store.hpp"
#include "config.hpp"
#include "console.hpp"
#include "event_log.hpp"
#include "listener.hpp"
#include "metrics.hpp"
#include "shutdown.hpp"

#include <boost/asio.hpp>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace relay_guard;

int main(int argc, char* argv[]) {
    try {
        std::string config_path;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [-c|--config path]\n";
                return 0;
            }
        }

        const auto config = load_config(config_path, std::cerr);
        EventLog log(config.log.directory, config.log.file, std::cout);
        JsonAllowListStore store(config.allow_list_path);
        AccessRegistry registry(store, std::cerr);
        ShutdownCoordinator shutdown;
        auto metrics = make_metrics();

        boost::asio::io_context io;
        Listener listener(io, config, registry, log, shutdown, metrics);
        listener.start();

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (ec) return;
            std::cout << "\nShutting down...\n";
            log.write("Stopped by Ctrl+C");
            shutdown.request("signal");
        });
        shutdown.on_shutdown([&](const std::string&) {
            boost::asio::post(io, [&]() {
                boost::system::error_code ignored;
                signals.cancel(ignored);
                io.stop();
            });
        });

        ControlConsole console(registry, shutdown, log, std::cout);
        std::thread console_thread([&console]() { console.run(std::cin); });

        const auto workers = std::max(2u, std::thread::hardware_concurrency());
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (unsigned int i = 0; i < workers; ++i) {
            threads.emplace_back([&io]() { io.run(); });
        }
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }

        log.write(render_summary(*metrics));
        log.write("Server stopped.");

        // A console still blocked on stdin cannot be interrupted portably. It
        // references everything above, so leave without unwinding.
        if (!console.finished()) {
            std::cout.flush();
            std::_Exit(0);
        }
        console_thread.join();
    } catch (const std::exception& ex) {
        std::cerr << "[fatal] " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
