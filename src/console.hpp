#pragma once

#include "access_registry.hpp"
#include "event_log.hpp"
#include "shutdown.hpp"

#include <atomic>
#include <istream>
#include <ostream>
#include <string>

namespace relay_guard {

// Line-oriented operator console: add <cidr>, remove <cidr>, list,
// exit|quit|stop. Replies go to `out`; successful mutations and stops are
// also written to the event log.
class ControlConsole {
public:
    ControlConsole(AccessRegistry& registry,
                   ShutdownCoordinator& shutdown,
                   EventLog& log,
                   std::ostream& out);

    // Handles one command line. Returns false once the console should stop.
    bool execute(const std::string& line);

    // Blocking read loop. End of input requests shutdown.
    void run(std::istream& in);

    // True once the console has stopped reading input, set before it asks for
    // shutdown so the owner can tell a console stop from an outside one.
    bool finished() const { return finished_.load(); }

private:
    void handle_add(const std::string& cidr);
    void handle_remove(const std::string& cidr);
    void handle_list();
    void report_save_error(const MutationOutcome& outcome);

    AccessRegistry& registry_;
    ShutdownCoordinator& shutdown_;
    EventLog& log_;
    std::ostream& out_;
    std::atomic<bool> finished_{false};
};

} // namespace relay_guard
