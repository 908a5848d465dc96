#include "console.hpp"

namespace relay_guard {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool starts_with_word(const std::string& line, const std::string& word) {
    return line.size() > word.size() && line.compare(0, word.size(), word) == 0 &&
           (line[word.size()] == ' ' || line[word.size()] == '\t');
}

constexpr const char* kUsage = "Available commands: add [ip or cidr], remove [ip or cidr], list, stop";

} // namespace

ControlConsole::ControlConsole(AccessRegistry& registry,
                               ShutdownCoordinator& shutdown,
                               EventLog& log,
                               std::ostream& out)
    : registry_(registry), shutdown_(shutdown), log_(log), out_(out) {}

bool ControlConsole::execute(const std::string& raw) {
    const auto line = trim(raw);
    if (starts_with_word(line, "add")) {
        handle_add(trim(line.substr(3)));
    } else if (starts_with_word(line, "remove")) {
        handle_remove(trim(line.substr(6)));
    } else if (line == "list") {
        handle_list();
    } else if (line == "exit" || line == "quit" || line == "stop") {
        log_.write("Stopping server via command");
        finished_.store(true);
        shutdown_.request("console command");
        return false;
    } else {
        out_ << kUsage << "\n";
    }
    out_.flush();
    return true;
}

void ControlConsole::run(std::istream& in) {
    std::string line;
    while (!shutdown_.requested()) {
        out_ << "> " << std::flush;
        if (!std::getline(in, line)) {
            finished_.store(true);
            shutdown_.request("console input closed");
            break;
        }
        if (!execute(line)) break;
    }
    finished_.store(true);
}

void ControlConsole::handle_add(const std::string& cidr) {
    const auto outcome = registry_.add_network(cidr);
    switch (outcome.status) {
        case RegistryStatus::InvalidFormat:
            out_ << "Invalid IP or network format: " << cidr << "\n";
            break;
        case RegistryStatus::AlreadyPresent:
            out_ << cidr << " is already in the allowed list\n";
            break;
        case RegistryStatus::Added:
            log_.write(cidr + " added to allowed list");
            out_ << cidr << " added\n";
            report_save_error(outcome);
            break;
        case RegistryStatus::Removed:
        case RegistryStatus::NotFound:
            break;
    }
}

void ControlConsole::handle_remove(const std::string& cidr) {
    const auto outcome = registry_.remove_network(cidr);
    switch (outcome.status) {
        case RegistryStatus::InvalidFormat:
            out_ << "Invalid IP or network format: " << cidr << "\n";
            break;
        case RegistryStatus::NotFound:
            out_ << cidr << " not found in allowed list\n";
            break;
        case RegistryStatus::Removed:
            log_.write(cidr + " removed from allowed list");
            out_ << cidr << " removed\n";
            report_save_error(outcome);
            break;
        case RegistryStatus::Added:
        case RegistryStatus::AlreadyPresent:
            break;
    }
}

void ControlConsole::handle_list() {
    out_ << "Allowed IPs / Networks:\n";
    for (const auto& net : registry_.list_networks()) {
        out_ << " - " << net.to_string() << "\n";
    }
}

void ControlConsole::report_save_error(const MutationOutcome& outcome) {
    if (outcome.saved()) return;
    out_ << "Warning: failed to save allowed list: " << outcome.save_error << "\n";
    log_.write("Failed to save allowed list: " + outcome.save_error);
}

} // namespace relay_guard
