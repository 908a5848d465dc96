#include "access_registry.hpp"

#include <algorithm>
#include <exception>

namespace relay_guard {

AccessRegistry::AccessRegistry(AllowListStore& store, std::ostream& log)
    : store_(store) {
    const auto raw = store_.load(log);
    networks_.reserve(raw.size());
    for (const auto& item : raw) {
        auto entry = NetworkEntry::parse(item);
        if (!entry) {
            log << "[registry] skip invalid cidr '" << item << "'\n";
            continue;
        }
        if (std::find(networks_.begin(), networks_.end(), *entry) != networks_.end()) {
            log << "[registry] skip duplicate cidr '" << item << "'\n";
            continue;
        }
        networks_.push_back(std::move(*entry));
    }
}

bool AccessRegistry::check_allowed(const boost::asio::ip::address& addr) const {
    std::lock_guard<std::mutex> lk(mu_);
    return std::any_of(networks_.begin(), networks_.end(),
                       [&addr](const NetworkEntry& net) { return net.contains(addr); });
}

MutationOutcome AccessRegistry::add_network(std::string_view cidr) {
    auto entry = NetworkEntry::parse(cidr);
    if (!entry) return {RegistryStatus::InvalidFormat, {}};

    std::lock_guard<std::mutex> lk(mu_);
    if (std::find(networks_.begin(), networks_.end(), *entry) != networks_.end()) {
        return {RegistryStatus::AlreadyPresent, {}};
    }
    networks_.push_back(std::move(*entry));
    return {RegistryStatus::Added, persist_locked()};
}

MutationOutcome AccessRegistry::remove_network(std::string_view cidr) {
    auto entry = NetworkEntry::parse(cidr);
    if (!entry) return {RegistryStatus::InvalidFormat, {}};

    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find(networks_.begin(), networks_.end(), *entry);
    if (it == networks_.end()) {
        return {RegistryStatus::NotFound, {}};
    }
    networks_.erase(it);
    return {RegistryStatus::Removed, persist_locked()};
}

std::vector<NetworkEntry> AccessRegistry::list_networks() const {
    std::lock_guard<std::mutex> lk(mu_);
    return networks_;
}

std::string AccessRegistry::persist_locked() {
    std::vector<std::string> entries;
    entries.reserve(networks_.size());
    for (const auto& net : networks_) {
        entries.push_back(net.to_string());
    }
    try {
        store_.save(entries);
    } catch (const std::exception& ex) {
        const std::string reason = ex.what();
        return reason.empty() ? "save failed" : reason;
    }
    return {};
}

const char* to_string(RegistryStatus status) {
    switch (status) {
        case RegistryStatus::Added: return "added";
        case RegistryStatus::AlreadyPresent: return "already present";
        case RegistryStatus::Removed: return "removed";
        case RegistryStatus::NotFound: return "not found";
        case RegistryStatus::InvalidFormat: return "invalid format";
    }
    return "unknown";
}

} // namespace relay_guard
