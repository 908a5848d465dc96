#pragma once

#include "allow_list_store.hpp"
#include "network.hpp"

#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/ip/address.hpp>

namespace relay_guard {

enum class RegistryStatus {
    Added,
    AlreadyPresent,
    Removed,
    NotFound,
    InvalidFormat
};

struct MutationOutcome {
    RegistryStatus status = RegistryStatus::InvalidFormat;
    // Set when the in-memory change succeeded but the store rejected the save.
    std::string save_error;

    bool saved() const { return save_error.empty(); }
};

// Mutable allow-list of networks shared by the forwarding path and the console.
//
// Every operation holds one mutex for its whole duration. Mutations write the
// full set through the store while still holding it. The in-memory change and
// the save are not atomic: if the process dies between them, or the save
// fails, the stored copy stays stale until the next successful mutation.
class AccessRegistry {
public:
    // Loads the initial set from `store`; invalid and duplicate entries are
    // reported on `log` and skipped.
    AccessRegistry(AllowListStore& store, std::ostream& log);

    AccessRegistry(const AccessRegistry&) = delete;
    AccessRegistry& operator=(const AccessRegistry&) = delete;

    bool check_allowed(const boost::asio::ip::address& addr) const;

    MutationOutcome add_network(std::string_view cidr);
    MutationOutcome remove_network(std::string_view cidr);

    // Snapshot in insertion order.
    std::vector<NetworkEntry> list_networks() const;

private:
    std::string persist_locked();

    AllowListStore& store_;
    mutable std::mutex mu_;
    std::vector<NetworkEntry> networks_;
};

const char* to_string(RegistryStatus status);

} // namespace relay_guard
