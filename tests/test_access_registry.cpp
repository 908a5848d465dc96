#include "access_registry.hpp"
#include "test_common.hpp"
#include "test_support.hpp"

#include <boost/asio/ip/address.hpp>

#include <atomic>
#include <set>
#include <sstream>
#include <thread>
#include <vector>

using namespace relay_guard;
using boost::asio::ip::make_address;
using test_support::MemoryStore;

int main() {
    auto test_add_remove_list = [] {
        MemoryStore store;
        std::stringstream log;
        AccessRegistry registry(store, log);
        EXPECT_TRUE(registry.list_networks().empty());
        EXPECT_FALSE(registry.check_allowed(make_address("10.0.0.5")));

        auto added = registry.add_network("10.0.0.9/24");
        EXPECT_EQ(added.status, RegistryStatus::Added);
        EXPECT_TRUE(added.saved());
        EXPECT_EQ(store.saves(), 1);
        EXPECT_EQ(store.saved(), std::vector<std::string>{"10.0.0.0/24"});

        EXPECT_EQ(registry.add_network("10.0.0.0/24").status, RegistryStatus::AlreadyPresent);
        EXPECT_EQ(registry.add_network("10.0.0.200/255.255.255.0").status, RegistryStatus::AlreadyPresent);
        EXPECT_EQ(store.saves(), 1);

        EXPECT_EQ(registry.add_network("192.168.1.7").status, RegistryStatus::Added);
        EXPECT_EQ(registry.add_network("2001:db8::/48").status, RegistryStatus::Added);
        auto listed = registry.list_networks();
        EXPECT_EQ(listed.size(), 3u);
        EXPECT_EQ(listed[0].to_string(), std::string("10.0.0.0/24"));
        EXPECT_EQ(listed[1].to_string(), std::string("192.168.1.7/32"));
        EXPECT_EQ(listed[2].to_string(), std::string("2001:db8::/48"));

        EXPECT_EQ(registry.remove_network("10.0.0.0/25").status, RegistryStatus::NotFound);
        EXPECT_EQ(registry.remove_network("not-a-network").status, RegistryStatus::InvalidFormat);
        EXPECT_EQ(registry.remove_network("192.168.1.7/32").status, RegistryStatus::Removed);
        EXPECT_EQ(store.saved(), (std::vector<std::string>{"10.0.0.0/24", "2001:db8::/48"}));
        EXPECT_EQ(store.saves(), 4);
    };

    auto test_invalid_does_not_mutate = [] {
        MemoryStore store;
        std::stringstream log;
        AccessRegistry registry(store, log);
        EXPECT_EQ(registry.add_network("10.0.0.0/40").status, RegistryStatus::InvalidFormat);
        EXPECT_EQ(registry.add_network("").status, RegistryStatus::InvalidFormat);
        EXPECT_TRUE(registry.list_networks().empty());
        EXPECT_EQ(store.saves(), 0);
    };

    auto test_check_allowed = [] {
        MemoryStore store({"10.0.0.0/24", "2001:db8::/32"});
        std::stringstream log;
        AccessRegistry registry(store, log);
        EXPECT_TRUE(registry.check_allowed(make_address("10.0.0.5")));
        EXPECT_TRUE(registry.check_allowed(make_address("::ffff:10.0.0.5")));
        EXPECT_TRUE(registry.check_allowed(make_address("2001:db8::42")));
        EXPECT_FALSE(registry.check_allowed(make_address("192.168.1.1")));
        EXPECT_FALSE(registry.check_allowed(make_address("10.0.1.5")));

        EXPECT_EQ(registry.remove_network("10.0.0.0/24").status, RegistryStatus::Removed);
        EXPECT_FALSE(registry.check_allowed(make_address("10.0.0.5")));
    };

    auto test_order_independent_membership = [] {
        MemoryStore forward({"10.0.0.0/8", "10.1.0.0/16", "192.168.0.0/16"});
        MemoryStore reverse({"192.168.0.0/16", "10.1.0.0/16", "10.0.0.0/8"});
        std::stringstream log;
        AccessRegistry a(forward, log);
        AccessRegistry b(reverse, log);
        for (const char* ip : {"10.1.2.3", "10.200.0.1", "192.168.5.5", "172.16.0.1", "11.0.0.1"}) {
            EXPECT_EQ(a.check_allowed(make_address(ip)), b.check_allowed(make_address(ip)));
        }
    };

    auto test_load_skips_bad_entries = [] {
        MemoryStore store({"10.0.0.0/24", "bogus", "10.0.0.3/24", " 192.168.1.1 "});
        std::stringstream log;
        AccessRegistry registry(store, log);
        auto listed = registry.list_networks();
        EXPECT_EQ(listed.size(), 1u);
        EXPECT_EQ(listed[0].to_string(), std::string("10.0.0.0/24"));
        EXPECT_CONTAINS(log.str(), "skip invalid cidr 'bogus'");
        EXPECT_CONTAINS(log.str(), "skip duplicate cidr '10.0.0.3/24'");
    };

    auto test_save_failure_reported = [] {
        MemoryStore store;
        std::stringstream log;
        AccessRegistry registry(store, log);
        store.set_failing(true);
        auto outcome = registry.add_network("10.0.0.0/24");
        EXPECT_EQ(outcome.status, RegistryStatus::Added);
        EXPECT_FALSE(outcome.saved());
        EXPECT_EQ(outcome.save_error, std::string("disk full"));
        EXPECT_TRUE(registry.check_allowed(make_address("10.0.0.1")));

        store.set_failing(false);
        EXPECT_TRUE(registry.add_network("10.0.1.0/24").saved());
        EXPECT_EQ(store.saved(), (std::vector<std::string>{"10.0.0.0/24", "10.0.1.0/24"}));
    };

    auto test_concurrent_mutations = [] {
        MemoryStore store;
        std::stringstream log;
        AccessRegistry registry(store, log);
        std::atomic<bool> stop{false};
        std::atomic<int> added{0};

        // Readers hammer check_allowed while writers race on the same networks.
        std::vector<std::thread> readers;
        for (int r = 0; r < 2; ++r) {
            readers.emplace_back([&]() {
                while (!stop.load()) {
                    (void)registry.check_allowed(make_address("10.0.3.1"));
                }
            });
        }
        std::vector<std::thread> writers;
        for (int w = 0; w < 4; ++w) {
            writers.emplace_back([&]() {
                for (int i = 0; i < 50; ++i) {
                    const auto cidr = "10.0." + std::to_string(i) + ".0/24";
                    if (registry.add_network(cidr).status == RegistryStatus::Added) ++added;
                }
            });
        }
        for (auto& t : writers) t.join();
        stop = true;
        for (auto& t : readers) t.join();

        EXPECT_EQ(added.load(), 50);
        auto listed = registry.list_networks();
        EXPECT_EQ(listed.size(), 50u);
        std::set<std::string> unique;
        for (const auto& n : listed) unique.insert(n.to_string());
        EXPECT_EQ(unique.size(), 50u);
        EXPECT_EQ(store.saved().size(), 50u);

        std::vector<std::thread> removers;
        std::atomic<int> removed{0};
        for (int w = 0; w < 4; ++w) {
            removers.emplace_back([&]() {
                for (int i = 0; i < 50; i += 2) {
                    const auto cidr = "10.0." + std::to_string(i) + ".0/24";
                    if (registry.remove_network(cidr).status == RegistryStatus::Removed) ++removed;
                }
            });
        }
        for (auto& t : removers) t.join();
        EXPECT_EQ(removed.load(), 25);
        EXPECT_EQ(registry.list_networks().size(), 25u);
        EXPECT_EQ(store.saved().size(), 25u);
    };

    return run_tests({
        {"add_remove_list", test_add_remove_list},
        {"invalid_does_not_mutate", test_invalid_does_not_mutate},
        {"check_allowed", test_check_allowed},
        {"order_independent_membership", test_order_independent_membership},
        {"load_skips_bad_entries", test_load_skips_bad_entries},
        {"save_failure_reported", test_save_failure_reported},
        {"concurrent_mutations", test_concurrent_mutations},
    });
}
