#include "access_registry.hpp"
#include "allow_list_store.hpp"
#include "test_common.hpp"
#include "test_support.hpp"

#include <boost/asio/ip/address.hpp>

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

using namespace relay_guard;
using test_support::TempDir;

namespace {

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::set<std::string> membership(const AccessRegistry& registry) {
    std::set<std::string> out;
    for (const auto& n : registry.list_networks()) out.insert(n.to_string());
    return out;
}

} // namespace

int main() {
    auto test_missing_file = [] {
        TempDir dir("store_missing");
        JsonAllowListStore store(dir.file("allowed_ips.json"));
        std::stringstream log;
        EXPECT_TRUE(store.load(log).empty());
        EXPECT_CONTAINS(log.str(), "starting empty");
    };

    auto test_corrupt_file = [] {
        TempDir dir("store_corrupt");
        const auto path = dir.file("allowed_ips.json");
        for (const char* content : {"[\"10.0.0.0/24\",", "{\"a\": \"b\"}", "[[\"10.0.0.0/24\"]]", ""}) {
            write_file(path, content);
            JsonAllowListStore store(path);
            std::stringstream log;
            EXPECT_TRUE(store.load(log).empty());
            EXPECT_CONTAINS(log.str(), "Error loading allowed IPs");
        }
    };

    auto test_load_array = [] {
        TempDir dir("store_load");
        const auto path = dir.file("allowed_ips.json");
        write_file(path, "[\"10.0.0.0/24\", \" 192.168.1.7 \", \"2001:db8::/32\"]");
        JsonAllowListStore store(path);
        std::stringstream log;
        auto entries = store.load(log);
        EXPECT_EQ(entries, (std::vector<std::string>{"10.0.0.0/24", "192.168.1.7", "2001:db8::/32"}));

        write_file(path, "[]");
        EXPECT_TRUE(store.load(log).empty());
    };

    auto test_save_overwrites = [] {
        TempDir dir("store_save");
        const auto path = dir.file("allowed_ips.json");
        JsonAllowListStore store(path);
        store.save({"10.0.0.0/24", "192.168.1.7/32"});
        store.save({"192.168.1.7/32"});
        const auto text = read_file(path);
        EXPECT_TRUE(text.find("10.0.0.0/24") == std::string::npos);
        EXPECT_CONTAINS(text, "\"192.168.1.7/32\"");
        EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

        store.save({});
        std::stringstream log;
        EXPECT_TRUE(store.load(log).empty());
        EXPECT_TRUE(log.str().empty());
    };

    auto test_save_failure_throws = [] {
        TempDir dir("store_fail");
        JsonAllowListStore store(dir.file("no_such_dir/allowed_ips.json"));
        bool threw = false;
        try {
            store.save({"10.0.0.0/24"});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        EXPECT_TRUE(threw);
    };

    auto test_registry_round_trip = [] {
        TempDir dir("store_round_trip");
        const auto path = dir.file("allowed_ips.json");
        std::stringstream log;
        std::set<std::string> before;
        {
            JsonAllowListStore store(path);
            AccessRegistry registry(store, log);
            EXPECT_EQ(registry.add_network("10.0.0.9/24").status, RegistryStatus::Added);
            EXPECT_EQ(registry.add_network("192.168.1.7").status, RegistryStatus::Added);
            EXPECT_EQ(registry.add_network("2001:db8::1/64").status, RegistryStatus::Added);
            EXPECT_EQ(registry.add_network("172.16.0.0/12").status, RegistryStatus::Added);
            EXPECT_EQ(registry.remove_network("172.16.0.0/12").status, RegistryStatus::Removed);
            before = membership(registry);
        }
        EXPECT_CONTAINS(read_file(path), "\"10.0.0.0/24\"");

        JsonAllowListStore reopened(path);
        AccessRegistry reloaded(reopened, log);
        EXPECT_TRUE(membership(reloaded) == before);
        EXPECT_TRUE(reloaded.check_allowed(boost::asio::ip::make_address("10.0.0.77")));
        EXPECT_FALSE(reloaded.check_allowed(boost::asio::ip::make_address("172.16.0.1")));

        // On-disk order does not matter for membership.
        write_file(path, "[\"2001:db8::/64\", \"192.168.1.7/32\", \"10.0.0.0/24\"]");
        JsonAllowListStore shuffled(path);
        AccessRegistry reordered(shuffled, log);
        EXPECT_TRUE(membership(reordered) == before);
    };

    return run_tests({
        {"missing_file", test_missing_file},
        {"corrupt_file", test_corrupt_file},
        {"load_array", test_load_array},
        {"save_overwrites", test_save_overwrites},
        {"save_failure_throws", test_save_failure_throws},
        {"registry_round_trip", test_registry_round_trip},
    });
}
