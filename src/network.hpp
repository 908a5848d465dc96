#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/ip/address.hpp>

namespace relay_guard {

// An IP network in canonical CIDR form. Host bits are always masked off, so two
// entries compare equal exactly when they describe the same network.
class NetworkEntry {
public:
    // Accepts "a.b.c.d/len", "a.b.c.d/255.255.255.0", "v6::/len" or a bare
    // address (single host). Returns nullopt on malformed input.
    static std::optional<NetworkEntry> parse(std::string_view text);

    bool contains(const boost::asio::ip::address& addr) const;

    const std::string& to_string() const { return canonical_; }
    unsigned prefix_length() const { return prefix_; }
    bool is_v6() const { return is_v6_; }

    bool operator==(const NetworkEntry& other) const {
        return is_v6_ == other.is_v6_ && prefix_ == other.prefix_ && network_ == other.network_;
    }
    bool operator!=(const NetworkEntry& other) const { return !(*this == other); }

private:
    NetworkEntry() = default;

    bool matches(const std::array<std::uint8_t, 16>& bytes) const;

    static std::array<std::uint8_t, 16> address_bytes(const boost::asio::ip::address& addr);
    static std::array<std::uint8_t, 16> make_mask(unsigned prefix, bool is_v6);
    static std::optional<unsigned> parse_prefix(std::string_view text, bool is_v6);

    std::array<std::uint8_t, 16> network_{};
    std::array<std::uint8_t, 16> mask_{};
    unsigned prefix_ = 0;
    bool is_v6_ = false;
    std::string canonical_;
};

// Unwraps IPv4-mapped IPv6 addresses (::ffff:a.b.c.d) so dual-stack listeners
// match IPv4 networks.
boost::asio::ip::address normalize_address(const boost::asio::ip::address& addr);

} // namespace relay_guard
