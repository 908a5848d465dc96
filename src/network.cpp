#include "network.hpp"

#include <algorithm>
#include <cctype>

namespace relay_guard {

namespace {

bool all_digits(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace

std::optional<NetworkEntry> NetworkEntry::parse(std::string_view text) {
    auto pos = text.find('/');
    const std::string addr_str(text.substr(0, pos));

    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(addr_str, ec);
    if (ec) return std::nullopt;

    const bool is_v6 = addr.is_v6();
    unsigned prefix = is_v6 ? 128 : 32;
    if (pos != std::string_view::npos) {
        auto parsed = parse_prefix(text.substr(pos + 1), is_v6);
        if (!parsed) return std::nullopt;
        prefix = *parsed;
    }

    NetworkEntry entry;
    entry.is_v6_ = is_v6;
    entry.prefix_ = prefix;
    entry.mask_ = make_mask(prefix, is_v6);
    auto bytes = address_bytes(addr);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        entry.network_[i] = bytes[i] & entry.mask_[i];
    }

    if (is_v6) {
        boost::asio::ip::address_v6::bytes_type b6{};
        std::copy(entry.network_.begin(), entry.network_.end(), b6.begin());
        entry.canonical_ = boost::asio::ip::address_v6(b6).to_string();
    } else {
        boost::asio::ip::address_v4::bytes_type b4{};
        std::copy(entry.network_.begin() + 12, entry.network_.end(), b4.begin());
        entry.canonical_ = boost::asio::ip::address_v4(b4).to_string();
    }
    entry.canonical_ += "/" + std::to_string(prefix);
    return entry;
}

bool NetworkEntry::contains(const boost::asio::ip::address& raw) const {
    if (!is_v6_) {
        const auto addr = normalize_address(raw);
        return addr.is_v4() && matches(address_bytes(addr));
    }
    // IPv6 networks see IPv4 clients in their mapped form, so entries such as
    // ::ffff:10.0.0.0/104 match whichever way the client arrived.
    if (raw.is_v4()) {
        return matches(address_bytes(boost::asio::ip::make_address_v6(boost::asio::ip::v4_mapped, raw.to_v4())));
    }
    return matches(address_bytes(raw));
}

bool NetworkEntry::matches(const std::array<std::uint8_t, 16>& bytes) const {
    for (std::size_t i = 0; i < network_.size(); ++i) {
        if ((bytes[i] & mask_[i]) != network_[i]) return false;
    }
    return true;
}

std::optional<unsigned> NetworkEntry::parse_prefix(std::string_view text, bool is_v6) {
    const unsigned max_pref = is_v6 ? 128 : 32;
    if (all_digits(text)) {
        if (text.size() > 3) return std::nullopt;
        const auto prefix = static_cast<unsigned>(std::stoul(std::string(text)));
        if (prefix > max_pref) return std::nullopt;
        return prefix;
    }
    if (is_v6) return std::nullopt;

    // Dotted netmask, e.g. 255.255.240.0. Only contiguous masks are networks.
    boost::system::error_code ec;
    auto mask = boost::asio::ip::make_address_v4(std::string(text), ec);
    if (ec) return std::nullopt;
    const std::uint32_t bits = mask.to_uint();
    const std::uint32_t inverted = ~bits;
    if ((inverted & (inverted + 1)) != 0) return std::nullopt;
    unsigned prefix = 0;
    for (std::uint32_t b = bits; b & 0x80000000u; b <<= 1) ++prefix;
    return prefix;
}

std::array<std::uint8_t, 16> NetworkEntry::address_bytes(const boost::asio::ip::address& addr) {
    std::array<std::uint8_t, 16> bytes{};
    if (addr.is_v4()) {
        auto b4 = addr.to_v4().to_bytes();
        std::copy(b4.begin(), b4.end(), bytes.begin() + 12);
    } else {
        auto b6 = addr.to_v6().to_bytes();
        std::copy(b6.begin(), b6.end(), bytes.begin());
    }
    return bytes;
}

std::array<std::uint8_t, 16> NetworkEntry::make_mask(unsigned prefix, bool is_v6) {
    std::array<std::uint8_t, 16> mask{};
    const std::size_t offset = is_v6 ? 0 : 12;
    const std::size_t bytes = is_v6 ? mask.size() : 4;
    for (std::size_t i = 0; i < bytes && prefix > 0; ++i) {
        if (prefix >= 8) {
            mask[offset + i] = 0xFF;
            prefix -= 8;
        } else {
            mask[offset + i] = static_cast<std::uint8_t>(0xFF << (8 - prefix));
            prefix = 0;
        }
    }
    return mask;
}

boost::asio::ip::address normalize_address(const boost::asio::ip::address& addr) {
    if (addr.is_v6() && addr.to_v6().is_v4_mapped()) {
        return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, addr.to_v6());
    }
    return addr;
}

} // namespace relay_guard
