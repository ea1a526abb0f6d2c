#pragma once
#include <arpa/inet.h>
#include <netinet/in.h>

#include <array>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "static_schema.hpp"

namespace FormFusion {

class Ipv4Address {
    std::array<std::uint8_t, 4> m_octets{};
public:
    Ipv4Address() = default;
    explicit Ipv4Address(std::array<std::uint8_t, 4> octets) : m_octets(octets) {}

    /// Dotted quad, as accepted by inet_pton(AF_INET).
    static std::optional<Ipv4Address> parse(std::string_view text) {
        std::string buf(text);
        in_addr addr{};
        if(::inet_pton(AF_INET, buf.c_str(), &addr) != 1) return std::nullopt;
        Ipv4Address out;
        std::memcpy(out.m_octets.data(), &addr, out.m_octets.size());
        return out;
    }

    const std::array<std::uint8_t, 4>& octets() const { return m_octets; }

    std::string to_string() const {
        char buf[INET_ADDRSTRLEN] = {};
        ::inet_ntop(AF_INET, m_octets.data(), buf, sizeof(buf));
        return buf;
    }

    bool operator==(const Ipv4Address&) const = default;
};

class Ipv6Address {
    std::array<std::uint8_t, 16> m_octets{};
public:
    Ipv6Address() = default;
    explicit Ipv6Address(std::array<std::uint8_t, 16> octets) : m_octets(octets) {}

    static std::optional<Ipv6Address> parse(std::string_view text) {
        std::string buf(text);
        in6_addr addr{};
        if(::inet_pton(AF_INET6, buf.c_str(), &addr) != 1) return std::nullopt;
        Ipv6Address out;
        std::memcpy(out.m_octets.data(), &addr, out.m_octets.size());
        return out;
    }

    const std::array<std::uint8_t, 16>& octets() const { return m_octets; }

    std::string to_string() const {
        char buf[INET6_ADDRSTRLEN] = {};
        ::inet_ntop(AF_INET6, m_octets.data(), buf, sizeof(buf));
        return buf;
    }

    bool operator==(const Ipv6Address&) const = default;
};

using IpAddress = std::variant<Ipv4Address, Ipv6Address>;

inline std::optional<IpAddress> parse_ip_address(std::string_view text) {
    if(auto v4 = Ipv4Address::parse(text)) return IpAddress(*v4);
    if(auto v6 = Ipv6Address::parse(text)) return IpAddress(*v6);
    return std::nullopt;
}

/// `a.b.c.d:port` or `[v6]:port`.
struct SocketAddress {
    IpAddress ip;
    std::uint16_t port = 0;

    static std::optional<SocketAddress> parse(std::string_view text) {
        std::size_t colon = text.rfind(':');
        if(colon == std::string_view::npos || colon + 1 == text.size()) return std::nullopt;

        std::string_view host = text.substr(0, colon);
        std::string_view port_text = text.substr(colon + 1);
        std::uint16_t port = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if(ec != std::errc() || ptr != port_text.data() + port_text.size()) return std::nullopt;

        if(host.size() > 2 && host.front() == '[' && host.back() == ']') {
            auto v6 = Ipv6Address::parse(host.substr(1, host.size() - 2));
            if(!v6) return std::nullopt;
            return SocketAddress{*v6, port};
        }
        auto v4 = Ipv4Address::parse(host);
        if(!v4) return std::nullopt;
        return SocketAddress{*v4, port};
    }

    std::string to_string() const {
        if(auto v4 = std::get_if<Ipv4Address>(&ip)) {
            return v4->to_string() + ":" + std::to_string(port);
        }
        return "[" + std::get<Ipv6Address>(ip).to_string() + "]:" + std::to_string(port);
    }

    bool operator==(const SocketAddress&) const = default;
};

template<>
struct FieldParser<Ipv4Address> {
    static BindResult<Ipv4Address> from_value(const ValueField& f) {
        if(auto a = Ipv4Address::parse(f.value)) return *a;
        return Error::conversion("invalid IPv4 address syntax");
    }
};

template<>
struct FieldParser<Ipv6Address> {
    static BindResult<Ipv6Address> from_value(const ValueField& f) {
        if(auto a = Ipv6Address::parse(f.value)) return *a;
        return Error::conversion("invalid IPv6 address syntax");
    }
};

template<>
struct FieldParser<IpAddress> {
    static BindResult<IpAddress> from_value(const ValueField& f) {
        if(auto a = parse_ip_address(f.value)) return *a;
        return Error::conversion("invalid IP address syntax");
    }
};

template<>
struct FieldParser<SocketAddress> {
    static BindResult<SocketAddress> from_value(const ValueField& f) {
        if(auto a = SocketAddress::parse(f.value)) return *a;
        return Error::conversion("invalid socket address syntax");
    }
};

} // namespace FormFusion
