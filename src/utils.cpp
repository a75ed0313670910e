#include <utils.hpp>
#include <cast_error.hpp>

#include <socketwrapper.hpp>
#include "fmt/format.h"

#include <array>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <ifaddrs.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <net/if.h>
#include <poll.h>
#include <unistd.h>

namespace utils
{

static const char* error_msg = "Unable to get local ip address";

// Public address used only to pick the outgoing route, nothing is sent to it
static const char* route_target_addr = "8.8.8.8";

static constexpr std::chrono::milliseconds poll_slice {50};

const char* to_string(error_kind kind)
{
    switch(kind)
    {
        case error_kind::network_unreachable: return "network unreachable";
        case error_kind::timeout: return "timeout";
        case error_kind::malformed_response: return "malformed response";
        case error_kind::no_control_service: return "no control service found";
        case error_kind::transport_error: return "transport error";
        case error_kind::device_error: return "device error";
        case error_kind::resource_exhausted: return "resource exhausted";
        case error_kind::cancelled: return "cancelled";
        case error_kind::encode_error: return "encode error";
    }
    return "unknown error";
}

cast_error cast_error::with_context(std::string_view step) const
{
    return cast_error {m_kind, fmt::format("{}: {}", step, what()), m_status, m_body};
}

static wait_status wait_for(int fd, short events, std::chrono::milliseconds timeout, const cancel_token& token)
{
    using namespace std::chrono;

    const auto deadline = steady_clock::now() + timeout;
    while(true)
    {
        if(token.cancelled())
            return wait_status::cancelled;

        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if(remaining.count() <= 0)
            return wait_status::timeout;

        pollfd pfd {fd, events, 0};
        int ret = ::poll(&pfd, 1, static_cast<int>(std::min(remaining, poll_slice).count()));
        if(ret > 0)
            return wait_status::ready;
        if(ret < 0 && errno != EINTR)
            throw cast_error {error_kind::network_unreachable, fmt::format("poll failed with errno {}", errno)};
    }
}

wait_status wait_readable(int fd, std::chrono::milliseconds timeout, const cancel_token& token)
{
    return wait_for(fd, POLLIN, timeout, token);
}

wait_status wait_writable(int fd, std::chrono::milliseconds timeout, const cancel_token& token)
{
    return wait_for(fd, POLLOUT, timeout, token);
}

void send_all(int fd, std::string_view data, std::chrono::milliseconds timeout, const cancel_token& token)
{
    using namespace std::chrono;

    const auto deadline = steady_clock::now() + timeout;
    while(!data.empty())
    {
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        switch(wait_writable(fd, remaining, token))
        {
            case wait_status::timeout:
                throw cast_error {error_kind::timeout, "Send timed out"};
            case wait_status::cancelled:
                throw cast_error {error_kind::cancelled, "Send cancelled"};
            case wait_status::ready:
                break;
        }

        ssize_t sent = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
        if(sent < 0)
        {
            if(errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
                continue;
            throw cast_error {error_kind::network_unreachable, fmt::format("send failed: {}", std::strerror(errno))};
        }
        data.remove_prefix(static_cast<size_t>(sent));
    }
}

std::string url::authority() const
{
    // IPv6 literals keep their brackets
    std::string name = (host.find(':') != std::string::npos) ? fmt::format("[{}]", host) : host;
    if(port == 0)
        return name;
    return fmt::format("{}:{}", name, port);
}

std::optional<url> parse_url(std::string_view view)
{
    url parsed;

    size_t tmp = view.find("://");
    if(tmp == std::string_view::npos || tmp == 0)
        return std::nullopt;

    std::string_view scheme = view.substr(0, tmp);
    auto scheme_char = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    };
    if(!std::isalpha(static_cast<unsigned char>(scheme.front())) || !std::all_of(scheme.begin(), scheme.end(), scheme_char))
        return std::nullopt;
    parsed.scheme = to_lower(scheme);
    view.remove_prefix(tmp + 3);

    size_t path_start = view.find_first_of("/?#");
    std::string_view authority = view.substr(0, path_start);
    if(path_start == std::string_view::npos)
        parsed.path = "/";
    else if(view[path_start] != '/')
        parsed.path = fmt::format("/{}", view.substr(path_start));
    else
        parsed.path = std::string {view.substr(path_start)};

    // Strip user info
    if((tmp = authority.rfind('@')) != std::string_view::npos)
        authority.remove_prefix(tmp + 1);

    if(!authority.empty() && authority.front() == '[')
    {
        // IPv6 literal
        size_t close = authority.find(']');
        if(close == std::string_view::npos)
            return std::nullopt;
        parsed.host = std::string {authority.substr(1, close - 1)};
        authority.remove_prefix(close + 1);
    }
    else
    {
        tmp = authority.find(':');
        parsed.host = std::string {authority.substr(0, tmp)};
        authority.remove_prefix(tmp == std::string_view::npos ? authority.size() : tmp);
    }

    if(!authority.empty())
    {
        if(authority.front() != ':')
            return std::nullopt;
        std::string_view port_view = authority.substr(1);
        if(!port_view.empty())
        {
            uint16_t port = 0;
            auto res = std::from_chars(port_view.data(), port_view.data() + port_view.size(), port);
            if(res.ec != std::errc {} || res.ptr != port_view.data() + port_view.size())
                return std::nullopt;
            parsed.port = port;
        }
    }

    if(parsed.host.empty())
        return std::nullopt;

    return parsed;
}

std::string escape_xml(std::string_view str)
{
    std::string escaped;
    escaped.reserve(str.size());
    for(char c : str)
    {
        switch(c)
        {
            case '&': escaped.append("&amp;"); break;
            case '<': escaped.append("&lt;"); break;
            case '>': escaped.append("&gt;"); break;
            case '"': escaped.append("&quot;"); break;
            case '\'': escaped.append("&apos;"); break;
            default: escaped.push_back(c);
        }
    }
    return escaped;
}

bool starts_with(std::string_view str, std::string_view prefix)
{
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view str, std::string_view suffix)
{
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(std::string_view str)
{
    std::string lower {str};
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

std::string_view trim(std::string_view str)
{
    const char* whitespace = " \t\r\n";
    size_t first = str.find_first_not_of(whitespace);
    if(first == std::string_view::npos)
        return {};
    size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

std::string resolve_ipv4(const std::string& host)
{
    in_addr numeric;
    if(inet_pton(AF_INET, host.c_str(), &numeric) == 1)
        return host;

    addrinfo hints {};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    int ret = getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if(ret != 0 || result == nullptr)
        throw cast_error {error_kind::network_unreachable, fmt::format("Unable to resolve host {}: {}", host, gai_strerror(ret))};
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard {result, &freeaddrinfo};

    std::array<char, INET_ADDRSTRLEN> buffer;
    const auto* addr = reinterpret_cast<const sockaddr_in*>(result->ai_addr);
    if(inet_ntop(AF_INET, &addr->sin_addr, buffer.data(), buffer.size()) == nullptr)
        throw cast_error {error_kind::network_unreachable, fmt::format("Unable to resolve host {}", host)};

    return buffer.data();
}

static std::optional<std::string> route_local_addr()
{
    sockaddr_in remote {};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(80);
    inet_pton(AF_INET, route_target_addr, &remote.sin_addr);

    try {
        net::udp_socket<net::ip_version::v4> sock {"0.0.0.0", 0};

        // Connecting a datagram socket only selects the route, socketwrapper has no call for it
        sockaddr_in local {};
        socklen_t len = sizeof(local);
        if(::connect(sock.get(), reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) != 0
            || ::getsockname(sock.get(), reinterpret_cast<sockaddr*>(&local), &len) != 0)
            return std::nullopt;

        std::array<char, INET_ADDRSTRLEN> host;
        if(inet_ntop(AF_INET, &local.sin_addr, host.data(), host.size()) == nullptr || local.sin_addr.s_addr == 0)
            return std::nullopt;
        return std::string {host.data()};
    } catch(std::runtime_error&) {
        return std::nullopt;
    }
}

static std::string interface_addr_fallback()
{
    ifaddrs* addrs;
    if(getifaddrs(&addrs))
        throw cast_error {error_kind::resource_exhausted, error_msg};
    std::unique_ptr<ifaddrs, decltype(&freeifaddrs)> guard {addrs, &freeifaddrs};

    for(ifaddrs* curr_addr = addrs; curr_addr != nullptr; curr_addr = curr_addr->ifa_next)
    {
        if(curr_addr->ifa_addr == nullptr || curr_addr->ifa_addr->sa_family != AF_INET)
            continue;

        if((curr_addr->ifa_flags & IFF_UP) == 0 || (curr_addr->ifa_flags & IFF_LOOPBACK) != 0)
            continue;

        std::array<char, NI_MAXHOST> host;
        int s = getnameinfo(curr_addr->ifa_addr, sizeof(sockaddr_in), host.data(), NI_MAXHOST, nullptr, 0, NI_NUMERICHOST);
        if(s == 0)
            return host.data();
    }

    throw cast_error {error_kind::resource_exhausted, fmt::format("{}: no suitable local IPv4 address found", error_msg)};
}

std::string get_local_ipaddr()
{
    if(auto addr = route_local_addr())
        return *addr;
    return interface_addr_fallback();
}

address_provider fixed_address(std::string addr)
{
    return [addr = std::move(addr)]() {
        return addr;
    };
}

} // utils
