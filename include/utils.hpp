#ifndef TVCAST_UTILS_HPP
#define TVCAST_UTILS_HPP

#include <string>
#include <string_view>
#include <optional>
#include <functional>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace utils
{

// Cooperative cancellation shared between a caller and the blocking call it started
class cancel_token
{
public:
    cancel_token() = default;
    cancel_token(const cancel_token&) = delete;
    cancel_token& operator=(const cancel_token&) = delete;

    void cancel() noexcept
    {
        m_cancelled.store(true);
    }

    bool cancelled() const noexcept
    {
        return m_cancelled.load();
    }

private:

    std::atomic<bool> m_cancelled {false};

};

enum class wait_status
{
    ready,
    timeout,
    cancelled
};

/// Wait until fd is readable, the timeout expires or the token fires.
/// Polls in short slices so cancellation is noticed quickly.
wait_status wait_readable(int fd, std::chrono::milliseconds timeout, const cancel_token& token);

wait_status wait_writable(int fd, std::chrono::milliseconds timeout, const cancel_token& token);

/// Sends all of data without raising SIGPIPE. Throws utils::cast_error with kind
/// timeout, cancelled or network_unreachable if the peer went away.
void send_all(int fd, std::string_view data, std::chrono::milliseconds timeout, const cancel_token& token);

struct url
{
    std::string scheme;
    std::string host;
    uint16_t port = 0;      // 0 if the url has no explicit port
    std::string path;       // path and query, always starts with '/'

    uint16_t effective_port() const
    {
        return (port != 0) ? port : 80;
    }

    // host[:port] exactly as it appeared in the url
    std::string authority() const;
};

std::optional<url> parse_url(std::string_view str);

std::string escape_xml(std::string_view str);

bool starts_with(std::string_view str, std::string_view prefix);

bool ends_with(std::string_view str, std::string_view suffix);

std::string to_lower(std::string_view str);

std::string_view trim(std::string_view str);

/// Resolve a host name or numeric address to a dotted IPv4 string
std::string resolve_ipv4(const std::string& host);

/// Returns the address a device on the LAN would use to reach this host
using address_provider = std::function<std::string()>;

/// Address of the interface routing to a public address, falling back to
/// the first non-loopback IPv4 interface address
std::string get_local_ipaddr();

address_provider fixed_address(std::string addr);

} // namespace utils

#endif
