#include "http/client.hpp"
#include "cast_error.hpp"
#include "logging.hpp"

#include "fmt/format.h"

#include <array>
#include <charconv>
#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace http
{

using utils::cast_error;
using utils::error_kind;

// True once the header and the body it announces have arrived. Responses
// without a length are delimited by the connection close.
static bool response_complete(std::string_view raw, bool head_only)
{
    size_t header_end = raw.find("\r\n\r\n");
    if(header_end == std::string_view::npos)
        return false;
    if(head_only)
        return true;
    header_end += 4;

    std::string header = utils::to_lower(raw.substr(0, header_end));
    if(header.find("transfer-encoding: chunked") != std::string::npos)
        return raw.find("\r\n0\r\n\r\n", header_end - 2) != std::string_view::npos;

    size_t pos = header.find("\r\ncontent-length:");
    if(pos == std::string::npos)
        return false;

    pos += 17;
    std::string_view value = utils::trim(std::string_view {header}.substr(pos, header.find("\r\n", pos) - pos));
    size_t length = 0;
    if(std::from_chars(value.data(), value.data() + value.size(), length).ec != std::errc {})
        return false;

    return raw.size() >= header_end + length;
}

// Owns a client socket. net::tcp_connection connects in its constructor
// and cannot honour a deadline, so the client keeps its own descriptor.
class client_socket
{
public:
    client_socket(const client_socket&) = delete;
    client_socket& operator=(const client_socket&) = delete;

    explicit client_socket(int fd)
        : m_fd {fd}
    {}

    client_socket(client_socket&& other) noexcept
        : m_fd {other.m_fd}
    {
        other.m_fd = -1;
    }

    ~client_socket()
    {
        if(m_fd >= 0)
            ::close(m_fd);
    }

    int get() const
    {
        return m_fd;
    }

private:

    int m_fd;

};

// Non-blocking connect bounded by the timeout and the token
static client_socket connect_to(const utils::url& target, std::chrono::milliseconds timeout, const utils::cancel_token& token)
{
    sockaddr_in addr {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(target.effective_port());
    std::string ip = utils::resolve_ipv4(target.host);
    if(inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
        throw cast_error {error_kind::network_unreachable, fmt::format("Invalid address {}", ip)};

    client_socket sock {::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0)};
    if(sock.get() < 0)
        throw cast_error {error_kind::network_unreachable, fmt::format("Unable to create socket: {}", std::strerror(errno))};

    if(::connect(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 && errno != EINPROGRESS)
        throw cast_error {error_kind::network_unreachable,
            fmt::format("Connection to {} failed: {}", target.authority(), std::strerror(errno))};

    switch(utils::wait_writable(sock.get(), timeout, token))
    {
        case utils::wait_status::timeout:
            throw cast_error {error_kind::timeout, fmt::format("Connection to {} timed out", target.authority())};
        case utils::wait_status::cancelled:
            throw cast_error {error_kind::cancelled, fmt::format("Connection to {} cancelled", target.authority())};
        case utils::wait_status::ready:
            break;
    }

    int error = 0;
    socklen_t len = sizeof(error);
    if(::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &error, &len) != 0)
        error = errno;
    if(error != 0)
        throw cast_error {error_kind::network_unreachable,
            fmt::format("Connection to {} failed: {}", target.authority(), std::strerror(error))};

    return sock;
}

response send_request(const client_request& req, std::chrono::milliseconds timeout, const utils::cancel_token& token)
{
    using namespace std::chrono;

    auto target = utils::parse_url(req.url);
    if(!target)
        throw cast_error {error_kind::malformed_response, fmt::format("Invalid url {}", req.url)};
    if(target->scheme != "http")
        throw cast_error {error_kind::malformed_response, fmt::format("Unsupported url scheme {}", target->scheme)};
    if(token.cancelled())
        throw cast_error {error_kind::cancelled, fmt::format("{} {} cancelled", req.method, req.url)};

    const auto deadline = steady_clock::now() + timeout;
    auto remaining = [&deadline]() {
        return duration_cast<milliseconds>(deadline - steady_clock::now());
    };

    std::string request = fmt::format("{} {} HTTP/1.1\r\nHost: {}\r\nConnection: close\r\n", req.method, target->path, target->authority());
    for(const auto& it : req.headers)
        request.append(fmt::format("{}: {}\r\n", it.first, it.second));
    if(!req.body.empty() || req.method != "GET")
        request.append(fmt::format("Content-Length: {}\r\n", req.body.size()));
    request.append("\r\n");
    request.append(req.body);

    logging::debug("HTTP {} {}", req.method, req.url);

    const bool head_only = req.method == "HEAD";
    std::string raw;
    try {
        client_socket sock = connect_to(*target, remaining(), token);
        utils::send_all(sock.get(), request, remaining(), token);

        std::array<char, 4096> buffer;
        while(!response_complete(raw, head_only))
        {
            switch(utils::wait_readable(sock.get(), remaining(), token))
            {
                case utils::wait_status::timeout:
                    throw cast_error {error_kind::timeout, "Response timed out"};
                case utils::wait_status::cancelled:
                    throw cast_error {error_kind::cancelled, "Response cancelled"};
                case utils::wait_status::ready:
                    break;
            }

            ssize_t br = ::recv(sock.get(), buffer.data(), buffer.size(), 0);
            if(br < 0)
            {
                if(errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
                    continue;
                throw cast_error {error_kind::network_unreachable, fmt::format("recv failed: {}", std::strerror(errno))};
            }
            if(br == 0)
                break;
            raw.append(buffer.data(), static_cast<size_t>(br));
        }
    } catch(cast_error& err) {
        throw err.with_context(fmt::format("{} {}", req.method, req.url));
    }

    if(raw.empty())
        throw cast_error {error_kind::malformed_response, fmt::format("Empty response from {}", req.url)};

    return response::parse(raw, head_only);
}

response get(const std::string& url, std::chrono::milliseconds timeout, const utils::cancel_token& token)
{
    client_request req;
    req.url = url;
    return send_request(req, timeout, token);
}

} // namespace http
