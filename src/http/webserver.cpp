#include "http/webserver.hpp"
#include "cast_error.hpp"
#include "logging.hpp"

#include <array>
#include <string>
#include <string_view>
#include <charconv>
#include <stdexcept>

#include <sys/socket.h>
#include <netinet/in.h>

namespace http
{

static constexpr std::chrono::milliseconds read_timeout {5000};
static constexpr std::chrono::milliseconds write_timeout {10000};
static constexpr std::chrono::milliseconds accept_slice {200};
static constexpr size_t max_request_size = 16 * 1024 * 1024;

static uint16_t bound_port(int fd)
{
    sockaddr_in addr {};
    socklen_t len = sizeof(addr);
    if(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0)
        throw utils::cast_error {utils::error_kind::network_unreachable, "Unable to query bound port"};
    return ntohs(addr.sin_port);
}

static void send_response(net::tcp_connection<net::ip_version::v4>& conn, const response& res, bool head_only,
    const utils::cancel_token& stop)
{
    std::string raw = head_only ? res.head_to_string() : res.to_string();
    // A client hanging up early must not raise SIGPIPE
    utils::send_all(conn.get(), raw, write_timeout, stop);
}

webserver::webserver(const std::string& bind_addr, uint16_t port, handler request_handler)
    : m_acceptor {bind_addr, port},
      m_handler {std::move(request_handler)},
      m_port {bound_port(m_acceptor.get())}
{}

webserver::~webserver()
{
    stop();
}

void webserver::start()
{
    if(m_thread.joinable())
        return;
    m_thread = std::thread {&webserver::serve, this};
}

void webserver::stop()
{
    m_stop.cancel();
    if(m_thread.joinable())
        m_thread.join();
}

void webserver::serve()
{
    logging::info("Webserver serving on port {} ...", m_port);
    while(!m_stop.cancelled())
    {
        // Drop workers that are done
        m_workers.remove_if([](const std::future<void>& worker) {
            return worker.wait_for(std::chrono::seconds {0}) == std::future_status::ready;
        });

        try {
            if(utils::wait_readable(m_acceptor.get(), accept_slice, m_stop) != utils::wait_status::ready)
                continue;

            m_workers.push_back(std::async(std::launch::async, &webserver::serve_connection, this, m_acceptor.accept()));
        } catch(std::runtime_error& err) {
            // Also covers std::async failing to start a thread
            logging::debug("Webserver accept failed: {}", err.what());
        }
    }

    // Workers notice m_stop within one poll slice
    m_workers.clear();
    logging::info("Webserver on port {} closing", m_port);
}

void webserver::serve_connection(net::tcp_connection<net::ip_version::v4> conn) const
{
    try {
        handle_connection(conn);
    } catch(std::runtime_error& err) {
        logging::debug("Webserver connection failed: {}", err.what());
    }
}

void webserver::handle_connection(net::tcp_connection<net::ip_version::v4>& conn) const
{
    using namespace std::chrono;

    const auto deadline = steady_clock::now() + read_timeout;
    std::string raw;
    std::array<char, 4096> buffer;

    // Read until the header is complete and the announced body has arrived
    size_t header_end = std::string::npos;
    size_t content_length = 0;
    while(header_end == std::string::npos || raw.size() < header_end + content_length)
    {
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if(utils::wait_readable(conn.get(), remaining, m_stop) != utils::wait_status::ready)
            return;

        size_t br = conn.read(net::span {buffer.data(), buffer.size()});
        if(br == 0)
            break;
        raw.append(buffer.data(), br);

        if(raw.size() > max_request_size)
        {
            send_response(conn, response {413}, false, m_stop);
            return;
        }

        if(header_end == std::string::npos && (header_end = raw.find("\r\n\r\n")) != std::string::npos)
        {
            header_end += 4;
            request head;
            try {
                head.parse(std::string_view {raw.data(), header_end});
            } catch(std::invalid_argument&) {
                break;
            }
            std::string length = head.get_header("Content-Length");
            if(!length.empty() && std::from_chars(length.data(), length.data() + length.size(), content_length).ec != std::errc {})
            {
                send_response(conn, response {400}, false, m_stop);
                return;
            }
        }
    }

    request req;
    try {
        req.parse(raw);
    } catch(std::invalid_argument&) {
        send_response(conn, response {400}, false, m_stop);
        return;
    }
    if(req.get_body().size() > content_length)
        req.set_body(req.get_body().substr(0, content_length));

    response res;
    try {
        res = m_handler(req);
    } catch(std::exception& err) {
        logging::error("Request handler for {} {} failed: {}", req.get_method(), req.get_path(), err.what());
        res = response {500};
    }
    res.set_header("Connection", "close");

    send_response(conn, res, req.get_method() == "HEAD", m_stop);
}

} // namespace http
