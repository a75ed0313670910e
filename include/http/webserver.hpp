#ifndef HTTP_WEBSERVER_HPP
#define HTTP_WEBSERVER_HPP

#include <string>
#include <list>
#include <future>
#include <thread>
#include <functional>
#include <chrono>

#include <socketwrapper.hpp>

#include "http/request.hpp"
#include "http/response.hpp"
#include "utils.hpp"

namespace http
{

using handler = std::function<response(const request&)>;

/// Minimal HTTP/1.1 origin answering one request per connection.
/// Each accepted connection is served by its own short-lived worker.
class webserver
{
public:
    webserver() = delete;
    webserver(const webserver&) = delete;
    webserver& operator=(const webserver&) = delete;
    webserver(webserver&&) = delete;
    webserver& operator=(webserver&&) = delete;
    ~webserver();

    /// Binds immediately, port 0 selects a free port
    webserver(const std::string& bind_addr, uint16_t port, handler request_handler);

    void start();

    /// Stops accepting connections and joins the server thread and its workers
    void stop();

    uint16_t port() const
    {
        return m_port;
    }

private:

    void serve();

    void serve_connection(net::tcp_connection<net::ip_version::v4> conn) const;

    void handle_connection(net::tcp_connection<net::ip_version::v4>& conn) const;

    net::tcp_acceptor<net::ip_version::v4> m_acceptor;

    handler m_handler;

    uint16_t m_port;

    utils::cancel_token m_stop;

    std::thread m_thread;

    // Only touched by the server thread
    std::list<std::future<void>> m_workers;

};

} // namespace http

#endif
