#ifndef TEST_MOCK_DEVICE_HPP
#define TEST_MOCK_DEVICE_HPP

#include <string>
#include <vector>
#include <mutex>
#include <functional>

#include "fmt/format.h"

#include "http/webserver.hpp"
#include "upnp_device.hpp"

namespace test
{

/// Loopback renderer recording every request it receives.
/// Answers 200 with an empty body until respond_with installs another handler.
class mock_device
{
public:

    mock_device()
        : m_server {"127.0.0.1", 0, [this](const http::request& req) { return on_request(req); }}
    {
        m_server.start();
    }

    ~mock_device()
    {
        m_server.stop();
    }

    void respond_with(http::handler handler)
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        m_handler = std::move(handler);
    }

    std::vector<http::request> requests() const
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        return m_requests;
    }

    // Action names taken from the SOAPAction headers, in arrival order
    std::vector<std::string> actions() const
    {
        std::vector<std::string> names;
        for(const auto& req : requests())
        {
            std::string header = req.get_header("SOAPAction");
            size_t hash = header.find('#');
            if(hash == std::string::npos)
                continue;
            std::string name = header.substr(hash + 1);
            if(!name.empty() && name.back() == '"')
                name.pop_back();
            names.push_back(name);
        }
        return names;
    }

    uint16_t port() const
    {
        return m_server.port();
    }

    std::string url(const std::string& path) const
    {
        return fmt::format("http://127.0.0.1:{}{}", port(), path);
    }

    upnp::upnp_device device() const
    {
        return upnp::upnp_device {"Mock TV", "127.0.0.1", port(), url("/control"), url("")};
    }

private:

    // Requests arrive on concurrent workers, handlers may block
    http::response on_request(const http::request& req)
    {
        http::handler handler;
        {
            std::lock_guard<std::mutex> lock {m_mutex};
            m_requests.push_back(req);
            handler = m_handler;
        }
        if(handler)
            return handler(req);
        return http::response {200};
    }

    mutable std::mutex m_mutex;

    http::handler m_handler;

    std::vector<http::request> m_requests;

    http::webserver m_server;

};

} // namespace test

#endif
