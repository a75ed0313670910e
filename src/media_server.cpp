#include "media_server.hpp"
#include "cast_error.hpp"
#include "logging.hpp"

#include "fmt/format.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace media
{

using utils::cast_error;
using utils::error_kind;

media_store::media_store(size_t capacity)
    : m_capacity {std::max<size_t>(capacity, 1)}
{}

std::string media_store::insert(std::string payload)
{
    // Counter and timestamp give every store a new url so renderers never reuse a cached copy
    uint64_t id = ++m_counter;
    auto now = std::chrono::system_clock::now().time_since_epoch();
    std::string path = fmt::format("/img_{}_{}.jpg", id, std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());

    auto data = std::make_shared<const std::string>(std::move(payload));

    std::lock_guard<std::mutex> lock {m_mutex};
    while(m_entries.size() >= m_capacity)
        m_entries.pop_front();
    m_entries.push_back(entry {id, path, std::move(data)});

    return path;
}

payload_ptr media_store::find(const std::string& path) const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    auto it = std::find_if(m_entries.begin(), m_entries.end(), [&path](const entry& e) {
        return e.path == path;
    });

    if(it != m_entries.end())
        return it->data;
    else
        return nullptr;
}

size_t media_store::size() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return m_entries.size();
}

void stream_slot::update(std::string payload)
{
    auto frame = std::make_shared<const std::string>(std::move(payload));

    std::lock_guard<std::mutex> lock {m_mutex};
    m_frame = std::move(frame);
}

payload_ptr stream_slot::latest() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return m_frame;
}

static http::response image_response(const std::string& data)
{
    http::response res {200};
    res.set_header("Content-Type", "image/jpeg");
    res.set_header("Cache-Control", "no-cache, no-store, must-revalidate");
    res.set_body(data);
    return res;
}

media_server::media_server(const server_options& options, const utils::address_provider& address)
    : m_store {options.capacity}
{
    try {
        m_local_ip = address();
    } catch(cast_error&) {
        throw;
    } catch(std::exception& err) {
        throw cast_error {error_kind::resource_exhausted, fmt::format("Unable to determine local address: {}", err.what())};
    }
    if(m_local_ip.empty())
        throw cast_error {error_kind::resource_exhausted, "No suitable local address for the media server"};

    try {
        m_server = std::make_unique<http::webserver>("0.0.0.0", options.port, [this](const http::request& req) {
            return handle(req);
        });
    } catch(cast_error&) {
        throw;
    } catch(std::runtime_error& err) {
        throw cast_error {error_kind::network_unreachable, fmt::format("Unable to listen on port {}: {}", options.port, err.what())};
    }

    m_server->start();
    logging::info("Media server available at {}", url());
}

media_server::~media_server()
{
    close();
}

std::string media_server::store(std::string jpeg)
{
    std::string path = m_store.insert(std::move(jpeg));
    return fmt::format("{}{}", url(), path);
}

void media_server::update_stream(std::string jpeg)
{
    m_stream.update(std::move(jpeg));
}

std::string media_server::stream_url() const
{
    return fmt::format("{}{}", url(), STREAM_PATH);
}

std::string media_server::url() const
{
    return fmt::format("http://{}:{}", m_local_ip, m_server->port());
}

void media_server::close()
{
    if(m_server)
        m_server->stop();
}

http::response media_server::handle(const http::request& req) const
{
    logging::debug("Media request: {} {}", req.get_method(), req.get_path());

    if(req.get_method() != "GET" && req.get_method() != "HEAD")
    {
        http::response res {405};
        res.set_header("Allow", "GET, HEAD");
        return res;
    }

    if(req.get_path() == STREAM_PATH)
    {
        payload_ptr frame = m_stream.latest();
        if(!frame)
            return http::response {404};

        http::response res = image_response(*frame);
        // Renderers showing the stream url must fetch it again every time
        res.set_header("Cache-Control", "no-cache, no-store, must-revalidate, max-age=0");
        res.set_header("Pragma", "no-cache");
        res.set_header("Expires", "Thu, 01 Jan 1970 00:00:00 GMT");
        res.set_header("Refresh", "1");
        logging::debug("Stream: sending {} bytes", frame->size());
        return res;
    }

    payload_ptr data = m_store.find(req.get_path());
    if(!data)
    {
        logging::debug("Not found: {} (have {} images)", req.get_path(), m_store.size());
        return http::response {404};
    }

    return image_response(*data);
}

} // namespace media
