#ifndef MEDIA_SERVER_HPP
#define MEDIA_SERVER_HPP

#include <string>
#include <deque>
#include <memory>
#include <mutex>
#include <atomic>
#include <cstdint>

#include "http/webserver.hpp"
#include "utils.hpp"

namespace media
{

#define STORE_CAPACITY 10
#define STREAM_PATH "/stream.jpg"

using payload_ptr = std::shared_ptr<const std::string>;

/// Bounded set of payloads keyed by generated paths.
/// The oldest entry is evicted once the capacity is reached.
class media_store
{
public:
    media_store(const media_store&) = delete;
    media_store& operator=(const media_store&) = delete;

    explicit media_store(size_t capacity = STORE_CAPACITY);

    /// Returns the fresh path the payload is reachable under
    std::string insert(std::string payload);

    /// nullptr if the path is unknown or already evicted
    payload_ptr find(const std::string& path) const;

    size_t size() const;

    size_t capacity() const
    {
        return m_capacity;
    }

private:

    struct entry
    {
        uint64_t id;
        std::string path;
        payload_ptr data;
    };

    const size_t m_capacity;

    std::atomic<uint64_t> m_counter {0};

    mutable std::mutex m_mutex;

    std::deque<entry> m_entries;

};

/// Latest frame pushed for continuous display
class stream_slot
{
public:

    void update(std::string payload);

    /// nullptr until the first update
    payload_ptr latest() const;

private:

    mutable std::mutex m_mutex;

    payload_ptr m_frame;

};

struct server_options
{
    uint16_t port = 0;
    size_t capacity = STORE_CAPACITY;
};

/// HTTP origin the renderers pull images from
class media_server
{
public:
    media_server() = delete;
    media_server(const media_server&) = delete;
    media_server& operator=(const media_server&) = delete;
    media_server(media_server&&) = delete;
    media_server& operator=(media_server&&) = delete;
    ~media_server();

    /// Starts serving immediately. Throws utils::cast_error with resource_exhausted if no
    /// local address can be determined and network_unreachable if binding fails.
    explicit media_server(const server_options& options, const utils::address_provider& address = utils::get_local_ipaddr);

    /// Stores a JPEG and returns its absolute url
    std::string store(std::string jpeg);

    void update_stream(std::string jpeg);

    std::string stream_url() const;

    /// Origin of the server, e.g. http://192.168.1.2:41234
    std::string url() const;

    size_t stored_count() const
    {
        return m_store.size();
    }

    void close();

private:

    http::response handle(const http::request& req) const;

    media_store m_store;

    stream_slot m_stream;

    std::string m_local_ip;

    std::unique_ptr<http::webserver> m_server;

};

} // namespace media

#endif
