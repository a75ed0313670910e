#include "ssdp_discovery.hpp"
#include "http/client.hpp"
#include "cast_error.hpp"
#include "logging.hpp"

#include <socketwrapper.hpp>
#include "fmt/format.h"

#include <vector>
#include <memory>
#include <chrono>
#include <stdexcept>

namespace discovery
{

using utils::cast_error;
using utils::error_kind;

static constexpr size_t max_datagram_size = 65536;

std::optional<ssdp_res> parse_response(std::string_view view)
{
    ssdp_res res;

    // Status line is not needed
    size_t endl = view.find('\n');
    if(endl == std::string_view::npos)
        return std::nullopt;
    view.remove_prefix(endl + 1);

    while(!view.empty())
    {
        endl = view.find('\n');
        std::string_view line = utils::trim(view.substr(0, endl));
        view.remove_prefix(endl == std::string_view::npos ? view.size() : endl + 1);
        if(line.empty())
            break;

        size_t sep = line.find(':');
        if(sep == std::string_view::npos)
            continue;

        std::string key = utils::to_lower(utils::trim(line.substr(0, sep)));
        std::string_view val = utils::trim(line.substr(sep + 1));
        if(key == "location")
            res.location = val;
        else if(key == "cache-control")
            res.cache_control = val;
        else if(key == "server")
            res.server = val;
        else if(key == "usn")
            res.usn = val;
        else if(key == "st")
            res.st = val;
    }

    if(res.location.empty())
        return std::nullopt;
    return res;
}

std::string build_search(const std::string& service_type, int mx)
{
    return fmt::format("M-SEARCH * HTTP/1.1\r\nHOST: {}:{}\r\nMAN: \"ssdp:discover\"\r\nMX: {}\r\nST: {}\r\n\r\n",
        DISCOVERY_IP, DISCOVERY_PORT, mx, service_type);
}

device_collector::device_collector(fetcher fetch)
    : m_fetch {std::move(fetch)}
{}

bool device_collector::add_datagram(std::string_view datagram)
{
    auto res = parse_response(datagram);
    if(!res)
        return false;

    // A device answers once per search target and interface, fetch it only once
    if(!m_seen.insert(res->location).second)
        return false;

    try {
        http::response description = m_fetch(res->location);
        if(description.get_code() != 200)
        {
            logging::debug("Skipping {}: description request returned HTTP {}", res->location, description.get_code());
            return false;
        }

        const auto& device = m_devices.emplace_back(upnp::decode_description(description.get_body(), res->location));
        logging::debug("Found {} at {} ({})", device.name(), res->location, res->server);
        return true;
    } catch(cast_error& err) {
        if(err.kind() == error_kind::cancelled)
            throw;
        logging::debug("Skipping {}: {}", res->location, err.what());
        return false;
    }
}

discovery_result discover(std::chrono::milliseconds timeout, const utils::cancel_token& token, std::chrono::milliseconds description_timeout)
{
    using namespace std::chrono;

    discovery_result result;
    device_collector collector {[&token, description_timeout](const std::string& location) {
        return http::get(location, description_timeout, token);
    }};

    std::unique_ptr<net::udp_socket<net::ip_version::v4>> d_sock;
    try {
        d_sock = std::make_unique<net::udp_socket<net::ip_version::v4>>("0.0.0.0", 0);
        std::string msg = build_search(MEDIA_RENDERER_ST);
        d_sock->send(DISCOVERY_IP, DISCOVERY_PORT, net::span {msg});
    } catch(std::runtime_error& err) {
        throw cast_error {error_kind::network_unreachable, fmt::format("Unable to send SSDP search: {}", err.what())};
    }

    const auto deadline = steady_clock::now() + timeout;
    std::vector<char> buffer(max_datagram_size);
    while(true)
    {
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        utils::wait_status status = utils::wait_readable(d_sock->get(), remaining, token);
        if(status == utils::wait_status::cancelled)
        {
            result.cancelled = true;
            break;
        }
        else if(status == utils::wait_status::timeout)
        {
            break;
        }

        size_t bytes = 0;
        try {
            bytes = d_sock->read(net::span {buffer.data(), buffer.size()}).first;
        } catch(std::runtime_error& err) {
            logging::warn("SSDP receive failed, ending discovery: {}", err.what());
            break;
        }

        try {
            collector.add_datagram(std::string_view {buffer.data(), bytes});
        } catch(cast_error&) {
            // Only cancellation escapes the collector
            result.cancelled = true;
            break;
        }
    }

    result.devices = collector.take_devices();
    logging::info("Discovery found {} device(s){}", result.devices.size(), result.cancelled ? " before being cancelled" : "");
    return result;
}

} // namespace discovery
