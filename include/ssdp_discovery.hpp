#ifndef SSDP_DISCOVERY_HPP
#define SSDP_DISCOVERY_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <functional>
#include <unordered_set>
#include <chrono>

#include "http/response.hpp"
#include "upnp_device.hpp"
#include "utils.hpp"

namespace discovery
{

#define DISCOVERY_IP "239.255.255.250"
#define DISCOVERY_PORT 1900
#define DISCOVERY_TIME 5000
#define DESCRIPTION_TIME 5000

#define MEDIA_RENDERER_ST "urn:schemas-upnp-org:device:MediaRenderer:1"

struct ssdp_res
{
    std::string location;
    std::string cache_control;
    std::string server;
    std::string usn;
    std::string st;
};

/// Parses the header block of an SSDP response datagram.
/// Returns nullopt for datagrams without a header line or without LOCATION.
std::optional<ssdp_res> parse_response(std::string_view view);

/// Builds the M-SEARCH datagram for a search target
std::string build_search(const std::string& service_type, int mx = 2);

/// Turns SSDP responses into devices: deduplicates by location, fetches and
/// decodes each description once and skips every device that fails.
class device_collector
{
public:
    using fetcher = std::function<http::response(const std::string& location)>;

    device_collector() = delete;
    device_collector(const device_collector&) = delete;
    device_collector& operator=(const device_collector&) = delete;

    explicit device_collector(fetcher fetch);

    /// Returns true if the datagram announced a new, usable device.
    /// Only a cancelled fetch propagates out of here.
    bool add_datagram(std::string_view datagram);

    const std::vector<upnp::upnp_device>& devices() const
    {
        return m_devices;
    }

    std::vector<upnp::upnp_device> take_devices()
    {
        return std::move(m_devices);
    }

private:

    fetcher m_fetch;

    std::unordered_set<std::string> m_seen;

    std::vector<upnp::upnp_device> m_devices;

};

struct discovery_result
{
    std::vector<upnp::upnp_device> devices;
    bool cancelled = false;
};

/// Searches the LAN for media renderers until timeout elapses or the token fires.
/// Devices found before a cancellation are returned together with the cancelled flag.
/// Throws utils::cast_error(network_unreachable) only if the search socket fails.
discovery_result discover(std::chrono::milliseconds timeout, const utils::cancel_token& token,
    std::chrono::milliseconds description_timeout = std::chrono::milliseconds {DESCRIPTION_TIME});

} // namespace discovery

#endif
