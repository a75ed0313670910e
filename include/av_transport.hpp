#ifndef UPNP_AV_TRANSPORT_HPP
#define UPNP_AV_TRANSPORT_HPP

#include <string>
#include <string_view>
#include <chrono>

#include "upnp_device.hpp"
#include "utils.hpp"

namespace upnp
{

#define AV_TRANSPORT_SERVICE "urn:schemas-upnp-org:service:AVTransport:1"
#define CONTROL_TIME 10000

// Used when a video is started without a title
#define DEFAULT_VIDEO_TITLE "HLS Stream"

struct service_parameter
{
    std::string action;
    std::string body;   // Action arguments after InstanceID, already escaped
};

struct didl_item
{
    std::string title;
    std::string upnp_class;
    std::string mime_type;
    std::string uri;
};

/// DIDL-Lite document describing a single item, values are escaped
std::string build_didl(const didl_item& item);

/// SOAP 1.1 envelope for an AVTransport action on instance 0
std::string build_envelope(const service_parameter& param);

/// application/x-mpegURL for HLS playlists, video/mp2t otherwise
std::string video_mime_type(std::string_view uri);

/// Client side of the AVTransport service.
/// Every action throws utils::cast_error: transport_error for a non-200 answer (with status
/// and body), device_error for a UPnPError inside a 200 answer, timeout, cancelled or
/// network_unreachable from the HTTP exchange.
class av_transport
{
public:

    explicit av_transport(std::chrono::milliseconds timeout = std::chrono::milliseconds {CONTROL_TIME})
        : m_timeout {timeout}
    {}

    void set_content_uri(const utils::cancel_token& token, const upnp_device& device, const std::string& uri) const;

    void set_video_uri(const utils::cancel_token& token, const upnp_device& device, const std::string& uri,
        const std::string& title) const;

    void set_next_uri(const utils::cancel_token& token, const upnp_device& device, const std::string& uri) const;

    void play(const utils::cancel_token& token, const upnp_device& device) const;

    void stop(const utils::cancel_token& token, const upnp_device& device) const;

private:

    void use_service(const utils::cancel_token& token, const upnp_device& device, const service_parameter& param) const;

    std::chrono::milliseconds m_timeout;

};

} // namespace upnp

#endif
