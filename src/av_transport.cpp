#include "av_transport.hpp"
#include "http/client.hpp"
#include "cast_error.hpp"
#include "logging.hpp"

#include "fmt/format.h"

namespace upnp
{

using utils::cast_error;
using utils::error_kind;
using utils::escape_xml;

static const char* image_class = "object.item.imageItem.photo";
static const char* video_class = "object.item.videoItem";

static didl_item image_item(const std::string& uri)
{
    return didl_item {"Image", image_class, "image/jpeg", uri};
}

std::string build_didl(const didl_item& item)
{
    return fmt::format(
        "<DIDL-Lite xmlns=\"urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/\" xmlns:dc=\"http://purl.org/dc/elements/1.1/\" xmlns:upnp=\"urn:schemas-upnp-org:metadata-1-0/upnp/\">"
        "<item id=\"1\" parentID=\"0\" restricted=\"1\"><dc:title>{}</dc:title><upnp:class>{}</upnp:class>"
        "<res protocolInfo=\"http-get:*:{}:*\">{}</res></item></DIDL-Lite>",
        escape_xml(item.title),
        item.upnp_class,
        item.mime_type,
        escape_xml(item.uri)
    );
}

std::string build_envelope(const service_parameter& param)
{
    return fmt::format(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
        "<s:Body><u:{0} xmlns:u=\"{1}\"><InstanceID>0</InstanceID>{2}</u:{0}></s:Body></s:Envelope>",
        param.action,
        AV_TRANSPORT_SERVICE,
        param.body
    );
}

std::string video_mime_type(std::string_view uri)
{
    // HLS playlists may also be announced through query parameters
    if(utils::ends_with(uri, ".m3u8") || uri.find("m3u8") != std::string_view::npos)
        return "application/x-mpegURL";
    return "video/mp2t";
}

// The metadata document is embedded as text, so it is escaped a second time
static std::string uri_arguments(const char* uri_tag, const char* metadata_tag, const std::string& uri, const didl_item& item)
{
    return fmt::format("<{0}>{1}</{0}><{2}>{3}</{2}>", uri_tag, escape_xml(uri), metadata_tag, escape_xml(build_didl(item)));
}

void av_transport::set_content_uri(const utils::cancel_token& token, const upnp_device& device, const std::string& uri) const
{
    use_service(token, device, service_parameter {
        "SetAVTransportURI", uri_arguments("CurrentURI", "CurrentURIMetaData", uri, image_item(uri))
    });
}

void av_transport::set_video_uri(const utils::cancel_token& token, const upnp_device& device, const std::string& uri,
    const std::string& title) const
{
    didl_item item {title.empty() ? DEFAULT_VIDEO_TITLE : title, video_class, video_mime_type(uri), uri};
    use_service(token, device, service_parameter {
        "SetAVTransportURI", uri_arguments("CurrentURI", "CurrentURIMetaData", uri, item)
    });
}

void av_transport::set_next_uri(const utils::cancel_token& token, const upnp_device& device, const std::string& uri) const
{
    use_service(token, device, service_parameter {
        "SetNextAVTransportURI", uri_arguments("NextURI", "NextURIMetaData", uri, image_item(uri))
    });
}

void av_transport::play(const utils::cancel_token& token, const upnp_device& device) const
{
    use_service(token, device, service_parameter {"Play", "<Speed>1</Speed>"});
}

void av_transport::stop(const utils::cancel_token& token, const upnp_device& device) const
{
    use_service(token, device, service_parameter {"Stop", ""});
}

void av_transport::use_service(const utils::cancel_token& token, const upnp_device& device, const service_parameter& param) const
{
    http::client_request req;
    req.method = "POST";
    req.url = device.control_url();
    req.headers["Content-Type"] = "text/xml; charset=utf-8";
    req.headers["SOAPAction"] = fmt::format("\"{}#{}\"", AV_TRANSPORT_SERVICE, param.action);
    req.body = build_envelope(param);

    logging::debug("{} -> {}", param.action, device.control_url());
    http::response res = http::send_request(req, m_timeout, token);

    if(res.get_code() != 200)
    {
        throw cast_error {error_kind::transport_error,
            fmt::format("SOAP error: HTTP {}: {}", res.get_code(), res.get_body()), res.get_code(), res.get_body()};
    }

    // Devices report failed actions inside a successful HTTP exchange
    if(res.get_body().find("<UPnPError") != std::string::npos)
        throw cast_error {error_kind::device_error, fmt::format("UPnP error: {}", res.get_body()), res.get_code(), res.get_body()};
}

} // namespace upnp
