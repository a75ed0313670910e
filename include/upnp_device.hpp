#ifndef UPNP_DEVICE_HPP
#define UPNP_DEVICE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>

namespace upnp
{

struct upnp_service
{
    std::string type;
    std::string id;
    std::string control_url;
};

/// Identity and routing information of one media renderer.
/// Never modified after construction, so it can be shared between threads.
class upnp_device
{
public:

    upnp_device() = delete;
    upnp_device(const upnp_device&) = default;
    upnp_device& operator=(const upnp_device&) = default;
    upnp_device(upnp_device&&) = default;
    upnp_device& operator=(upnp_device&&) = default;
    ~upnp_device() = default;

    upnp_device(std::string name, std::string host, uint16_t port, std::string control_url, std::string base_url,
        std::string manufacturer = {}, std::string model = {});

    const std::string& name() const
    {
        return m_name;
    }

    const std::string& host() const
    {
        return m_host;
    }

    uint16_t port() const
    {
        return m_port;
    }

    /// Absolute url of the AVTransport control service
    const std::string& control_url() const
    {
        return m_control_url;
    }

    const std::string& base_url() const
    {
        return m_base_url;
    }

    const std::string& manufacturer() const
    {
        return m_manufacturer;
    }

    const std::string& model() const
    {
        return m_model;
    }

    std::string to_string() const;

private:

    std::string m_name;

    std::string m_host;

    uint16_t m_port;

    std::string m_control_url;

    std::string m_base_url;

    std::string m_manufacturer;

    std::string m_model;

};

/// First service whose type contains service_type
std::optional<upnp_service> find_service(const std::vector<upnp_service>& services, std::string_view service_type);

/// Decodes a UPnP device description fetched from location.
/// Throws utils::cast_error with malformed_response for unparsable documents and
/// no_control_service if no AVTransport service is announced.
upnp_device decode_description(std::string_view xml, const std::string& location);

} // namespace upnp

#endif
