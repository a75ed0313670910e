#include "upnp_device.hpp"
#include "cast_error.hpp"
#include "utils.hpp"

#include <rapidxml/rapidxml.hpp>
#include "fmt/format.h"

#include <algorithm>

using namespace rapidxml;

namespace upnp
{

using utils::cast_error;
using utils::error_kind;

static const char* av_transport_type = "AVTransport";

upnp_device::upnp_device(std::string name, std::string host, uint16_t port, std::string control_url, std::string base_url,
    std::string manufacturer, std::string model)
    : m_name {std::move(name)},
      m_host {std::move(host)},
      m_port {port},
      m_control_url {std::move(control_url)},
      m_base_url {std::move(base_url)},
      m_manufacturer {std::move(manufacturer)},
      m_model {std::move(model)}
{}

std::string upnp_device::to_string() const
{
    return fmt::format("{} ({}:{})", m_name, m_host, m_port);
}

std::optional<upnp_service> find_service(const std::vector<upnp_service>& services, std::string_view service_type)
{
    // DLNA devices typically have around 3 to 4 services, a linear search is fine
    auto it = std::find_if(services.begin(), services.end(), [service_type](const upnp_service& service) {
        return service.type.find(service_type) != std::string::npos;
    });

    if(it != services.end())
        return *it;
    else
        return std::nullopt;
}

static std::string child_value(xml_node<char>* parent, const char* name)
{
    xml_node<char>* node = (parent != nullptr) ? parent->first_node(name) : nullptr;
    if(node == nullptr)
        return {};
    return std::string {utils::trim(std::string_view {node->value(), node->value_size()})};
}

static std::vector<upnp_service> parse_services(xml_node<char>* device_node)
{
    std::vector<upnp_service> services;

    xml_node<char>* service_root = device_node->first_node("serviceList");
    if(service_root == nullptr)
        return services;

    for(xml_node<char>* service_node = service_root->first_node("service"); service_node; service_node = service_node->next_sibling("service"))
    {
        services.push_back(upnp_service {
            child_value(service_node, "serviceType"),
            child_value(service_node, "serviceId"),
            child_value(service_node, "controlURL")
        });
    }

    return services;
}

// Depth first over the device and its embedded devices
static std::optional<upnp_service> find_av_transport(xml_node<char>* device_node)
{
    if(auto service = find_service(parse_services(device_node), av_transport_type); service && !service->control_url.empty())
        return service;

    xml_node<char>* device_list = device_node->first_node("deviceList");
    if(device_list == nullptr)
        return std::nullopt;

    for(xml_node<char>* embedded = device_list->first_node("device"); embedded; embedded = embedded->next_sibling("device"))
    {
        if(auto service = find_av_transport(embedded))
            return service;
    }

    return std::nullopt;
}

static std::string resolve_control_url(const std::string& control_url, const std::string& base_url)
{
    // Anything with a scheme is already absolute
    if(utils::parse_url(control_url))
        return control_url;

    if(utils::starts_with(control_url, "/"))
        return base_url + control_url;
    return fmt::format("{}/{}", base_url, control_url);
}

upnp_device decode_description(std::string_view xml, const std::string& location)
{
    auto location_url = utils::parse_url(location);
    if(!location_url)
        throw cast_error {error_kind::malformed_response, fmt::format("Invalid description location {}", location)};

    // rapidxml parses in place and needs a terminated buffer
    std::vector<char> buffer(xml.begin(), xml.end());
    buffer.push_back('\0');

    xml_document<char> doc;
    try {
        doc.parse<parse_trim_whitespace>(buffer.data());
    } catch(rapidxml::parse_error& err) {
        throw cast_error {error_kind::malformed_response, fmt::format("Invalid device description from {}: {}", location, err.what())};
    }

    xml_node<char>* root_node = doc.first_node("root");
    if(root_node == nullptr)
        root_node = doc.first_node();
    xml_node<char>* device_node = (root_node != nullptr) ? root_node->first_node("device") : nullptr;
    if(device_node == nullptr)
        throw cast_error {error_kind::malformed_response, fmt::format("Description from {} has no device element", location)};

    std::string base_url = child_value(root_node, "URLBase");
    if(base_url.empty())
        base_url = fmt::format("{}://{}", location_url->scheme, location_url->authority());
    if(utils::ends_with(base_url, "/"))
        base_url.pop_back();

    auto service = find_av_transport(device_node);
    if(!service)
        throw cast_error {error_kind::no_control_service, fmt::format("No AVTransport service found in description from {}", location)};

    return upnp_device {
        child_value(device_node, "friendlyName"),
        location_url->host,
        location_url->effective_port(),
        resolve_control_url(service->control_url, base_url),
        base_url,
        child_value(device_node, "manufacturer"),
        child_value(device_node, "modelName")
    };
}

} // namespace upnp
