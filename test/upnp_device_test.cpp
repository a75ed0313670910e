#include <gtest/gtest.h>

#include <string>

#include "upnp_device.hpp"
#include "cast_error.hpp"

using upnp::decode_description;
using utils::error_kind;

static std::string description(const std::string& url_base, const std::string& services, const std::string& embedded = "")
{
    return "<?xml version=\"1.0\"?>\n"
        "<root xmlns=\"urn:schemas-upnp-org:device-1-0\">\n"
        "  <specVersion><major>1</major><minor>0</minor></specVersion>\n" + url_base +
        "  <device>\n"
        "    <deviceType>urn:schemas-upnp-org:device:MediaRenderer:1</deviceType>\n"
        "    <friendlyName> Living Room TV </friendlyName>\n"
        "    <manufacturer>Samsung Electronics</manufacturer>\n"
        "    <modelName>UE55</modelName>\n"
        "    <serviceList>" + services + "</serviceList>\n" + embedded +
        "  </device>\n"
        "</root>\n";
}

static std::string service(const std::string& type, const std::string& control_url)
{
    return "<service><serviceType>" + type + "</serviceType><serviceId>urn:upnp-org:serviceId:x</serviceId>"
        "<SCPDURL>/scpd.xml</SCPDURL><controlURL>" + control_url + "</controlURL></service>";
}

static const std::string av_transport = "urn:schemas-upnp-org:service:AVTransport:1";
static const std::string rendering_control = "urn:schemas-upnp-org:service:RenderingControl:1";

static error_kind decode_error(const std::string& xml, const std::string& location)
{
    try {
        decode_description(xml, location);
    } catch(utils::cast_error& err) {
        return err.kind();
    }
    ADD_FAILURE() << "description decoded without error";
    return error_kind::cancelled;
}

TEST(DescriptionTest, RelativeControlUrl)
{
    std::string xml = description("", service(rendering_control, "/rc") + service(av_transport, "/upnp/control/AVTransport1"));
    auto device = decode_description(xml, "http://192.168.1.50:9197/dmr");

    EXPECT_EQ(device.name(), "Living Room TV");
    EXPECT_EQ(device.host(), "192.168.1.50");
    EXPECT_EQ(device.port(), 9197);
    EXPECT_EQ(device.base_url(), "http://192.168.1.50:9197");
    EXPECT_EQ(device.control_url(), "http://192.168.1.50:9197/upnp/control/AVTransport1");
    EXPECT_EQ(device.manufacturer(), "Samsung Electronics");
    EXPECT_EQ(device.model(), "UE55");
    EXPECT_EQ(device.to_string(), "Living Room TV (192.168.1.50:9197)");
}

TEST(DescriptionTest, ControlUrlWithoutLeadingSlash)
{
    std::string xml = description("", service(av_transport, "AVTransport/control"));
    auto device = decode_description(xml, "http://10.0.0.3:8080/desc.xml");

    EXPECT_EQ(device.control_url(), "http://10.0.0.3:8080/AVTransport/control");
}

TEST(DescriptionTest, AbsoluteControlUrlIsKept)
{
    std::string xml = description("", service(av_transport, "http://10.0.0.9:1400/MediaRenderer/AVTransport/Control"));
    auto device = decode_description(xml, "http://10.0.0.3:8080/desc.xml");

    EXPECT_EQ(device.control_url(), "http://10.0.0.9:1400/MediaRenderer/AVTransport/Control");
    EXPECT_EQ(device.host(), "10.0.0.3");
}

TEST(DescriptionTest, AnySchemeMakesControlUrlAbsolute)
{
    std::string xml = description("", service(av_transport, "HTTPS://10.0.0.9:1400/AVTransport/Control"));
    EXPECT_EQ(decode_description(xml, "http://10.0.0.3:8080/desc.xml").control_url(), "HTTPS://10.0.0.9:1400/AVTransport/Control");

    xml = description("", service(av_transport, "soap://10.0.0.9/ctl"));
    EXPECT_EQ(decode_description(xml, "http://10.0.0.3:8080/desc.xml").control_url(), "soap://10.0.0.9/ctl");
}

TEST(DescriptionTest, RelativeControlUrlWithUrlInQuery)
{
    std::string xml = description("", service(av_transport, "/ctl?next=http://10.0.0.9/"));
    auto device = decode_description(xml, "http://10.0.0.3:8080/desc.xml");

    EXPECT_EQ(device.control_url(), "http://10.0.0.3:8080/ctl?next=http://10.0.0.9/");
}

TEST(DescriptionTest, Ipv6LocationKeepsBrackets)
{
    std::string xml = description("", service(av_transport, "/upnp/av"));
    auto device = decode_description(xml, "http://[fe80::1]:1400/xml/device_description.xml");

    EXPECT_EQ(device.host(), "fe80::1");
    EXPECT_EQ(device.base_url(), "http://[fe80::1]:1400");
    EXPECT_EQ(device.control_url(), "http://[fe80::1]:1400/upnp/av");
}

TEST(DescriptionTest, UrlBaseOverridesLocation)
{
    std::string xml = description("<URLBase>http://10.0.0.4:7676/</URLBase>\n", service(av_transport, "/av/control"));
    auto device = decode_description(xml, "http://10.0.0.3:8080/desc.xml");

    EXPECT_EQ(device.base_url(), "http://10.0.0.4:7676");
    EXPECT_EQ(device.control_url(), "http://10.0.0.4:7676/av/control");
}

TEST(DescriptionTest, PortDefaultsTo80)
{
    std::string xml = description("", service(av_transport, "/ctl"));
    auto device = decode_description(xml, "http://tv.local/description.xml");

    EXPECT_EQ(device.port(), 80);
    EXPECT_EQ(device.control_url(), "http://tv.local/ctl");
}

TEST(DescriptionTest, EmbeddedDeviceService)
{
    std::string embedded =
        "<deviceList><device><deviceType>urn:schemas-upnp-org:device:MediaRenderer:1</deviceType>"
        "<friendlyName>Inner</friendlyName><serviceList>" + service(av_transport, "/inner/av") + "</serviceList>"
        "</device></deviceList>\n";
    std::string xml = description("", service(rendering_control, "/rc"), embedded);
    auto device = decode_description(xml, "http://10.0.0.3:8080/desc.xml");

    EXPECT_EQ(device.name(), "Living Room TV");
    EXPECT_EQ(device.control_url(), "http://10.0.0.3:8080/inner/av");
}

TEST(DescriptionTest, MissingAvTransport)
{
    std::string xml = description("", service(rendering_control, "/rc"));
    EXPECT_EQ(decode_error(xml, "http://10.0.0.3:8080/desc.xml"), error_kind::no_control_service);
}

TEST(DescriptionTest, EmptyControlUrlCountsAsMissing)
{
    std::string xml = description("", service(av_transport, ""));
    EXPECT_EQ(decode_error(xml, "http://10.0.0.3:8080/desc.xml"), error_kind::no_control_service);
}

TEST(DescriptionTest, MalformedXml)
{
    EXPECT_EQ(decode_error("<root><device><friendlyName>TV</device>", "http://10.0.0.3/d.xml"), error_kind::malformed_response);
    EXPECT_EQ(decode_error("<root><specVersion/></root>", "http://10.0.0.3/d.xml"), error_kind::malformed_response);
    EXPECT_EQ(decode_error("", "http://10.0.0.3/d.xml"), error_kind::malformed_response);
}

TEST(DescriptionTest, FindServiceMatchesSubstring)
{
    std::vector<upnp::upnp_service> services {
        {rendering_control, "urn:upnp-org:serviceId:RenderingControl", "/rc"},
        {av_transport, "urn:upnp-org:serviceId:AVTransport", "/av"}
    };

    auto found = upnp::find_service(services, "AVTransport");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->control_url, "/av");
    EXPECT_FALSE(upnp::find_service(services, "ConnectionManager").has_value());
}
