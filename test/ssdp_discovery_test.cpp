#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <chrono>

#include "ssdp_discovery.hpp"
#include "http/client.hpp"
#include "cast_error.hpp"

#include "mock_device.hpp"

using namespace std::chrono_literals;

static const char* renderer_description =
    "<?xml version=\"1.0\"?>"
    "<root xmlns=\"urn:schemas-upnp-org:device-1-0\"><device>"
    "<friendlyName>Bedroom TV</friendlyName>"
    "<serviceList><service>"
    "<serviceType>urn:schemas-upnp-org:service:AVTransport:1</serviceType>"
    "<serviceId>urn:upnp-org:serviceId:AVTransport</serviceId>"
    "<controlURL>/AVTransport/control</controlURL>"
    "</service></serviceList>"
    "</device></root>";

static std::string datagram(const std::string& location)
{
    return "HTTP/1.1 200 OK\r\n"
        "CACHE-CONTROL: max-age=1800\r\n"
        "EXT:\r\n"
        "location: " + location + "\r\n"
        "SERVER: Linux/4.0 UPnP/1.0 Renderer/1.0\r\n"
        "ST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n"
        "USN: uuid:1234::urn:schemas-upnp-org:device:MediaRenderer:1\r\n"
        "\r\n";
}

TEST(SsdpParseTest, ParsesHeadersCaseInsensitive)
{
    auto res = discovery::parse_response(datagram("http://192.168.0.10:1400/xml/device_description.xml"));
    ASSERT_TRUE(res.has_value());

    EXPECT_EQ(res->location, "http://192.168.0.10:1400/xml/device_description.xml");
    EXPECT_EQ(res->cache_control, "max-age=1800");
    EXPECT_EQ(res->server, "Linux/4.0 UPnP/1.0 Renderer/1.0");
    EXPECT_EQ(res->st, "urn:schemas-upnp-org:device:MediaRenderer:1");
    EXPECT_EQ(res->usn, "uuid:1234::urn:schemas-upnp-org:device:MediaRenderer:1");
}

TEST(SsdpParseTest, RejectsDatagramsWithoutLocation)
{
    EXPECT_FALSE(discovery::parse_response("HTTP/1.1 200 OK\r\nST: upnp:rootdevice\r\n\r\n").has_value());
    EXPECT_FALSE(discovery::parse_response("garbage").has_value());
    EXPECT_FALSE(discovery::parse_response("").has_value());
}

TEST(SsdpParseTest, SearchMessage)
{
    std::string msg = discovery::build_search(MEDIA_RENDERER_ST);

    EXPECT_EQ(msg.rfind("M-SEARCH * HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(msg.find("HOST: 239.255.255.250:1900\r\n"), std::string::npos);
    EXPECT_NE(msg.find("MAN: \"ssdp:discover\"\r\n"), std::string::npos);
    EXPECT_NE(msg.find("MX: 2\r\n"), std::string::npos);
    EXPECT_NE(msg.find("ST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n"), std::string::npos);
    EXPECT_TRUE(utils::ends_with(msg, "\r\n\r\n"));
}

class DeviceCollectorTest : public ::testing::Test
{
protected:

    void SetUp() override
    {
        m_device.respond_with([](const http::request& req) {
            if(req.get_path() != "/description.xml")
                return http::response {404};

            http::response res {200};
            res.set_header("Content-Type", "text/xml");
            res.set_body(renderer_description);
            return res;
        });
    }

    using device_collector_fetcher = discovery::device_collector::fetcher;

    device_collector_fetcher fetcher()
    {
        return [this](const std::string& location) {
            return http::get(location, 2000ms, m_token);
        };
    }

    test::mock_device m_device;

    utils::cancel_token m_token;
};

TEST_F(DeviceCollectorTest, FetchesEachLocationOnce)
{
    discovery::device_collector collector {fetcher()};
    std::string location = m_device.url("/description.xml");

    EXPECT_TRUE(collector.add_datagram(datagram(location)));
    EXPECT_FALSE(collector.add_datagram(datagram(location)));
    EXPECT_FALSE(collector.add_datagram(datagram(location)));

    ASSERT_EQ(collector.devices().size(), 1u);
    EXPECT_EQ(collector.devices()[0].name(), "Bedroom TV");
    EXPECT_EQ(collector.devices()[0].control_url(), m_device.url("/AVTransport/control"));
    EXPECT_EQ(m_device.requests().size(), 1u);
}

TEST_F(DeviceCollectorTest, SkipsFailingDevices)
{
    discovery::device_collector collector {fetcher()};

    EXPECT_FALSE(collector.add_datagram(datagram(m_device.url("/missing.xml"))));
    EXPECT_FALSE(collector.add_datagram("HTTP/1.1 200 OK\r\nST: upnp:rootdevice\r\n\r\n"));
    EXPECT_TRUE(collector.add_datagram(datagram(m_device.url("/description.xml"))));

    auto devices = collector.take_devices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].port(), m_device.port());
}

TEST_F(DeviceCollectorTest, SkipsDescriptionWithoutAvTransport)
{
    m_device.respond_with([](const http::request&) {
        http::response res {200};
        res.set_body("<root><device><friendlyName>Speaker</friendlyName></device></root>");
        return res;
    });

    discovery::device_collector collector {fetcher()};
    EXPECT_FALSE(collector.add_datagram(datagram(m_device.url("/description.xml"))));
    EXPECT_TRUE(collector.devices().empty());
}

TEST_F(DeviceCollectorTest, CancellationPropagates)
{
    m_token.cancel();
    discovery::device_collector collector {fetcher()};

    try {
        collector.add_datagram(datagram(m_device.url("/description.xml")));
        FAIL() << "cancellation was swallowed";
    } catch(utils::cast_error& err) {
        EXPECT_EQ(err.kind(), utils::error_kind::cancelled);
    }
}

TEST_F(DeviceCollectorTest, CancelledFetchKeepsEarlierDevices)
{
    test::mock_device slow;
    slow.respond_with([](const http::request&) {
        std::this_thread::sleep_for(1500ms);
        return http::response {200};
    });

    discovery::device_collector collector {fetcher()};
    EXPECT_TRUE(collector.add_datagram(datagram(m_device.url("/description.xml"))));

    std::thread canceller {[this]() {
        std::this_thread::sleep_for(100ms);
        m_token.cancel();
    }};

    auto start = std::chrono::steady_clock::now();
    try {
        collector.add_datagram(datagram(slow.url("/description.xml")));
        ADD_FAILURE() << "cancellation was swallowed";
    } catch(utils::cast_error& err) {
        EXPECT_EQ(err.kind(), utils::error_kind::cancelled);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
    canceller.join();

    auto devices = collector.take_devices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].name(), "Bedroom TV");
}

TEST(DiscoverTest, CancelledSearchReturnsEarly)
{
    utils::cancel_token token;
    token.cancel();

    auto start = std::chrono::steady_clock::now();
    try {
        discovery::discovery_result result = discovery::discover(5000ms, token);
        EXPECT_TRUE(result.cancelled);
        EXPECT_TRUE(result.devices.empty());
    } catch(utils::cast_error& err) {
        // Hosts without a multicast route can not even send the search
        EXPECT_EQ(err.kind(), utils::error_kind::network_unreachable);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
}
