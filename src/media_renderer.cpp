#include "media_renderer.hpp"
#include "cast_error.hpp"
#include "logging.hpp"

namespace upnp
{

using utils::cast_error;

// Runs one step of an operation and tags its failure with the step name
template<typename Func>
static void run_step(const char* step, Func&& func)
{
    try {
        func();
    } catch(cast_error& err) {
        throw err.with_context(step);
    }
}

media_renderer::media_renderer(const config::renderer_config& cfg)
    : media_renderer {cfg, config::address_provider(cfg)}
{}

media_renderer::media_renderer(const config::renderer_config& cfg, const utils::address_provider& address)
    : m_server {media::server_options {cfg.server_port, cfg.store_capacity}, address},
      m_transport {cfg.control_timeout},
      m_jpeg_quality {cfg.jpeg_quality}
{}

media_renderer::~media_renderer()
{
    close();
}

void media_renderer::display_image(const utils::cancel_token& token, const upnp_device& device, const imaging::image& img)
{
    std::string jpeg;
    run_step("encode JPEG", [&]() {
        jpeg = imaging::encode_jpeg(img, m_jpeg_quality);
    });

    display_jpeg(token, device, std::move(jpeg));
}

void media_renderer::display_jpeg(const utils::cancel_token& token, const upnp_device& device, std::string jpeg)
{
    std::lock_guard<std::mutex> lock {m_mutex};

    std::string image_url;
    run_step("store", [&]() {
        image_url = m_server.store(std::move(jpeg));
    });

    // Always play again, otherwise the device keeps showing the previous image
    run_step("set URI", [&]() {
        m_transport.set_content_uri(token, device, image_url);
    });
    run_step("play", [&]() {
        m_transport.play(token, device);
    });

    logging::debug("Showing {} on {}", image_url, device.to_string());
}

void media_renderer::display_stream_frame(const utils::cancel_token& token, const upnp_device& device, std::string jpeg)
{
    std::lock_guard<std::mutex> lock {m_mutex};

    m_server.update_stream(std::move(jpeg));

    if(m_streaming.count(device.control_url()) != 0)
        return;

    const std::string stream_url = m_server.stream_url();
    run_step("set stream URI", [&]() {
        m_transport.set_content_uri(token, device, stream_url);
    });
    run_step("play stream", [&]() {
        m_transport.play(token, device);
    });

    m_streaming.insert(device.control_url());
    logging::info("Streaming {} to {}", stream_url, device.to_string());
}

void media_renderer::display_remote_video(const utils::cancel_token& token, const upnp_device& device, const std::string& url,
    const std::string& title)
{
    std::lock_guard<std::mutex> lock {m_mutex};

    run_step("set video URI", [&]() {
        m_transport.set_video_uri(token, device, url, title);
    });
    run_step("play", [&]() {
        m_transport.play(token, device);
    });

    logging::debug("Playing {} on {}", url, device.to_string());
}

void media_renderer::stop(const utils::cancel_token& token, const upnp_device& device)
{
    std::lock_guard<std::mutex> lock {m_mutex};

    m_streaming.erase(device.control_url());
    run_step("stop", [&]() {
        m_transport.stop(token, device);
    });
}

bool media_renderer::streaming_to(const upnp_device& device) const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return m_streaming.count(device.control_url()) != 0;
}

std::string media_renderer::server_url() const
{
    return m_server.url();
}

std::string media_renderer::stream_url() const
{
    return m_server.stream_url();
}

void media_renderer::close()
{
    m_server.close();
}

} // namespace upnp
