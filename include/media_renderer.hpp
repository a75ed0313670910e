#ifndef UPNP_MEDIA_RENDERER_HPP
#define UPNP_MEDIA_RENDERER_HPP

#include <string>
#include <mutex>
#include <unordered_set>

#include "av_transport.hpp"
#include "media_server.hpp"
#include "upnp_device.hpp"
#include "imaging/jpeg_encoder.hpp"
#include "config.hpp"
#include "utils.hpp"

namespace upnp
{

/// Shows images and videos on renderers.
/// Every public operation holds one renderer-wide lock, so the store step and the
/// control calls of one operation never interleave with another operation.
/// Failures throw utils::cast_error naming the failed step.
class media_renderer
{
public:
    media_renderer(const media_renderer&) = delete;
    media_renderer& operator=(const media_renderer&) = delete;
    media_renderer(media_renderer&&) = delete;
    media_renderer& operator=(media_renderer&&) = delete;
    ~media_renderer();

    /// Starts the embedded media server. The address provider defaults to the configured
    /// advertise address or local address detection.
    explicit media_renderer(const config::renderer_config& cfg = {});

    media_renderer(const config::renderer_config& cfg, const utils::address_provider& address);

    void display_image(const utils::cancel_token& token, const upnp_device& device, const imaging::image& img);

    void display_jpeg(const utils::cancel_token& token, const upnp_device& device, std::string jpeg);

    /// Replaces the stream frame. Playback is only started on the first frame for a
    /// device, later frames rely on the device fetching the stream url again.
    void display_stream_frame(const utils::cancel_token& token, const upnp_device& device, std::string jpeg);

    /// The device fetches the video itself, the media server is not involved
    void display_remote_video(const utils::cancel_token& token, const upnp_device& device, const std::string& url,
        const std::string& title);

    void display_video(const utils::cancel_token& token, const upnp_device& device, const std::string& url,
        const std::string& title)
    {
        display_remote_video(token, device, url, title);
    }

    void stop(const utils::cancel_token& token, const upnp_device& device);

    bool streaming_to(const upnp_device& device) const;

    std::string server_url() const;

    std::string stream_url() const;

    size_t stored_count() const
    {
        return m_server.stored_count();
    }

    void close();

private:

    media::media_server m_server;

    av_transport m_transport;

    int m_jpeg_quality;

    mutable std::mutex m_mutex;

    // Control urls of devices already playing the stream url
    std::unordered_set<std::string> m_streaming;

};

} // namespace upnp

#endif
