#include "imaging/jpeg_encoder.hpp"
#include "cast_error.hpp"

#include "fmt/format.h"

#include <memory>
#include <algorithm>

extern "C"
{
    #include <libavcodec/avcodec.h>
    #include <libswscale/swscale.h>
    #include <libavutil/frame.h>
    #include <libavutil/imgutils.h>
}

namespace imaging
{

using utils::cast_error;
using utils::error_kind;

struct codec_context_deleter
{
    void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};

struct frame_deleter
{
    void operator()(AVFrame* frame) const { av_frame_free(&frame); }
};

struct packet_deleter
{
    void operator()(AVPacket* packet) const { av_packet_free(&packet); }
};

struct sws_deleter
{
    void operator()(SwsContext* ctx) const { sws_freeContext(ctx); }
};

size_t bytes_per_pixel(pixel_format format)
{
    switch(format)
    {
        case pixel_format::rgba: return 4;
        case pixel_format::bgra: return 4;
        case pixel_format::rgb: return 3;
        case pixel_format::gray: return 1;
    }
    return 0;
}

image solid_image(uint32_t width, uint32_t height, uint8_t r, uint8_t g, uint8_t b)
{
    image img {width, height, pixel_format::rgb, {}};
    img.pixels.reserve(static_cast<size_t>(width) * height * 3);
    for(size_t i = 0; i < static_cast<size_t>(width) * height; ++i)
    {
        img.pixels.push_back(r);
        img.pixels.push_back(g);
        img.pixels.push_back(b);
    }
    return img;
}

// Drops the alpha channel by composing every pixel onto black
static std::vector<uint8_t> to_opaque_rgb(const image& img)
{
    const size_t count = static_cast<size_t>(img.width) * img.height;
    const size_t bpp = bytes_per_pixel(img.format);
    std::vector<uint8_t> rgb(count * 3);

    for(size_t i = 0; i < count; ++i)
    {
        const uint8_t* px = img.pixels.data() + i * bpp;
        uint8_t* out = rgb.data() + i * 3;
        switch(img.format)
        {
            case pixel_format::rgba:
                out[0] = static_cast<uint8_t>(px[0] * px[3] / 255);
                out[1] = static_cast<uint8_t>(px[1] * px[3] / 255);
                out[2] = static_cast<uint8_t>(px[2] * px[3] / 255);
                break;
            case pixel_format::bgra:
                out[0] = static_cast<uint8_t>(px[2] * px[3] / 255);
                out[1] = static_cast<uint8_t>(px[1] * px[3] / 255);
                out[2] = static_cast<uint8_t>(px[0] * px[3] / 255);
                break;
            case pixel_format::rgb:
                std::copy(px, px + 3, out);
                break;
            case pixel_format::gray:
                std::fill(out, out + 3, px[0]);
                break;
        }
    }

    return rgb;
}

// Maps 1..100 onto the MJPEG quantiser scale 31..2
static int quality_to_qscale(int quality)
{
    quality = std::clamp(quality, 1, 100);
    return 2 + (100 - quality) * 29 / 99;
}

std::string encode_jpeg(const image& img, int quality)
{
    if(img.width == 0 || img.height == 0)
        throw cast_error {error_kind::encode_error, "Image has no pixels"};
    if(img.pixels.size() != static_cast<size_t>(img.width) * img.height * bytes_per_pixel(img.format))
    {
        throw cast_error {error_kind::encode_error, fmt::format("Pixel buffer of {} bytes does not match {}x{} image",
            img.pixels.size(), img.width, img.height)};
    }

    const int width = static_cast<int>(img.width);
    const int height = static_cast<int>(img.height);
    std::vector<uint8_t> rgb = to_opaque_rgb(img);

    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_MJPEG);
    if(codec == nullptr)
        throw cast_error {error_kind::encode_error, "MJPEG encoder not available"};

    std::unique_ptr<AVCodecContext, codec_context_deleter> codec_ctx {avcodec_alloc_context3(codec)};
    if(!codec_ctx)
        throw cast_error {error_kind::encode_error, "Unable to allocate encoder context"};

    codec_ctx->width = width;
    codec_ctx->height = height;
    codec_ctx->pix_fmt = AV_PIX_FMT_YUVJ420P;
    codec_ctx->color_range = AVCOL_RANGE_JPEG;
    codec_ctx->time_base = AVRational {1, 25};
    codec_ctx->flags |= AV_CODEC_FLAG_QSCALE;
    codec_ctx->global_quality = FF_QP2LAMBDA * quality_to_qscale(quality);

    if(avcodec_open2(codec_ctx.get(), codec, nullptr) < 0)
        throw cast_error {error_kind::encode_error, "Unable to open MJPEG encoder"};

    std::unique_ptr<AVFrame, frame_deleter> frame {av_frame_alloc()};
    if(!frame)
        throw cast_error {error_kind::encode_error, "Unable to allocate frame"};
    frame->format = codec_ctx->pix_fmt;
    frame->width = width;
    frame->height = height;
    frame->quality = codec_ctx->global_quality;
    frame->pts = 0;
    if(av_frame_get_buffer(frame.get(), 0) < 0)
        throw cast_error {error_kind::encode_error, "Unable to allocate frame buffer"};

    std::unique_ptr<SwsContext, sws_deleter> sws_ctx {sws_getContext(width, height, AV_PIX_FMT_RGB24,
        width, height, AV_PIX_FMT_YUVJ420P, SWS_BICUBIC, nullptr, nullptr, nullptr)};
    if(!sws_ctx)
        throw cast_error {error_kind::encode_error, "Unable to create pixel format converter"};

    const uint8_t* src_data[1] = {rgb.data()};
    const int src_linesize[1] = {width * 3};
    sws_scale(sws_ctx.get(), src_data, src_linesize, 0, height, frame->data, frame->linesize);

    if(avcodec_send_frame(codec_ctx.get(), frame.get()) < 0 || avcodec_send_frame(codec_ctx.get(), nullptr) < 0)
        throw cast_error {error_kind::encode_error, "Unable to encode frame"};

    std::unique_ptr<AVPacket, packet_deleter> packet {av_packet_alloc()};
    if(!packet)
        throw cast_error {error_kind::encode_error, "Unable to allocate packet"};

    std::string jpeg;
    while(avcodec_receive_packet(codec_ctx.get(), packet.get()) == 0)
    {
        jpeg.append(reinterpret_cast<const char*>(packet->data), static_cast<size_t>(packet->size));
        av_packet_unref(packet.get());
    }

    if(jpeg.empty())
        throw cast_error {error_kind::encode_error, "Encoder produced no data"};

    return jpeg;
}

} // namespace imaging
