#ifndef IMAGING_JPEG_ENCODER_HPP
#define IMAGING_JPEG_ENCODER_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace imaging
{

#define DEFAULT_JPEG_QUALITY 85

enum class pixel_format
{
    rgba,
    bgra,
    rgb,
    gray
};

size_t bytes_per_pixel(pixel_format format);

/// Tightly packed pixel buffer handed over by callers
struct image
{
    uint32_t width = 0;
    uint32_t height = 0;
    pixel_format format = pixel_format::rgba;
    std::vector<uint8_t> pixels;
};

/// Solid color helper, mostly used for placeholders and tests
image solid_image(uint32_t width, uint32_t height, uint8_t r, uint8_t g, uint8_t b);

/// Encodes to a baseline JPEG. Transparent pixels are composed onto black first.
/// quality ranges from 1 (worst) to 100 (best).
/// Throws utils::cast_error(encode_error) on invalid buffers or encoder failures.
std::string encode_jpeg(const image& img, int quality = DEFAULT_JPEG_QUALITY);

} // namespace imaging

#endif
