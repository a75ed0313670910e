#ifndef TVCAST_CONFIG_HPP
#define TVCAST_CONFIG_HPP

#include <string>
#include <chrono>
#include <cstdint>

#include <nlohmann/json.hpp>

#include "av_transport.hpp"
#include "media_server.hpp"
#include "ssdp_discovery.hpp"
#include "imaging/jpeg_encoder.hpp"
#include "logging.hpp"
#include "utils.hpp"

using nlohmann::json;

namespace config
{

struct renderer_config
{
    std::chrono::milliseconds discovery_timeout {DISCOVERY_TIME};
    std::chrono::milliseconds description_timeout {DESCRIPTION_TIME};
    std::chrono::milliseconds control_timeout {CONTROL_TIME};
    uint16_t server_port = 0;               // 0 picks a free port
    std::string advertise_address;          // empty detects the local address
    size_t store_capacity = STORE_CAPACITY;
    int jpeg_quality = DEFAULT_JPEG_QUALITY;
    logging::level log_level = logging::level::info;
};

/// All keys are optional. Throws std::invalid_argument for wrong types or values.
renderer_config from_json(const json& j);

/// Throws std::invalid_argument if the file can not be read or parsed
renderer_config load_config(const std::string& path);

/// Fixed advertise address if configured, local address detection otherwise
utils::address_provider address_provider(const renderer_config& cfg);

} // namespace config

#endif
