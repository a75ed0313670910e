#include "config.hpp"

#include "fmt/format.h"

#include <fstream>
#include <limits>
#include <stdexcept>

namespace config
{

static std::chrono::milliseconds timeout_value(const json& j, const char* key, std::chrono::milliseconds fallback)
{
    long long ms = j.value(key, static_cast<long long>(fallback.count()));
    if(ms <= 0)
        throw std::invalid_argument {fmt::format("{} must be positive", key)};
    return std::chrono::milliseconds {ms};
}

renderer_config from_json(const json& j)
{
    if(!j.is_object())
        throw std::invalid_argument {"Configuration must be a JSON object"};

    renderer_config cfg;
    try {
        cfg.discovery_timeout = timeout_value(j, "discovery_timeout_ms", cfg.discovery_timeout);
        cfg.description_timeout = timeout_value(j, "description_timeout_ms", cfg.description_timeout);
        cfg.control_timeout = timeout_value(j, "control_timeout_ms", cfg.control_timeout);

        int port = j.value("server_port", 0);
        if(port < 0 || port > std::numeric_limits<uint16_t>::max())
            throw std::invalid_argument {fmt::format("server_port {} out of range", port)};
        cfg.server_port = static_cast<uint16_t>(port);

        cfg.advertise_address = j.value("advertise_address", std::string {});

        long long capacity = j.value("store_capacity", static_cast<long long>(cfg.store_capacity));
        if(capacity < 1)
            throw std::invalid_argument {"store_capacity must be at least 1"};
        cfg.store_capacity = static_cast<size_t>(capacity);

        cfg.jpeg_quality = j.value("jpeg_quality", cfg.jpeg_quality);
        if(cfg.jpeg_quality < 1 || cfg.jpeg_quality > 100)
            throw std::invalid_argument {fmt::format("jpeg_quality {} out of range 1..100", cfg.jpeg_quality)};

        if(j.contains("log_level"))
        {
            std::string name = j.at("log_level").get<std::string>();
            auto lvl = logging::level_from_string(name);
            if(!lvl)
                throw std::invalid_argument {fmt::format("Unknown log_level {}", name)};
            cfg.log_level = *lvl;
        }
    } catch(json::exception& err) {
        throw std::invalid_argument {fmt::format("Invalid configuration: {}", err.what())};
    }

    return cfg;
}

renderer_config load_config(const std::string& path)
{
    std::ifstream ifs {path};
    if(!ifs.good())
        throw std::invalid_argument {fmt::format("Unable to open configuration file {}", path)};

    json j;
    try {
        j = json::parse(ifs);
    } catch(json::parse_error& err) {
        throw std::invalid_argument {fmt::format("Unable to parse {}: {}", path, err.what())};
    }

    return from_json(j);
}

utils::address_provider address_provider(const renderer_config& cfg)
{
    if(!cfg.advertise_address.empty())
        return utils::fixed_address(cfg.advertise_address);
    return utils::get_local_ipaddr;
}

} // namespace config
