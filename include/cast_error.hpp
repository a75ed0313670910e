#ifndef CAST_ERROR_HPP
#define CAST_ERROR_HPP

#include <string>
#include <string_view>
#include <stdexcept>

namespace utils
{

enum class error_kind
{
    network_unreachable,
    timeout,
    malformed_response,
    no_control_service,
    transport_error,
    device_error,
    resource_exhausted,
    cancelled,
    encode_error
};

const char* to_string(error_kind kind);

class cast_error : public std::runtime_error
{
public:

    cast_error(error_kind kind, const std::string& what, int status = 0, std::string body = {})
        : std::runtime_error {what}, m_kind {kind}, m_status {status}, m_body {std::move(body)}
    {}

    error_kind kind() const noexcept
    {
        return m_kind;
    }

    // HTTP status of a failed control call, 0 otherwise
    int status() const noexcept
    {
        return m_status;
    }

    const std::string& body() const noexcept
    {
        return m_body;
    }

    // Same error with the failing step prepended to the message
    cast_error with_context(std::string_view step) const;

private:

    error_kind m_kind;

    int m_status;

    std::string m_body;

};

} // namespace utils

#endif
