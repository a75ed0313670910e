#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <string>
#include <map>
#include <chrono>

#include "http/response.hpp"
#include "utils.hpp"

namespace http
{

struct client_request
{
    std::string method {"GET"};
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
};

/// Sends one request over a fresh connection and waits for the complete response.
/// Throws utils::cast_error: network_unreachable if the connection fails, timeout once
/// the deadline passes, cancelled when the token fires, malformed_response for garbage.
/// Non-2xx responses are returned, not thrown.
response send_request(const client_request& req, std::chrono::milliseconds timeout, const utils::cancel_token& token);

response get(const std::string& url, std::chrono::milliseconds timeout, const utils::cancel_token& token);

} // namespace http

#endif
