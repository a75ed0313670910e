#include <http/response.hpp>

#include "cast_error.hpp"
#include "utils.hpp"

#include "fmt/format.h"

#include <algorithm>
#include <charconv>

namespace http
{

using utils::cast_error;
using utils::error_kind;

const char* get_http_phrase(int status_code)
{
    switch(status_code)
    {
        case 200: return "OK";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 302: return "Found";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default: return (status_code < 400) ? "OK" : "Error";
    }
}

static std::string decode_chunked(std::string_view body)
{
    std::string decoded;
    while(true)
    {
        size_t endl = body.find("\r\n");
        if(endl == std::string_view::npos)
            throw cast_error {error_kind::malformed_response, "Truncated chunk header"};

        // Chunk extensions after ';' are ignored
        std::string_view size_view = utils::trim(body.substr(0, std::min(endl, body.find(';'))));
        size_t chunk_size = 0;
        auto res = std::from_chars(size_view.data(), size_view.data() + size_view.size(), chunk_size, 16);
        if(res.ec != std::errc {} || size_view.empty())
            throw cast_error {error_kind::malformed_response, "Invalid chunk size"};

        body.remove_prefix(endl + 2);
        if(chunk_size == 0)
            break;
        if(body.size() < chunk_size)
            throw cast_error {error_kind::malformed_response, "Truncated chunk"};

        decoded.append(body.data(), chunk_size);
        body.remove_prefix(chunk_size);
        if(utils::starts_with(body, "\r\n"))
            body.remove_prefix(2);
    }
    return decoded;
}

response response::parse(std::string_view raw, bool head_only)
{
    response res;

    size_t endl = raw.find("\r\n");
    if(endl == std::string_view::npos || !utils::starts_with(raw, "HTTP/"))
        throw cast_error {error_kind::malformed_response, "Missing HTTP status line"};

    // HTTP/1.1 200 OK
    std::string_view status_line = raw.substr(0, endl);
    size_t sp = status_line.find(' ');
    if(sp == std::string_view::npos)
        throw cast_error {error_kind::malformed_response, "Invalid HTTP status line"};
    std::string_view code_view = status_line.substr(sp + 1, 3);
    auto conv = std::from_chars(code_view.data(), code_view.data() + code_view.size(), res.m_code);
    if(conv.ec != std::errc {} || code_view.size() != 3)
        throw cast_error {error_kind::malformed_response, "Invalid HTTP status code"};
    if(status_line.size() > sp + 5)
        res.m_phrase = std::string {status_line.substr(sp + 5)};

    std::string_view headerline = raw.substr(endl + 2);
    while(true)
    {
        endl = headerline.find("\r\n");
        if(endl == std::string_view::npos)
            throw cast_error {error_kind::malformed_response, "Unterminated HTTP header"};
        if(endl == 0)
        {
            headerline.remove_prefix(2);
            break;
        }

        size_t sep = headerline.find(':');
        if(sep != std::string_view::npos && sep < endl)
        {
            res.set_header(std::string {utils::trim(headerline.substr(0, sep))},
                std::string {utils::trim(headerline.substr(sep + 1, endl - sep - 1))});
        }
        headerline.remove_prefix(endl + 2);
    }

    std::string_view body = headerline;
    if(head_only)
        return res;

    if(utils::to_lower(res.get_header("Transfer-Encoding")).find("chunked") != std::string::npos)
    {
        res.m_body = decode_chunked(body);
    }
    else if(res.check_header("Content-Length"))
    {
        std::string length_str = res.get_header("Content-Length");
        size_t length = 0;
        auto lconv = std::from_chars(length_str.data(), length_str.data() + length_str.size(), length);
        if(lconv.ec != std::errc {})
            throw cast_error {error_kind::malformed_response, "Invalid Content-Length"};
        if(body.size() < length)
            throw cast_error {error_kind::malformed_response, "Truncated HTTP body"};
        res.m_body = std::string {body.substr(0, length)};
    }
    else
    {
        res.m_body = std::string {body};
    }

    return res;
}

std::string response::head_to_string() const
{
    std::string response = fmt::format("HTTP/1.1 {} {}\r\n", m_code, m_phrase.empty() ? get_http_phrase(m_code) : m_phrase);

    /* Append all headers to response */
    for(const auto& it : m_headers)
        response.append(fmt::format("{}: {}\r\n", it.first, it.second));

    if(!check_header("Content-Length"))
        response.append(fmt::format("Content-Length: {}\r\n", m_body.size()));

    response.append("\r\n");
    return response;
}

std::string response::to_string() const
{
    std::string response = head_to_string();
    response.append(m_body);
    return response;
}

void response::set_body(const std::string& body)
{
    m_body = body;
    set_header("Content-Length", std::to_string(m_body.size()));
}

void response::set_body(std::string&& body)
{
    m_body = std::move(body);
    set_header("Content-Length", std::to_string(m_body.size()));
}

void response::set_header(const std::string& key, const std::string& value)
{
    auto it = std::find_if(m_headers.begin(), m_headers.end(), [lower = utils::to_lower(key)](const auto& header) {
        return utils::to_lower(header.first) == lower;
    });
    if(it != m_headers.end())
        it->second = value;
    else
        m_headers[key] = value;
}

std::string response::get_header(const std::string& key) const
{
    const std::string lower = utils::to_lower(key);
    for(const auto& it : m_headers)
    {
        if(utils::to_lower(it.first) == lower)
            return it.second;
    }
    return "";
}

bool response::check_header(const std::string& key) const
{
    const std::string lower = utils::to_lower(key);
    return std::any_of(m_headers.begin(), m_headers.end(), [&lower](const auto& header) {
        return utils::to_lower(header.first) == lower;
    });
}

} // namespace http
