#include "http/request.hpp"
#include "utils.hpp"

#include <stdexcept>

namespace http
{

request::request(std::string_view unparsed_request)
{
    parse(unparsed_request);
}

void request::parse(std::string_view request)
{
    size_t pos_q;

    /* extract the request line */
    pos_q = request.find("\r\n");
    if(pos_q == std::string_view::npos)
        throw std::invalid_argument {"invalid_request"};
    parse_requestline(request.substr(0, pos_q));

    /* Read and parse request headers */
    std::string_view headerline = request.substr(request.find("\r\n") + 2);
    while(true)
    {
        size_t end_pos = headerline.find("\r\n");
        if(end_pos == std::string_view::npos)
            throw std::invalid_argument {"invalid_request"};
        if(end_pos == 0)
        {
            headerline.remove_prefix(2);
            break;
        }

        size_t mid_pos = headerline.find(':');
        if(mid_pos == std::string_view::npos || mid_pos > end_pos)
            throw std::invalid_argument {"invalid_request"};

        m_headers[utils::to_lower(utils::trim(headerline.substr(0, mid_pos)))] =
            std::string {utils::trim(headerline.substr(mid_pos + 1, end_pos - mid_pos - 1))};

        headerline.remove_prefix(end_pos + 2);
    }

    m_body = std::string {headerline};
}

void request::parse_requestline(std::string_view requestline)
{
    uint32_t vec_index = 0;
    std::string_view tmp_store[3];
    while(vec_index < 3 && !requestline.empty())
    {
        size_t sep = requestline.find(' ');
        tmp_store[vec_index++] = requestline.substr(0, sep);
        requestline.remove_prefix(sep == std::string_view::npos ? requestline.size() : sep + 1);
    }

    if(vec_index != 3 || tmp_store[0].empty() || tmp_store[1].empty())
        throw std::invalid_argument {"invalid_requestline"};

    m_method = std::string {tmp_store[0]};
    m_path = std::string {tmp_store[1].substr(0, tmp_store[1].find('?'))};
}

std::string request::get_header(const std::string& key) const
{
    auto it = m_headers.find(utils::to_lower(key));
    if(it == m_headers.end())
        return "";
    return it->second;
}

} // namespace http
