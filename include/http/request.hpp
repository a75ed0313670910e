#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include <string>
#include <string_view>
#include <map>

namespace http {

class request {

public:

    request() = default;
    request(const request& other) = default;
    request(request&& other) noexcept = default;
    request& operator=(const request& other) = default;
    request& operator=(request&& other) noexcept = default;

    explicit request(std::string_view request_string);

    /// Parses request line and headers, the body is everything after the empty line
    void parse(std::string_view request);

    std::string get_header(const std::string& key) const;

    const std::string& get_method() const { return m_method; }

    const std::string& get_path() const { return m_path; }

    const std::string& get_body() const { return m_body; }

    void set_body(std::string body) { m_body = std::move(body); }

private:

    void parse_requestline(std::string_view requestline);

    std::string m_method;     /// http method used by this request (e.g. post, get, ...)
    std::string m_path;       /// path of the resource addressed by this request, without the query

    std::map<std::string, std::string> m_headers; /// http request headers, names in lower case
    std::string m_body;

};

} // namespace http

#endif
