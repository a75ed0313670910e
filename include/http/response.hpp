#ifndef HTTP_RESPONSE_HPP
#define HTTP_RESPONSE_HPP

#include <string>
#include <string_view>
#include <map>

namespace http
{

class response
{
public:

    response() = default;

    explicit response(int code)
        : m_code {code}
    {}

    /// Parses a complete raw response as received by a client.
    /// The body is decoded from chunked transfer encoding if necessary.
    /// Answers to HEAD requests carry no body whatever Content-Length says.
    static response parse(std::string_view raw, bool head_only = false);

    /// Serialise including the body
    std::string to_string() const;

    /// Serialise the status line and headers only, as for HEAD requests
    std::string head_to_string() const;

    void set_header(const std::string& key, const std::string& value);

    std::string get_header(const std::string& key) const;

    bool check_header(const std::string& key) const;

    void set_body(const std::string& body);

    void set_body(std::string&& body);

    int get_code() const
    {
        return m_code;
    }

    const std::string& get_body() const
    {
        return m_body;
    }

private:

    int m_code = 200;
    std::string m_phrase;
    std::string m_body;

    std::map<std::string, std::string> m_headers;

};

/// Returns the standard reason phrase for a status code
const char* get_http_phrase(int status_code);

} // namespace http

#endif
