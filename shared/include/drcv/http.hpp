/**
 * drcv - Minimal HTTP/1.1 request parsing and response serialization.
 */
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "drcv/error_codes.hpp"

namespace drcv::http
{

    class HttpParseError : public std::runtime_error
    {
    public:
        HttpParseError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    // Header names are stored lowercased.
    using HeaderMap = std::map<std::string, std::string>;
    using QueryMap = std::map<std::string, std::string>;

    struct Request
    {
        std::string method;
        std::string target;
        std::string path;
        QueryMap query;
        HeaderMap headers;
        int version_minor{1};
        std::string body;
        std::string remote_address;

        std::optional<std::string> header(std::string_view name) const;
        std::optional<std::string> query_param(std::string_view name) const;
        bool keep_alive() const;
    };

    struct RequestHead
    {
        Request request;
        std::size_t content_length{};
    };

    // Parses everything up to and including the blank line that ends the header block.
    RequestHead parse_request_head(std::string_view head);

    QueryMap parse_query(std::string_view query);

    std::string url_decode(std::string_view value);

    std::string to_lower(std::string_view value);

    std::string_view trim(std::string_view value);

    struct Response
    {
        unsigned status{200};
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;

        void set_header(std::string name, std::string value);
    };

    Response text_response(unsigned status, std::string body);

    Response json_response(unsigned status, std::string body);

    std::string_view reason_phrase(unsigned status) noexcept;

    // Full response including Content-Length. The body is omitted for HEAD requests.
    std::string serialize_response(const Response &response, bool keep_alive, bool head_request);

    // Status line and headers only, for responses whose body is streamed afterwards.
    std::string serialize_stream_head(const Response &response);

} // namespace drcv::http
