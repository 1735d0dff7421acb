#include "drcv/http.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace drcv::http
{

    HttpParseError::HttpParseError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {
        constexpr std::size_t kMaxHeaderCount = 100;

        struct StatusMapping
        {
            unsigned status;
            std::string_view reason;
        };

        constexpr std::array<StatusMapping, 17> kReasons{{
            {200, "OK"},
            {201, "Created"},
            {204, "No Content"},
            {400, "Bad Request"},
            {404, "Not Found"},
            {405, "Method Not Allowed"},
            {408, "Request Timeout"},
            {410, "Gone"},
            {411, "Length Required"},
            {413, "Payload Too Large"},
            {424, "Failed Dependency"},
            {431, "Request Header Fields Too Large"},
            {500, "Internal Server Error"},
            {501, "Not Implemented"},
            {502, "Bad Gateway"},
            {503, "Service Unavailable"},
            {505, "HTTP Version Not Supported"},
        }};

        int hex_value(char c)
        {
            if (c >= '0' && c <= '9')
            {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f')
            {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F')
            {
                return c - 'A' + 10;
            }
            return -1;
        }

        std::size_t parse_content_length(std::string_view value)
        {
            const auto trimmed = trim(value);
            std::size_t length = 0;
            const auto *begin = trimmed.data();
            const auto *end = trimmed.data() + trimmed.size();
            const auto result = std::from_chars(begin, end, length);
            if (trimmed.empty() || result.ec != std::errc{} || result.ptr != end)
            {
                throw HttpParseError(ErrorCode::InvalidRequest, "Invalid Content-Length");
            }
            return length;
        }

        void append_header_lines(std::string &out, const Response &response)
        {
            for (const auto &[name, value] : response.headers)
            {
                out.append(name).append(": ").append(value).append("\r\n");
            }
        }

    } // namespace

    std::optional<std::string> Request::header(std::string_view name) const
    {
        const auto it = headers.find(to_lower(name));
        if (it == headers.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::string> Request::query_param(std::string_view name) const
    {
        const auto it = query.find(std::string(name));
        if (it == query.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    bool Request::keep_alive() const
    {
        const auto connection = header("connection");
        if (connection)
        {
            const auto value = to_lower(*connection);
            if (value.find("close") != std::string::npos)
            {
                return false;
            }
            if (value.find("keep-alive") != std::string::npos)
            {
                return true;
            }
        }
        return version_minor >= 1;
    }

    RequestHead parse_request_head(std::string_view head)
    {
        RequestHead result{};
        auto &request = result.request;

        const auto line_end = head.find("\r\n");
        if (line_end == std::string_view::npos)
        {
            throw HttpParseError(ErrorCode::InvalidRequest, "Missing request line");
        }
        const auto request_line = head.substr(0, line_end);
        const auto first_space = request_line.find(' ');
        const auto last_space = request_line.rfind(' ');
        if (first_space == std::string_view::npos || last_space == first_space)
        {
            throw HttpParseError(ErrorCode::InvalidRequest, "Malformed request line");
        }
        request.method = std::string(request_line.substr(0, first_space));
        request.target = std::string(request_line.substr(first_space + 1, last_space - first_space - 1));
        const auto version = request_line.substr(last_space + 1);
        if (version == "HTTP/1.1")
        {
            request.version_minor = 1;
        }
        else if (version == "HTTP/1.0")
        {
            request.version_minor = 0;
        }
        else
        {
            throw HttpParseError(ErrorCode::Unsupported, "Unsupported HTTP version");
        }
        if (request.method.empty() || request.target.empty() || request.target.front() != '/')
        {
            throw HttpParseError(ErrorCode::InvalidRequest, "Malformed request target");
        }

        const auto query_pos = request.target.find('?');
        if (query_pos == std::string::npos)
        {
            request.path = url_decode(request.target);
        }
        else
        {
            request.path = url_decode(std::string_view(request.target).substr(0, query_pos));
            request.query = parse_query(std::string_view(request.target).substr(query_pos + 1));
        }

        auto cursor = line_end + 2;
        std::size_t header_count = 0;
        while (cursor < head.size())
        {
            const auto next = head.find("\r\n", cursor);
            if (next == std::string_view::npos)
            {
                throw HttpParseError(ErrorCode::InvalidRequest, "Unterminated header line");
            }
            const auto line = head.substr(cursor, next - cursor);
            cursor = next + 2;
            if (line.empty())
            {
                break;
            }
            if (++header_count > kMaxHeaderCount)
            {
                throw HttpParseError(ErrorCode::InvalidRequest, "Too many headers");
            }
            const auto colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0)
            {
                throw HttpParseError(ErrorCode::InvalidRequest, "Malformed header line");
            }
            auto name = to_lower(trim(line.substr(0, colon)));
            auto value = std::string(trim(line.substr(colon + 1)));
            auto [it, inserted] = request.headers.emplace(std::move(name), value);
            if (!inserted)
            {
                it->second.append(", ").append(value);
            }
        }

        if (const auto encoding = request.header("transfer-encoding"))
        {
            if (to_lower(*encoding) != "identity")
            {
                throw HttpParseError(ErrorCode::Unsupported, "Chunked request bodies are not supported");
            }
        }
        if (const auto length = request.header("content-length"))
        {
            result.content_length = parse_content_length(*length);
        }
        return result;
    }

    QueryMap parse_query(std::string_view query)
    {
        QueryMap result;
        std::size_t start = 0;
        while (start <= query.size())
        {
            auto end = query.find('&', start);
            if (end == std::string_view::npos)
            {
                end = query.size();
            }
            const auto item = query.substr(start, end - start);
            if (!item.empty())
            {
                const auto eq = item.find('=');
                if (eq == std::string_view::npos)
                {
                    result.emplace(url_decode(item), std::string{});
                }
                else
                {
                    result.emplace(url_decode(item.substr(0, eq)), url_decode(item.substr(eq + 1)));
                }
            }
            start = end + 1;
        }
        return result;
    }

    std::string url_decode(std::string_view value)
    {
        std::string decoded;
        decoded.reserve(value.size());
        for (std::size_t i = 0; i < value.size(); ++i)
        {
            const char c = value[i];
            if (c == '+')
            {
                decoded.push_back(' ');
            }
            else if (c == '%' && i + 2 < value.size())
            {
                const int high = hex_value(value[i + 1]);
                const int low = hex_value(value[i + 2]);
                if (high < 0 || low < 0)
                {
                    decoded.push_back(c);
                    continue;
                }
                decoded.push_back(static_cast<char>((high << 4) | low));
                i += 2;
            }
            else
            {
                decoded.push_back(c);
            }
        }
        return decoded;
    }

    std::string to_lower(std::string_view value)
    {
        std::string lowered(value);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return lowered;
    }

    std::string_view trim(std::string_view value)
    {
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
        {
            value.remove_prefix(1);
        }
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
        {
            value.remove_suffix(1);
        }
        return value;
    }

    void Response::set_header(std::string name, std::string value)
    {
        const auto lowered = to_lower(name);
        for (auto &entry : headers)
        {
            if (to_lower(entry.first) == lowered)
            {
                entry.second = std::move(value);
                return;
            }
        }
        headers.emplace_back(std::move(name), std::move(value));
    }

    Response text_response(unsigned status, std::string body)
    {
        Response response;
        response.status = status;
        response.set_header("Content-Type", "text/plain; charset=utf-8");
        response.body = std::move(body);
        return response;
    }

    Response json_response(unsigned status, std::string body)
    {
        Response response;
        response.status = status;
        response.set_header("Content-Type", "application/json");
        response.body = std::move(body);
        return response;
    }

    std::string_view reason_phrase(unsigned status) noexcept
    {
        for (const auto &entry : kReasons)
        {
            if (entry.status == status)
            {
                return entry.reason;
            }
        }
        return "Unknown";
    }

    std::string serialize_response(const Response &response, bool keep_alive, bool head_request)
    {
        std::string out;
        out.reserve(128 + response.body.size());
        out.append("HTTP/1.1 ")
            .append(std::to_string(response.status))
            .append(" ")
            .append(reason_phrase(response.status))
            .append("\r\n");
        append_header_lines(out, response);
        out.append("Content-Length: ").append(std::to_string(response.body.size())).append("\r\n");
        out.append("Connection: ").append(keep_alive ? "keep-alive" : "close").append("\r\n\r\n");
        if (!head_request)
        {
            out.append(response.body);
        }
        return out;
    }

    std::string serialize_stream_head(const Response &response)
    {
        std::string out;
        out.append("HTTP/1.1 ")
            .append(std::to_string(response.status))
            .append(" ")
            .append(reason_phrase(response.status))
            .append("\r\n");
        append_header_lines(out, response);
        out.append("Connection: keep-alive\r\n\r\n");
        return out;
    }

} // namespace drcv::http
