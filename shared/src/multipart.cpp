#include "drcv/multipart.hpp"

#include "drcv/http.hpp"

namespace drcv::http
{

    namespace
    {

        // Reads `key="value"` or `key=value` out of a header parameter list.
        std::optional<std::string> header_parameter(std::string_view header, std::string_view key)
        {
            std::size_t cursor = 0;
            while (cursor < header.size())
            {
                auto end = header.find(';', cursor);
                if (end == std::string_view::npos)
                {
                    end = header.size();
                }
                const auto item = trim(header.substr(cursor, end - cursor));
                cursor = end + 1;

                const auto eq = item.find('=');
                if (eq == std::string_view::npos)
                {
                    continue;
                }
                if (to_lower(trim(item.substr(0, eq))) != key)
                {
                    continue;
                }
                auto value = trim(item.substr(eq + 1));
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
                {
                    value = value.substr(1, value.size() - 2);
                }
                return std::string(value);
            }
            return std::nullopt;
        }

        FormPart parse_part_headers(std::string_view block)
        {
            FormPart part;
            std::size_t cursor = 0;
            while (cursor < block.size())
            {
                auto end = block.find("\r\n", cursor);
                if (end == std::string_view::npos)
                {
                    end = block.size();
                }
                const auto line = block.substr(cursor, end - cursor);
                cursor = end + 2;
                const auto colon = line.find(':');
                if (colon == std::string_view::npos)
                {
                    continue;
                }
                const auto name = to_lower(trim(line.substr(0, colon)));
                const auto value = trim(line.substr(colon + 1));
                if (name == "content-disposition")
                {
                    if (auto field = header_parameter(value, "name"))
                    {
                        part.name = std::move(*field);
                    }
                    part.filename = header_parameter(value, "filename");
                }
                else if (name == "content-type")
                {
                    part.content_type = std::string(value);
                }
            }
            if (part.name.empty())
            {
                throw HttpParseError(ErrorCode::InvalidRequest, "Multipart part without a field name");
            }
            return part;
        }

    } // namespace

    std::optional<std::string> boundary_from_content_type(std::string_view content_type)
    {
        const auto semicolon = content_type.find(';');
        const auto media_type = to_lower(trim(content_type.substr(0, semicolon)));
        if (media_type != "multipart/form-data" || semicolon == std::string_view::npos)
        {
            return std::nullopt;
        }
        auto boundary = header_parameter(content_type.substr(semicolon + 1), "boundary");
        if (!boundary || boundary->empty() || boundary->size() > 70)
        {
            return std::nullopt;
        }
        return boundary;
    }

    std::vector<FormPart> parse_multipart(std::string_view body, std::string_view boundary)
    {
        const std::string delimiter = "--" + std::string(boundary);
        const std::string separator = "\r\n" + delimiter;

        auto cursor = body.find(delimiter);
        if (cursor == std::string_view::npos)
        {
            throw HttpParseError(ErrorCode::InvalidRequest, "Multipart boundary not found");
        }
        cursor += delimiter.size();

        std::vector<FormPart> parts;
        while (true)
        {
            if (body.substr(cursor, 2) == "--")
            {
                return parts;
            }
            if (body.substr(cursor, 2) != "\r\n")
            {
                throw HttpParseError(ErrorCode::InvalidRequest, "Malformed multipart delimiter");
            }
            cursor += 2;

            const auto headers_end = body.find("\r\n\r\n", cursor);
            if (headers_end == std::string_view::npos)
            {
                throw HttpParseError(ErrorCode::InvalidRequest, "Unterminated multipart headers");
            }
            auto part = parse_part_headers(body.substr(cursor, headers_end - cursor));
            const auto data_begin = headers_end + 4;

            const auto data_end = body.find(separator, data_begin);
            if (data_end == std::string_view::npos)
            {
                throw HttpParseError(ErrorCode::InvalidRequest, "Unterminated multipart part");
            }
            part.data = std::string(body.substr(data_begin, data_end - data_begin));
            parts.push_back(std::move(part));
            cursor = data_end + separator.size();
        }
    }

    const FormPart *find_part(const std::vector<FormPart> &parts, std::string_view name)
    {
        for (const auto &part : parts)
        {
            if (part.name == name)
            {
                return &part;
            }
        }
        return nullptr;
    }

} // namespace drcv::http
