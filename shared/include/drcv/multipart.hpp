/**
 * drcv - multipart/form-data body parsing.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drcv::http
{

    struct FormPart
    {
        std::string name;
        std::optional<std::string> filename;
        std::string content_type;
        std::string data;
    };

    std::optional<std::string> boundary_from_content_type(std::string_view content_type);

    // Throws HttpParseError(InvalidRequest) on a malformed body.
    std::vector<FormPart> parse_multipart(std::string_view body, std::string_view boundary);

    const FormPart *find_part(const std::vector<FormPart> &parts, std::string_view name);

} // namespace drcv::http
