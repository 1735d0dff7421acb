#include "drcv/error_codes.hpp"

#include <array>

namespace drcv
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            unsigned status;
        };

        constexpr std::array<ErrorCodeDescription, 14> kDescriptions{{
            {ErrorCode::Ok, "ok", 200},
            {ErrorCode::InvalidChunk, "invalid_chunk", 400},
            {ErrorCode::SizeExceeded, "size_exceeded", 413},
            {ErrorCode::IOError, "io_error", 500},
            {ErrorCode::StoreError, "store_error", 503},
            {ErrorCode::DependencyMissing, "dependency_missing", 424},
            {ErrorCode::TunnelError, "tunnel_error", 502},
            {ErrorCode::StaleSession, "stale_session", 410},
            {ErrorCode::InvalidRequest, "invalid_request", 400},
            {ErrorCode::NotFound, "not_found", 404},
            {ErrorCode::MethodNotAllowed, "method_not_allowed", 405},
            {ErrorCode::PayloadTooLarge, "payload_too_large", 413},
            {ErrorCode::Unsupported, "unsupported", 501},
            {ErrorCode::InternalError, "internal_error", 500},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    unsigned http_status(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.status;
            }
        }
        return 500;
    }

} // namespace drcv
