/**
 * drcv - Error codes shared by the store, upload engine, tunnel and HTTP layers.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace drcv
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidChunk = 1,
        SizeExceeded = 2,
        IOError = 3,
        StoreError = 4,
        DependencyMissing = 5,
        TunnelError = 6,
        StaleSession = 7,
        InvalidRequest = 8,
        NotFound = 9,
        MethodNotAllowed = 10,
        PayloadTooLarge = 11,
        Unsupported = 12,
        InternalError = 13
    };

    std::string_view to_string(ErrorCode code) noexcept;

    // HTTP status reported to callers when a request fails with `code`.
    unsigned http_status(ErrorCode code) noexcept;

} // namespace drcv
