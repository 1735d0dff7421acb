/**
 * drcv - Shared record schema and JSON serialization helpers.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "drcv/error_codes.hpp"

namespace drcv::protocol
{

    using Timestamp = std::chrono::system_clock::time_point;

    std::int64_t to_unix_millis(Timestamp time) noexcept;
    Timestamp from_unix_millis(std::int64_t millis) noexcept;

    // RFC 3339 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.250Z.
    std::string format_timestamp(Timestamp time);

    enum class UploadStatus : std::uint8_t
    {
        Init,
        Uploading,
        Complete,
        Disconnected
    };

    std::string_view to_string(UploadStatus status) noexcept;
    std::optional<UploadStatus> upload_status_from_string(std::string_view value) noexcept;

    constexpr bool is_terminal(UploadStatus status) noexcept
    {
        return status == UploadStatus::Complete || status == UploadStatus::Disconnected;
    }

    enum class ClientStatus : std::uint8_t
    {
        Connected,
        Disconnected
    };

    std::string_view to_string(ClientStatus status) noexcept;
    std::optional<ClientStatus> client_status_from_string(std::string_view value) noexcept;

    struct UploadRecord
    {
        std::int64_t id{};
        std::string filename;
        std::string client_address;
        std::uint64_t size{};
        UploadStatus status{UploadStatus::Init};
        Timestamp created_at{};
        Timestamp updated_at{};
        std::optional<Timestamp> completed_at{};
    };

    void to_json(nlohmann::json &json, const UploadRecord &record);

    struct ClientRecord
    {
        std::string address;
        std::string user_agent;
        ClientStatus status{ClientStatus::Connected};
        Timestamp last_seen{};
    };

    void to_json(nlohmann::json &json, const ClientRecord &record);

    struct UploadPage
    {
        std::size_t page{1};
        std::size_t page_size{};
        std::uint64_t total{};
        std::vector<UploadRecord> uploads;
    };

    void to_json(nlohmann::json &json, const UploadPage &page);

    struct HeartbeatRequest
    {
        std::vector<std::int64_t> upload_ids;
    };

    void from_json(const nlohmann::json &json, HeartbeatRequest &request);

    struct HeartbeatResponse
    {
        std::size_t refreshed{};
        std::size_t ignored{};
    };

    void to_json(nlohmann::json &json, const HeartbeatResponse &response);

    struct ErrorBody
    {
        ErrorCode error{ErrorCode::InternalError};
        std::string message;
        std::optional<std::uint64_t> uploaded_bytes{};
    };

    void to_json(nlohmann::json &json, const ErrorBody &body);

} // namespace drcv::protocol
