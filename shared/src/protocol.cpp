#include "drcv/protocol.hpp"

#include <array>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace drcv::protocol
{

    namespace
    {

        struct UploadStatusMapping
        {
            UploadStatus status;
            std::string_view label;
        };

        constexpr std::array<UploadStatusMapping, 4> kUploadStatusMappings{{
            {UploadStatus::Init, "init"},
            {UploadStatus::Uploading, "uploading"},
            {UploadStatus::Complete, "complete"},
            {UploadStatus::Disconnected, "disconnected"},
        }};

        struct ClientStatusMapping
        {
            ClientStatus status;
            std::string_view label;
        };

        constexpr std::array<ClientStatusMapping, 2> kClientStatusMappings{{
            {ClientStatus::Connected, "connected"},
            {ClientStatus::Disconnected, "disconnected"},
        }};

    } // namespace

    std::int64_t to_unix_millis(Timestamp time) noexcept
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    }

    Timestamp from_unix_millis(std::int64_t millis) noexcept
    {
        return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds{millis})};
    }

    std::string format_timestamp(Timestamp time)
    {
        const auto millis = to_unix_millis(time);
        auto seconds = static_cast<std::time_t>(millis / 1000);
        auto fraction = millis % 1000;
        if (fraction < 0)
        {
            fraction += 1000;
            seconds -= 1;
        }
        std::tm utc{};
        if (gmtime_r(&seconds, &utc) == nullptr)
        {
            throw std::runtime_error("Timestamp out of range");
        }
        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << fraction
            << 'Z';
        return oss.str();
    }

    std::string_view to_string(UploadStatus status) noexcept
    {
        for (const auto &mapping : kUploadStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<UploadStatus> upload_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kUploadStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ClientStatus status) noexcept
    {
        for (const auto &mapping : kClientStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<ClientStatus> client_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kClientStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const UploadRecord &record)
    {
        json = nlohmann::json{
            {"id", record.id},
            {"filename", record.filename},
            {"client_address", record.client_address},
            {"size", record.size},
            {"status", std::string(to_string(record.status))},
            {"created_at", format_timestamp(record.created_at)},
            {"updated_at", format_timestamp(record.updated_at)},
        };
        if (record.completed_at)
        {
            json["completed_at"] = format_timestamp(*record.completed_at);
        }
        else
        {
            json["completed_at"] = nullptr;
        }
    }

    void to_json(nlohmann::json &json, const ClientRecord &record)
    {
        json = nlohmann::json{
            {"address", record.address},
            {"user_agent", record.user_agent},
            {"status", std::string(to_string(record.status))},
            {"last_seen", format_timestamp(record.last_seen)},
        };
    }

    void to_json(nlohmann::json &json, const UploadPage &page)
    {
        json = nlohmann::json{
            {"page", page.page},
            {"page_size", page.page_size},
            {"total", page.total},
            {"uploads", page.uploads},
        };
    }

    void from_json(const nlohmann::json &json, HeartbeatRequest &request)
    {
        request.upload_ids.clear();
        if (!json.is_object())
        {
            throw std::invalid_argument("Heartbeat body must be a JSON object");
        }
        const auto it = json.find("upload_ids");
        if (it == json.end() || it->is_null())
        {
            return;
        }
        if (!it->is_array())
        {
            throw std::invalid_argument("upload_ids must be an array");
        }
        for (const auto &value : *it)
        {
            if (value.is_number_integer())
            {
                request.upload_ids.push_back(value.get<std::int64_t>());
            }
            else if (value.is_string())
            {
                request.upload_ids.push_back(std::stoll(value.get<std::string>()));
            }
            else
            {
                throw std::invalid_argument("upload_ids entries must be integers");
            }
        }
    }

    void to_json(nlohmann::json &json, const HeartbeatResponse &response)
    {
        json = nlohmann::json{
            {"refreshed", response.refreshed},
            {"ignored", response.ignored},
        };
    }

    void to_json(nlohmann::json &json, const ErrorBody &body)
    {
        json = nlohmann::json{
            {"error", std::string(to_string(body.error))},
            {"message", body.message},
        };
        if (body.uploaded_bytes)
        {
            json["uploaded_bytes"] = *body.uploaded_bytes;
        }
    }

} // namespace drcv::protocol
