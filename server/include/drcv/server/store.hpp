#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "drcv/error_codes.hpp"
#include "drcv/protocol.hpp"

struct sqlite3;

namespace drcv::server
{

    class StoreError : public std::runtime_error
    {
    public:
        explicit StoreError(std::string message);

        drcv::ErrorCode code() const noexcept { return drcv::ErrorCode::StoreError; }
    };

    using Clock = std::function<protocol::Timestamp()>;

    struct ClientTouch
    {
        protocol::ClientRecord client;
        // True when the address was unknown or previously disconnected.
        bool newly_connected{};
    };

    struct UploadLookup
    {
        protocol::UploadRecord upload;
        bool created{};
    };

    struct UploadCounts
    {
        std::uint64_t init{};
        std::uint64_t uploading{};
        std::uint64_t complete{};
        std::uint64_t disconnected{};
        std::uint64_t clients_connected{};
        std::uint64_t clients_total{};
    };

    /**
     * SQLite-backed state for uploads, clients and key/value facts.
     *
     * Every mutation touches a single row and is applied with one statement, so callers
     * never need a transaction spanning several entities. All failures surface as StoreError.
     */
    class Store
    {
    public:
        explicit Store(std::filesystem::path database_path, Clock clock = {});
        ~Store();

        Store(const Store &) = delete;
        Store &operator=(const Store &) = delete;

        protocol::Timestamp now() const;

        // Returns the active (init/uploading) row for the pair, inserting an init row if there is none.
        // A completed latest row is returned instead when `keep_completed` accepts it.
        UploadLookup create_or_fetch_upload(const std::string &filename, const std::string &client_address,
                                            const std::function<bool(const protocol::UploadRecord &)> &keep_completed = {});

        // Most recent row for the pair regardless of status.
        std::optional<protocol::UploadRecord> latest_upload(const std::string &filename,
                                                            const std::string &client_address);

        std::optional<protocol::UploadRecord> find_upload(std::int64_t id);

        // Applies size = max(size, bytes) and the new status. Only init->uploading, uploading->uploading
        // and uploading->complete are accepted; returns false when the row refused the transition.
        bool record_progress(std::int64_t id, std::uint64_t bytes, protocol::UploadStatus status);

        // Refreshes updated_at of a non-terminal row.
        bool touch_upload(std::int64_t id);

        // Conditional init|uploading -> disconnected.
        bool mark_upload_disconnected(std::int64_t id);

        std::vector<protocol::UploadRecord> active_uploads_for_client(const std::string &client_address);

        std::vector<protocol::UploadRecord> stale_uploads(protocol::Timestamp updated_before);

        // Deletes terminal rows last updated before the cutoff and returns them.
        std::vector<protocol::UploadRecord> prune_uploads(protocol::Timestamp updated_before);

        protocol::UploadPage list_uploads(std::size_t page, std::size_t page_size, const std::string &query);

        ClientTouch touch_client(const std::string &address, const std::string &user_agent);

        std::optional<protocol::ClientRecord> find_client(const std::string &address);

        // Conditional connected -> disconnected.
        bool mark_client_disconnected(const std::string &address);

        std::vector<protocol::ClientRecord> stale_clients(protocol::Timestamp seen_before);

        std::vector<protocol::ClientRecord> list_clients();

        std::optional<std::string> get_fact(const std::string &key);
        void set_fact(const std::string &key, const std::string &value);

        UploadCounts counts();

    private:
        void open();
        void init_schema();
        std::optional<protocol::UploadRecord> find_upload_locked(std::int64_t id);

        std::filesystem::path database_path_;
        Clock clock_;
        sqlite3 *db_{nullptr};
        mutable std::mutex mutex_;
    };

} // namespace drcv::server
