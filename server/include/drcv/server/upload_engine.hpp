#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

#include "drcv/error_codes.hpp"
#include "drcv/protocol.hpp"

namespace drcv::server
{

    class Store;
    class Filesystem;
    class EventBroadcaster;

    class UploadError : public std::runtime_error
    {
    public:
        UploadError(drcv::ErrorCode code, std::string message, std::optional<std::uint64_t> uploaded_bytes = std::nullopt);

        drcv::ErrorCode code() const noexcept { return code_; }
        // Resumable offset the caller should continue from, when known.
        std::optional<std::uint64_t> uploaded_bytes() const noexcept { return uploaded_bytes_; }

    private:
        drcv::ErrorCode code_;
        std::optional<std::uint64_t> uploaded_bytes_;
    };

    struct UploadLimits
    {
        std::uint64_t chunk_size{};
        std::uint64_t max_file_size{};
    };

    struct ResumeOffset
    {
        std::int64_t upload_id{};
        std::uint64_t bytes{};
        protocol::UploadStatus status{protocol::UploadStatus::Init};
    };

    struct ChunkRequest
    {
        std::string filename;
        std::string client_address;
        std::uint64_t chunk_index{};
        std::uint64_t total_chunks{};
        std::string_view data;
    };

    struct ChunkResult
    {
        std::int64_t upload_id{};
        std::uint64_t bytes{};
        protocol::UploadStatus status{protocol::UploadStatus::Uploading};
        // The chunk index had already been accepted earlier in this session.
        bool duplicate{};
        std::optional<std::filesystem::path> final_path;
    };

    /**
     * Resumable chunked uploads keyed by (filename, client address).
     *
     * Chunk i of an upload is written at offset i * chunk_size of the upload's partial file,
     * so arrival order does not matter. Each active upload owns one file handle guarded by its
     * own mutex; different uploads never share a lock. Accepted chunks are appended to a ledger
     * beside the partial file, which is all a restarted engine trusts when it resumes.
     */
    class UploadEngine
    {
    public:
        UploadEngine(Store &store, Filesystem &filesystem, EventBroadcaster &events, UploadLimits limits);

        const UploadLimits &limits() const noexcept { return limits_; }

        // Reports bytes received so far, creating an init session when none is active.
        // An active upload is reported from its ledger, so the offset matches what accept_chunk trusts.
        ResumeOffset resume_offset(const std::string &filename, const std::string &client_address);

        ChunkResult accept_chunk(const ChunkRequest &request);

        // Closes the open handle of an upload that was disconnected elsewhere.
        void release(std::int64_t upload_id);

        std::size_t open_sessions() const;

    private:
        struct ActiveUpload
        {
            std::mutex mutex;
            std::int64_t id{};
            std::string filename;
            std::filesystem::path partial_path;
            std::filesystem::path ledger_path;
            std::fstream file;
            std::set<std::uint64_t> received;
            std::uint64_t total_chunks{};
            std::uint64_t bytes{};
            bool closed{};
        };

        // Null once the row has left init/uploading.
        std::shared_ptr<ActiveUpload> acquire(const protocol::UploadRecord &record);
        void restore(ActiveUpload &upload);
        std::uint64_t resumable_bytes(const protocol::UploadRecord &record);
        ChunkResult settled(std::int64_t upload_id, std::uint64_t bytes);
        void open_file(ActiveUpload &upload);
        void write_chunk(ActiveUpload &upload, std::uint64_t offset, std::string_view data);
        void append_ledger(ActiveUpload &upload, std::uint64_t index, std::uint64_t total, std::uint64_t length);
        void close_locked(ActiveUpload &upload);
        void forget(std::int64_t upload_id);
        [[noreturn]] void reject_oversize(const protocol::UploadRecord &record, const std::string &message);

        Store &store_;
        Filesystem &filesystem_;
        EventBroadcaster &events_;
        UploadLimits limits_;

        mutable std::mutex sessions_mutex_;
        std::unordered_map<std::int64_t, std::shared_ptr<ActiveUpload>> sessions_;
    };

} // namespace drcv::server
