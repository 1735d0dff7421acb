#include "drcv/server/upload_engine.hpp"

#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "drcv/server/event_broadcaster.hpp"
#include "drcv/server/filesystem.hpp"
#include "drcv/server/store.hpp"

namespace drcv::server
{

    using protocol::UploadRecord;
    using protocol::UploadStatus;

    UploadError::UploadError(drcv::ErrorCode code, std::string message, std::optional<std::uint64_t> uploaded_bytes)
        : std::runtime_error(std::move(message)), code_(code), uploaded_bytes_(uploaded_bytes) {}

    namespace
    {

        std::string checked_name(const std::string &requested)
        {
            try
            {
                return Filesystem::sanitize_filename(requested);
            }
            catch (const FilesystemError &ex)
            {
                throw UploadError(ex.code(), ex.what());
            }
        }

        nlohmann::json progress_payload(std::int64_t id, const std::string &filename, const std::string &client,
                                        std::uint64_t bytes, UploadStatus status)
        {
            return {
                {"id", id},
                {"filename", filename},
                {"client_address", client},
                {"size", bytes},
                {"status", std::string(protocol::to_string(status))},
            };
        }

        // True when the chunk has the index, count and length the completed upload was built from.
        bool fits_completed(const UploadRecord &done, std::uint64_t index, std::uint64_t total, std::uint64_t length,
                            std::uint64_t chunk_size)
        {
            const auto chunks = done.size == 0 ? 1 : (done.size + chunk_size - 1) / chunk_size;
            if (total != chunks)
            {
                return false;
            }
            const auto expected = index + 1 < chunks ? chunk_size : done.size - (chunks - 1) * chunk_size;
            return length == expected;
        }

    } // namespace

    UploadEngine::UploadEngine(Store &store, Filesystem &filesystem, EventBroadcaster &events, UploadLimits limits)
        : store_(store), filesystem_(filesystem), events_(events), limits_(limits)
    {
        if (limits_.chunk_size == 0)
        {
            throw std::invalid_argument("chunk size must be positive");
        }
    }

    ResumeOffset UploadEngine::resume_offset(const std::string &filename, const std::string &client_address)
    {
        const auto name = checked_name(filename);
        // Completed uploads are reported as such; only a disconnected one makes room for a fresh session.
        const auto lookup = store_.create_or_fetch_upload(name, client_address, [](const UploadRecord &)
                                                          { return true; });
        const auto &record = lookup.upload;
        if (lookup.created)
        {
            spdlog::debug("Upload {} created for {} from {}", record.id, name, client_address);
            events_.publish(EventType::UploadCreated, record);
        }
        if (record.status == UploadStatus::Complete)
        {
            return {.upload_id = record.id, .bytes = record.size, .status = record.status};
        }
        return {.upload_id = record.id, .bytes = resumable_bytes(record), .status = record.status};
    }

    ChunkResult UploadEngine::accept_chunk(const ChunkRequest &request)
    {
        const auto name = checked_name(request.filename);
        const auto index = request.chunk_index;
        const auto total = request.total_chunks;
        if (total == 0)
        {
            throw UploadError(drcv::ErrorCode::InvalidChunk, "total_chunks must be positive");
        }
        if (index >= total)
        {
            throw UploadError(drcv::ErrorCode::InvalidChunk,
                              "chunk_index " + std::to_string(index) + " is out of range for " +
                                  std::to_string(total) + " chunks");
        }

        const auto chunk_size = limits_.chunk_size;
        const auto length = static_cast<std::uint64_t>(request.data.size());

        // A late retry for an upload that already finished must not start a new one.
        const auto lookup = store_.create_or_fetch_upload(name, request.client_address, [&](const UploadRecord &done)
                                                          { return fits_completed(done, index, total, length, chunk_size); });
        const auto &record = lookup.upload;
        if (record.status == UploadStatus::Complete)
        {
            return {.upload_id = record.id,
                    .bytes = record.size,
                    .status = UploadStatus::Complete,
                    .duplicate = true,
                    .final_path = std::nullopt};
        }
        if (lookup.created)
        {
            spdlog::debug("Upload {} created for {} from {}", record.id, name, request.client_address);
            events_.publish(EventType::UploadCreated, record);
        }

        const bool last = index + 1 == total;
        if (length > chunk_size)
        {
            throw UploadError(drcv::ErrorCode::InvalidChunk,
                              "Chunk of " + std::to_string(length) + " bytes exceeds the chunk size of " +
                                  std::to_string(chunk_size),
                              record.size);
        }
        if (!last && length != chunk_size)
        {
            throw UploadError(drcv::ErrorCode::InvalidChunk,
                              "Only the last chunk may be shorter than " + std::to_string(chunk_size) + " bytes",
                              record.size);
        }
        if (total - 1 > limits_.max_file_size / chunk_size)
        {
            reject_oversize(record, "Declared upload of " + std::to_string(total) + " chunks exceeds the size limit");
        }
        const auto base = (total - 1) * chunk_size;
        if (last && length > limits_.max_file_size - base)
        {
            reject_oversize(record, "Upload exceeds the maximum file size of " + std::to_string(limits_.max_file_size));
        }

        auto upload = acquire(record);
        if (!upload)
        {
            return settled(record.id, record.size);
        }
        std::lock_guard lock(upload->mutex);
        if (upload->closed)
        {
            return settled(record.id, upload->bytes);
        }
        if (upload->total_chunks == 0)
        {
            if (!upload->received.empty() && *upload->received.rbegin() >= total)
            {
                throw UploadError(drcv::ErrorCode::InvalidChunk, "total_chunks is smaller than the chunks already received",
                                  upload->bytes);
            }
            upload->total_chunks = total;
        }
        else if (upload->total_chunks != total)
        {
            throw UploadError(drcv::ErrorCode::InvalidChunk,
                              "total_chunks changed from " + std::to_string(upload->total_chunks) + " to " +
                                  std::to_string(total),
                              upload->bytes);
        }

        write_chunk(*upload, index * chunk_size, request.data);
        const bool duplicate = upload->received.contains(index);
        if (!duplicate)
        {
            append_ledger(*upload, index, total, length);
            upload->received.insert(index);
            upload->bytes += length;
            if (upload->received.size() == 1)
            {
                spdlog::info("Upload {} started: {} from {} ({} chunks)", record.id, name, request.client_address, total);
            }
        }

        if (!store_.record_progress(record.id, upload->bytes, UploadStatus::Uploading))
        {
            close_locked(*upload);
            forget(record.id);
            throw UploadError(drcv::ErrorCode::StaleSession, "Upload " + std::to_string(record.id) + " is no longer active",
                              upload->bytes);
        }

        auto progress = progress_payload(record.id, name, request.client_address, upload->bytes, UploadStatus::Uploading);
        progress["chunk_index"] = index;
        progress["total_chunks"] = total;
        events_.publish(EventType::UploadProgress, std::move(progress));

        if (upload->received.size() < total)
        {
            return {.upload_id = record.id,
                    .bytes = upload->bytes,
                    .status = UploadStatus::Uploading,
                    .duplicate = duplicate,
                    .final_path = std::nullopt};
        }

        if (upload->file.is_open())
        {
            upload->file.close();
        }
        std::filesystem::path final_path;
        try
        {
            final_path = filesystem_.finalize(upload->partial_path, name);
        }
        catch (const FilesystemError &ex)
        {
            throw UploadError(ex.code(), ex.what(), upload->bytes);
        }
        if (!store_.record_progress(record.id, upload->bytes, UploadStatus::Complete))
        {
            spdlog::warn("Upload {} finished on disk at {} but its row refused completion", record.id,
                         final_path.string());
        }
        close_locked(*upload);
        forget(record.id);
        filesystem_.remove_partial(record.id);

        spdlog::info("Upload {} complete: {} ({} bytes) from {}", record.id, final_path.filename().string(),
                     upload->bytes, request.client_address);
        auto completed = progress_payload(record.id, name, request.client_address, upload->bytes, UploadStatus::Complete);
        completed["path"] = final_path.filename().string();
        events_.publish(EventType::UploadCompleted, std::move(completed));

        return {.upload_id = record.id,
                .bytes = upload->bytes,
                .status = UploadStatus::Complete,
                .duplicate = duplicate,
                .final_path = final_path};
    }

    void UploadEngine::release(std::int64_t upload_id)
    {
        std::shared_ptr<ActiveUpload> upload;
        {
            std::lock_guard lock(sessions_mutex_);
            auto it = sessions_.find(upload_id);
            if (it == sessions_.end())
            {
                return;
            }
            upload = std::move(it->second);
            sessions_.erase(it);
        }
        std::lock_guard lock(upload->mutex);
        close_locked(*upload);
    }

    std::size_t UploadEngine::open_sessions() const
    {
        std::lock_guard lock(sessions_mutex_);
        return sessions_.size();
    }

    std::shared_ptr<UploadEngine::ActiveUpload> UploadEngine::acquire(const UploadRecord &record)
    {
        std::lock_guard lock(sessions_mutex_);
        if (auto it = sessions_.find(record.id); it != sessions_.end())
        {
            return it->second;
        }

        // Completion and disconnect settle the row before the session leaves the map.
        const auto current = store_.find_upload(record.id);
        if (!current || protocol::is_terminal(current->status))
        {
            return nullptr;
        }

        auto upload = std::make_shared<ActiveUpload>();
        upload->id = record.id;
        upload->filename = record.filename;
        upload->partial_path = filesystem_.partial_path(record.id);
        upload->ledger_path = filesystem_.chunk_ledger_path(record.id);
        restore(*upload);

        sessions_.emplace(record.id, upload);
        return upload;
    }

    void UploadEngine::restore(ActiveUpload &upload)
    {
        std::ifstream ledger(upload.ledger_path);
        if (!ledger.is_open())
        {
            return;
        }
        std::error_code ec;
        const auto on_disk = std::filesystem::file_size(upload.partial_path, ec);
        if (ec)
        {
            spdlog::warn("Ignoring chunk ledger of upload {}: {}", upload.id, ec.message());
            return;
        }

        // Only entries whose bytes are inside the partial file count; a torn last line is skipped.
        const auto chunk_size = limits_.chunk_size;
        std::string line;
        while (std::getline(ledger, line))
        {
            std::istringstream fields(line);
            std::uint64_t index = 0;
            std::uint64_t total = 0;
            std::uint64_t length = 0;
            if (!(fields >> index >> total >> length) || index >= total || length > chunk_size ||
                (index + 1 < total && length != chunk_size))
            {
                continue;
            }
            if ((upload.total_chunks != 0 && upload.total_chunks != total) || index > on_disk / chunk_size ||
                index * chunk_size + length > on_disk)
            {
                continue;
            }
            upload.total_chunks = total;
            if (upload.received.insert(index).second)
            {
                upload.bytes += length;
            }
        }
        if (!upload.received.empty())
        {
            spdlog::info("Resuming upload {} ({}) with {} of {} chunks ({} bytes)", upload.id, upload.filename,
                         upload.received.size(), upload.total_chunks, upload.bytes);
        }
    }

    std::uint64_t UploadEngine::resumable_bytes(const UploadRecord &record)
    {
        const auto upload = acquire(record);
        if (!upload)
        {
            const auto current = store_.find_upload(record.id);
            return current ? current->size : record.size;
        }
        std::lock_guard lock(upload->mutex);
        return upload->bytes;
    }

    ChunkResult UploadEngine::settled(std::int64_t upload_id, std::uint64_t bytes)
    {
        const auto current = store_.find_upload(upload_id);
        if (current && current->status == UploadStatus::Complete)
        {
            return {.upload_id = upload_id,
                    .bytes = current->size,
                    .status = UploadStatus::Complete,
                    .duplicate = true,
                    .final_path = std::nullopt};
        }
        throw UploadError(drcv::ErrorCode::StaleSession, "Upload " + std::to_string(upload_id) + " is no longer active",
                          current ? current->size : bytes);
    }

    void UploadEngine::open_file(ActiveUpload &upload)
    {
        if (upload.file.is_open())
        {
            return;
        }
        std::error_code ec;
        if (!std::filesystem::exists(upload.partial_path, ec))
        {
            std::ofstream create(upload.partial_path, std::ios::binary);
            if (!create.is_open())
            {
                throw UploadError(drcv::ErrorCode::IOError, "Cannot create " + upload.partial_path.string(), upload.bytes);
            }
        }
        upload.file.open(upload.partial_path, std::ios::binary | std::ios::in | std::ios::out);
        if (!upload.file.is_open())
        {
            throw UploadError(drcv::ErrorCode::IOError, "Cannot open " + upload.partial_path.string(), upload.bytes);
        }
    }

    void UploadEngine::write_chunk(ActiveUpload &upload, std::uint64_t offset, std::string_view data)
    {
        open_file(upload);
        upload.file.clear();
        upload.file.seekp(static_cast<std::streamoff>(offset));
        upload.file.write(data.data(), static_cast<std::streamsize>(data.size()));
        upload.file.flush();
        if (!upload.file)
        {
            upload.file.close();
            throw UploadError(drcv::ErrorCode::IOError,
                              "Failed to write " + std::to_string(data.size()) + " bytes at offset " +
                                  std::to_string(offset) + " of " + upload.partial_path.string(),
                              upload.bytes);
        }
    }

    void UploadEngine::append_ledger(ActiveUpload &upload, std::uint64_t index, std::uint64_t total,
                                     std::uint64_t length)
    {
        std::ofstream ledger(upload.ledger_path, std::ios::app);
        ledger << index << ' ' << total << ' ' << length << '\n';
        ledger.flush();
        if (!ledger)
        {
            throw UploadError(drcv::ErrorCode::IOError,
                              "Failed to record chunk " + std::to_string(index) + " in " + upload.ledger_path.string(),
                              upload.bytes);
        }
    }

    void UploadEngine::close_locked(ActiveUpload &upload)
    {
        if (upload.file.is_open())
        {
            upload.file.close();
        }
        upload.closed = true;
    }

    void UploadEngine::forget(std::int64_t upload_id)
    {
        std::lock_guard lock(sessions_mutex_);
        sessions_.erase(upload_id);
    }

    void UploadEngine::reject_oversize(const UploadRecord &record, const std::string &message)
    {
        if (store_.mark_upload_disconnected(record.id))
        {
            spdlog::warn("Upload {} ({}) from {} rejected: {}", record.id, record.filename, record.client_address, message);
            auto payload = progress_payload(record.id, record.filename, record.client_address, record.size,
                                            UploadStatus::Disconnected);
            payload["reason"] = std::string(drcv::to_string(drcv::ErrorCode::SizeExceeded));
            events_.publish(EventType::UploadDisconnected, std::move(payload));
        }
        release(record.id);
        throw UploadError(drcv::ErrorCode::SizeExceeded, message, record.size);
    }

} // namespace drcv::server
