#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>

#include "drcv/error_codes.hpp"

namespace drcv::server
{

    class FilesystemError : public std::runtime_error
    {
    public:
        FilesystemError(drcv::ErrorCode code, std::string message);

        drcv::ErrorCode code() const noexcept { return code_; }

    private:
        drcv::ErrorCode code_;
    };

    /**
     * Owns the upload root. In-progress bytes live under <root>/.partial/<id>.part, beside a
     * <id>.chunks ledger, and are moved next to the other completed files once an upload finishes.
     */
    class Filesystem
    {
    public:
        explicit Filesystem(std::filesystem::path root);

        const std::filesystem::path &root() const noexcept { return base_; }
        const std::filesystem::path &partial_dir() const noexcept { return partial_dir_; }

        // Trims and validates a client supplied filename. Throws FilesystemError(InvalidRequest).
        static std::string sanitize_filename(const std::string &requested);

        std::filesystem::path partial_path(std::int64_t upload_id) const;

        // Append-only record of the chunks written into the partial file, one "index total length" per line.
        std::filesystem::path chunk_ledger_path(std::int64_t upload_id) const;

        // Moves a finished partial file to <root>/<filename>, choosing "name (n).ext" when taken.
        std::filesystem::path finalize(const std::filesystem::path &partial, const std::string &filename);

        // Removes the partial file and its chunk ledger. Best effort; returns false if no partial file was removed.
        bool remove_partial(std::int64_t upload_id) const;

    private:
        std::filesystem::path unique_target(const std::string &filename) const;

        std::filesystem::path base_;
        std::filesystem::path partial_dir_;
        std::mutex finalize_mutex_;
    };

} // namespace drcv::server
