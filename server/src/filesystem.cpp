#include "drcv/server/filesystem.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

#include "drcv/http.hpp"

namespace drcv::server
{

    FilesystemError::FilesystemError(drcv::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {
        constexpr auto kPartialDir = ".partial";
        constexpr std::size_t kMaxFilenameBytes = 255;
        constexpr int kMaxCollisionSuffix = 10000;

        [[noreturn]] void reject(const std::string &message)
        {
            throw FilesystemError(drcv::ErrorCode::InvalidRequest, message);
        }

    } // namespace

    Filesystem::Filesystem(std::filesystem::path root)
        : base_(std::move(root)), partial_dir_(base_ / kPartialDir)
    {
        std::error_code ec;
        std::filesystem::create_directories(partial_dir_, ec);
        if (ec)
        {
            throw FilesystemError(drcv::ErrorCode::IOError,
                                  "Cannot create upload directory " + partial_dir_.string() + ": " + ec.message());
        }
    }

    std::string Filesystem::sanitize_filename(const std::string &requested)
    {
        const auto name = std::string(http::trim(requested));
        if (name.empty())
        {
            reject("Filename is empty");
        }
        if (name == "." || name == "..")
        {
            reject("Filename is not a file name");
        }
        if (name.size() > kMaxFilenameBytes)
        {
            reject("Filename is longer than 255 bytes");
        }
        for (const auto ch : name)
        {
            const auto byte = static_cast<unsigned char>(ch);
            if (ch == '/' || ch == '\\')
            {
                reject("Path traversal detected");
            }
            if (byte < 0x20 || byte == 0x7f)
            {
                reject("Filename contains control characters");
            }
        }
        if (name.rfind(kPartialDir, 0) == 0)
        {
            reject("Filename is reserved");
        }
        return name;
    }

    std::filesystem::path Filesystem::partial_path(std::int64_t upload_id) const
    {
        return partial_dir_ / (std::to_string(upload_id) + ".part");
    }

    std::filesystem::path Filesystem::chunk_ledger_path(std::int64_t upload_id) const
    {
        return partial_dir_ / (std::to_string(upload_id) + ".chunks");
    }

    std::filesystem::path Filesystem::unique_target(const std::string &filename) const
    {
        auto candidate = base_ / filename;
        if (!std::filesystem::exists(candidate))
        {
            return candidate;
        }
        const std::filesystem::path as_path(filename);
        const auto stem = as_path.stem().string();
        const auto extension = as_path.extension().string();
        for (int n = 1; n <= kMaxCollisionSuffix; ++n)
        {
            candidate = base_ / (stem + " (" + std::to_string(n) + ")" + extension);
            if (!std::filesystem::exists(candidate))
            {
                return candidate;
            }
        }
        throw FilesystemError(drcv::ErrorCode::IOError, "No free name left for " + filename);
    }

    std::filesystem::path Filesystem::finalize(const std::filesystem::path &partial, const std::string &filename)
    {
        std::lock_guard lock(finalize_mutex_);
        const auto target = unique_target(filename);
        std::error_code ec;
        std::filesystem::rename(partial, target, ec);
        if (ec)
        {
            throw FilesystemError(drcv::ErrorCode::IOError,
                                  "Cannot move " + partial.string() + " to " + target.string() + ": " + ec.message());
        }
        return target;
    }

    bool Filesystem::remove_partial(std::int64_t upload_id) const
    {
        std::error_code ec;
        const auto path = partial_path(upload_id);
        const bool removed = std::filesystem::remove(path, ec);
        if (ec)
        {
            spdlog::warn("Failed to remove {}: {}", path.string(), ec.message());
            return false;
        }
        const auto ledger = chunk_ledger_path(upload_id);
        std::filesystem::remove(ledger, ec);
        if (ec)
        {
            spdlog::warn("Failed to remove {}: {}", ledger.string(), ec.message());
        }
        return removed;
    }

} // namespace drcv::server
