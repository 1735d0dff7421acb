#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

#include "drcv/protocol.hpp"
#include "drcv/server/event_broadcaster.hpp"
#include "drcv/server/filesystem.hpp"
#include "drcv/server/store.hpp"
#include "drcv/server/upload_engine.hpp"

namespace drcv::testing
{

    inline void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    inline std::filesystem::path fresh_directory(const std::string &name)
    {
        const auto path = std::filesystem::temp_directory_path() / name;
        cleanup_path(path);
        std::filesystem::create_directories(path);
        return path;
    }

    inline std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    // Store clock that only moves when told to.
    class ManualClock
    {
    public:
        ManualClock() : now_(std::make_shared<protocol::Timestamp>(protocol::from_unix_millis(1700000000000))) {}

        server::Clock clock() const
        {
            auto now = now_;
            return [now]
            { return *now; };
        }

        void advance(std::chrono::seconds by) { *now_ += by; }

    private:
        std::shared_ptr<protocol::Timestamp> now_;
    };

    // Store, upload root, broadcaster and engine under one scratch directory.
    struct EngineHarness
    {
        explicit EngineHarness(const std::string &name,
                               server::UploadLimits limits = {.chunk_size = 4, .max_file_size = 1024})
            : directory(fresh_directory(name)),
              store(directory / "drcv.db", clock.clock()),
              filesystem(directory / "uploads"),
              events(64),
              engine(store, filesystem, events, limits) {}

        ~EngineHarness() { cleanup_path(directory); }

        server::ChunkResult send(const std::string &filename, const std::string &client, std::uint64_t index,
                                 std::uint64_t total, std::string_view data)
        {
            return engine.accept_chunk(server::ChunkRequest{
                .filename = filename,
                .client_address = client,
                .chunk_index = index,
                .total_chunks = total,
                .data = data,
            });
        }

        ManualClock clock;
        std::filesystem::path directory;
        server::Store store;
        server::Filesystem filesystem;
        server::EventBroadcaster events;
        server::UploadEngine engine;
    };

    template <typename Error, typename Fn>
    drcv::ErrorCode expect_error(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const Error &ex)
        {
            return ex.code();
        }
        return drcv::ErrorCode::Ok;
    }

} // namespace drcv::testing
