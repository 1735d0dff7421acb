#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include "drcv/protocol.hpp"

namespace drcv::server
{

    class Store;
    class Filesystem;
    class UploadEngine;
    class EventBroadcaster;

    struct LivenessSettings
    {
        std::chrono::seconds client_stale_timeout{120};
        std::chrono::seconds upload_stale_timeout{60};
        std::chrono::seconds sweep_interval{10};
        // Zero keeps terminal uploads forever.
        std::chrono::seconds retention{0};
    };

    struct SweepReport
    {
        std::size_t clients_disconnected{};
        std::size_t uploads_disconnected{};
        std::size_t uploads_pruned{};
        std::size_t failures{};

        bool empty() const noexcept
        {
            return clients_disconnected == 0 && uploads_disconnected == 0 && uploads_pruned == 0 && failures == 0;
        }
    };

    class LivenessTracker
    {
    public:
        LivenessTracker(Store &store, UploadEngine &engine, Filesystem &filesystem, EventBroadcaster &events,
                        LivenessSettings settings);
        ~LivenessTracker();

        LivenessTracker(const LivenessTracker &) = delete;
        LivenessTracker &operator=(const LivenessTracker &) = delete;

        // Marks the address as seen; announces it when it was unknown or disconnected.
        protocol::ClientRecord touch_client(const std::string &address, const std::string &user_agent);

        // Unknown, finished or foreign upload ids are counted as ignored, never reported as errors.
        protocol::HeartbeatResponse heartbeat(const std::string &address, const std::string &user_agent,
                                              const protocol::HeartbeatRequest &request);

        // One pass over stale clients, stale uploads and, when enabled, expired history.
        // A failing row is counted and skipped.
        SweepReport sweep();

        void start(asio::io_context &io_context);
        void stop();

    private:
        bool disconnect_upload(const protocol::UploadRecord &upload, const char *reason);
        void schedule_locked();

        Store &store_;
        UploadEngine &engine_;
        Filesystem &filesystem_;
        EventBroadcaster &events_;
        LivenessSettings settings_;

        std::mutex timer_mutex_;
        std::unique_ptr<asio::steady_timer> timer_;
        bool running_{false};
    };

} // namespace drcv::server
