#include "drcv/server/liveness.hpp"

#include <exception>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "drcv/server/event_broadcaster.hpp"
#include "drcv/server/filesystem.hpp"
#include "drcv/server/store.hpp"
#include "drcv/server/upload_engine.hpp"

namespace drcv::server
{

    using protocol::ClientRecord;
    using protocol::UploadRecord;

    LivenessTracker::LivenessTracker(Store &store, UploadEngine &engine, Filesystem &filesystem, EventBroadcaster &events,
                                     LivenessSettings settings)
        : store_(store), engine_(engine), filesystem_(filesystem), events_(events), settings_(settings) {}

    LivenessTracker::~LivenessTracker()
    {
        stop();
    }

    ClientRecord LivenessTracker::touch_client(const std::string &address, const std::string &user_agent)
    {
        auto touched = store_.touch_client(address, user_agent);
        if (touched.newly_connected)
        {
            spdlog::info("Client connected: {}", address);
            events_.publish(EventType::ClientConnected, touched.client);
        }
        return touched.client;
    }

    protocol::HeartbeatResponse LivenessTracker::heartbeat(const std::string &address, const std::string &user_agent,
                                                           const protocol::HeartbeatRequest &request)
    {
        touch_client(address, user_agent);

        protocol::HeartbeatResponse response{};
        for (const auto id : request.upload_ids)
        {
            const auto upload = store_.find_upload(id);
            if (!upload || upload->client_address != address || protocol::is_terminal(upload->status))
            {
                spdlog::debug("Heartbeat from {} ignored upload {} ({})", address, id,
                              drcv::to_string(drcv::ErrorCode::StaleSession));
                ++response.ignored;
                continue;
            }
            if (store_.touch_upload(id))
            {
                ++response.refreshed;
            }
            else
            {
                ++response.ignored;
            }
        }
        return response;
    }

    bool LivenessTracker::disconnect_upload(const UploadRecord &upload, const char *reason)
    {
        if (!store_.mark_upload_disconnected(upload.id))
        {
            return false;
        }
        engine_.release(upload.id);
        spdlog::info("Upload {} ({}) from {} disconnected: {}", upload.id, upload.filename, upload.client_address, reason);
        auto payload = nlohmann::json(upload);
        payload["status"] = std::string(protocol::to_string(protocol::UploadStatus::Disconnected));
        payload["reason"] = reason;
        events_.publish(EventType::UploadDisconnected, std::move(payload));
        return true;
    }

    SweepReport LivenessTracker::sweep()
    {
        SweepReport report{};
        const auto now = store_.now();

        try
        {
            for (const auto &client : store_.stale_clients(now - settings_.client_stale_timeout))
            {
                try
                {
                    if (store_.mark_client_disconnected(client.address))
                    {
                        ++report.clients_disconnected;
                        spdlog::info("Client disconnected: {}", client.address);
                        auto payload = nlohmann::json(client);
                        payload["status"] = std::string(protocol::to_string(protocol::ClientStatus::Disconnected));
                        events_.publish(EventType::ClientDisconnected, std::move(payload));
                    }
                    for (const auto &upload : store_.active_uploads_for_client(client.address))
                    {
                        if (disconnect_upload(upload, "client_stale"))
                        {
                            ++report.uploads_disconnected;
                        }
                    }
                }
                catch (const std::exception &ex)
                {
                    ++report.failures;
                    spdlog::warn("Sweep failed for client {}: {}", client.address, ex.what());
                }
            }
        }
        catch (const std::exception &ex)
        {
            ++report.failures;
            spdlog::error("Sweep could not list stale clients: {}", ex.what());
        }

        try
        {
            for (const auto &upload : store_.stale_uploads(now - settings_.upload_stale_timeout))
            {
                try
                {
                    if (disconnect_upload(upload, "upload_stale"))
                    {
                        ++report.uploads_disconnected;
                    }
                }
                catch (const std::exception &ex)
                {
                    ++report.failures;
                    spdlog::warn("Sweep failed for upload {}: {}", upload.id, ex.what());
                }
            }
        }
        catch (const std::exception &ex)
        {
            ++report.failures;
            spdlog::error("Sweep could not list stale uploads: {}", ex.what());
        }

        if (settings_.retention.count() > 0)
        {
            try
            {
                for (const auto &upload : store_.prune_uploads(now - settings_.retention))
                {
                    filesystem_.remove_partial(upload.id);
                    ++report.uploads_pruned;
                    events_.publish(EventType::UploadPruned, nlohmann::json{{"id", upload.id}, {"filename", upload.filename}});
                }
            }
            catch (const std::exception &ex)
            {
                ++report.failures;
                spdlog::error("Sweep could not prune history: {}", ex.what());
            }
        }

        if (!report.empty())
        {
            spdlog::info("Sweep: {} clients disconnected, {} uploads disconnected, {} pruned, {} failures",
                         report.clients_disconnected, report.uploads_disconnected, report.uploads_pruned,
                         report.failures);
        }
        return report;
    }

    void LivenessTracker::start(asio::io_context &io_context)
    {
        std::lock_guard lock(timer_mutex_);
        timer_ = std::make_unique<asio::steady_timer>(io_context);
        running_ = true;
        schedule_locked();
        spdlog::info("Liveness sweep every {}s (clients {}s, uploads {}s)", settings_.sweep_interval.count(),
                     settings_.client_stale_timeout.count(), settings_.upload_stale_timeout.count());
    }

    void LivenessTracker::stop()
    {
        std::lock_guard lock(timer_mutex_);
        running_ = false;
        if (timer_)
        {
            timer_->cancel();
        }
    }

    void LivenessTracker::schedule_locked()
    {
        timer_->expires_after(settings_.sweep_interval);
        timer_->async_wait([this](const std::error_code &ec)
                           {
            if (ec)
            {
                return;
            }
            try
            {
                sweep();
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Liveness sweep failed: {}", ex.what());
            }
            std::lock_guard lock(timer_mutex_);
            if (running_)
            {
                schedule_locked();
            } });
    }

} // namespace drcv::server
