#include "drcv/server/event_broadcaster.hpp"

#include <algorithm>
#include <array>

#include <spdlog/spdlog.h>

namespace drcv::server
{

    namespace
    {
        struct EventTypeMapping
        {
            EventType type;
            std::string_view label;
        };

        constexpr std::array<EventTypeMapping, 8> kEventTypeMappings{{
            {EventType::UploadCreated, "upload_created"},
            {EventType::UploadProgress, "upload_progress"},
            {EventType::UploadCompleted, "upload_completed"},
            {EventType::UploadDisconnected, "upload_disconnected"},
            {EventType::UploadPruned, "upload_pruned"},
            {EventType::ClientConnected, "client_connected"},
            {EventType::ClientDisconnected, "client_disconnected"},
            {EventType::TunnelStatus, "tunnel_status"},
        }};
    } // namespace

    std::string_view to_string(EventType type) noexcept
    {
        for (const auto &mapping : kEventTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    void to_json(nlohmann::json &json, const Event &event)
    {
        json = nlohmann::json{
            {"type", std::string(to_string(event.type))},
            {"at", protocol::format_timestamp(event.at)},
            {"data", event.payload},
        };
    }

    EventSubscription::EventSubscription(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    bool EventSubscription::push(const Event &event)
    {
        std::function<void()> notify;
        {
            std::lock_guard lock(mutex_);
            if (closed_)
            {
                return false;
            }
            if (queue_.size() >= capacity_)
            {
                ++dropped_;
                return false;
            }
            const bool was_empty = queue_.empty();
            queue_.push_back(event);
            if (was_empty)
            {
                notify = notifier_;
            }
        }
        ready_.notify_one();
        if (notify)
        {
            notify();
        }
        return true;
    }

    std::vector<Event> EventSubscription::drain()
    {
        std::lock_guard lock(mutex_);
        std::vector<Event> events(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
        queue_.clear();
        return events;
    }

    std::optional<Event> EventSubscription::wait_pop(std::chrono::milliseconds timeout)
    {
        std::unique_lock lock(mutex_);
        ready_.wait_for(lock, timeout, [this]
                        { return !queue_.empty() || closed_; });
        if (queue_.empty())
        {
            return std::nullopt;
        }
        auto event = std::move(queue_.front());
        queue_.pop_front();
        return event;
    }

    void EventSubscription::set_notifier(std::function<void()> notifier)
    {
        std::lock_guard lock(mutex_);
        notifier_ = std::move(notifier);
    }

    void EventSubscription::close()
    {
        std::function<void()> notify;
        {
            std::lock_guard lock(mutex_);
            if (closed_)
            {
                return;
            }
            closed_ = true;
            notify = notifier_;
        }
        ready_.notify_all();
        if (notify)
        {
            notify();
        }
    }

    bool EventSubscription::closed() const
    {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    std::uint64_t EventSubscription::dropped() const
    {
        std::lock_guard lock(mutex_);
        return dropped_;
    }

    EventBroadcaster::EventBroadcaster(std::size_t queue_capacity) : queue_capacity_(queue_capacity) {}

    std::shared_ptr<EventSubscription> EventBroadcaster::subscribe()
    {
        auto subscription = std::make_shared<EventSubscription>(queue_capacity_);
        std::lock_guard lock(mutex_);
        subscribers_.push_back(subscription);
        return subscription;
    }

    void EventBroadcaster::unsubscribe(const EventSubscription *subscription)
    {
        std::lock_guard lock(mutex_);
        subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                          [subscription](const std::weak_ptr<EventSubscription> &weak)
                                          {
                                              auto ptr = weak.lock();
                                              return !ptr || ptr.get() == subscription;
                                          }),
                           subscribers_.end());
    }

    std::vector<std::shared_ptr<EventSubscription>> EventBroadcaster::live_subscribers()
    {
        std::lock_guard lock(mutex_);
        std::vector<std::shared_ptr<EventSubscription>> live;
        live.reserve(subscribers_.size());
        subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                          [&live](const std::weak_ptr<EventSubscription> &weak)
                                          {
                                              auto ptr = weak.lock();
                                              if (!ptr || ptr->closed())
                                              {
                                                  return true;
                                              }
                                              live.push_back(std::move(ptr));
                                              return false;
                                          }),
                           subscribers_.end());
        return live;
    }

    std::size_t EventBroadcaster::publish(Event event)
    {
        if (event.at == protocol::Timestamp{})
        {
            event.at = std::chrono::system_clock::now();
        }
        std::size_t delivered = 0;
        for (const auto &subscriber : live_subscribers())
        {
            if (subscriber->push(event))
            {
                ++delivered;
            }
            else if (!subscriber->closed())
            {
                ++dropped_total_;
                spdlog::debug("Dropped {} event for a slow subscriber", to_string(event.type));
            }
        }
        return delivered;
    }

    std::size_t EventBroadcaster::publish(EventType type, nlohmann::json payload)
    {
        return publish(Event{.type = type, .payload = std::move(payload), .at = {}});
    }

    void EventBroadcaster::close_all()
    {
        std::vector<std::shared_ptr<EventSubscription>> live;
        {
            std::lock_guard lock(mutex_);
            for (const auto &weak : subscribers_)
            {
                if (auto ptr = weak.lock())
                {
                    live.push_back(std::move(ptr));
                }
            }
            subscribers_.clear();
        }
        for (const auto &subscriber : live)
        {
            subscriber->close();
        }
    }

    std::size_t EventBroadcaster::subscriber_count() const
    {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::count_if(subscribers_.begin(), subscribers_.end(),
                                                       [](const std::weak_ptr<EventSubscription> &weak)
                                                       {
                                                           auto ptr = weak.lock();
                                                           return ptr && !ptr->closed();
                                                       }));
    }

} // namespace drcv::server
