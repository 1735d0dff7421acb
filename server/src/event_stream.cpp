#include "drcv/server/event_stream.hpp"

#include <asio/bind_executor.hpp>
#include <asio/post.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace drcv::server
{

    std::string format_sse(const Event &event)
    {
        std::string frame;
        frame.append("event: ").append(to_string(event.type)).append("\n");
        frame.append("data: ").append(nlohmann::json(event).dump()).append("\n\n");
        return frame;
    }

    EventStreamSession::EventStreamSession(asio::ip::tcp::socket socket, EventBroadcaster &events,
                                           std::shared_ptr<EventSubscription> subscription,
                                           std::chrono::seconds keepalive)
        : socket_(std::move(socket)),
          strand_(asio::make_strand(socket_.get_executor())),
          keepalive_timer_(strand_),
          keepalive_(keepalive),
          events_(events),
          subscription_(std::move(subscription)) {}

    void EventStreamSession::start()
    {
        auto self = shared_from_this();
        std::weak_ptr<EventStreamSession> weak = self;
        subscription_->set_notifier([weak]
                                    {
            if (auto session = weak.lock())
            {
                asio::post(session->strand_, [session]
                           { session->pump(); });
            } });
        asio::post(strand_, [self]
                   {
            spdlog::debug("Event stream opened ({} subscribers)", self->events_.subscriber_count());
            self->outbox_.emplace_back(": connected\n\n");
            self->pump();
            self->watch_disconnect();
            self->schedule_keepalive(); });
    }

    // Pulls from the subscription only once the previous batch is on the wire, so a slow reader
    // backs up into the bounded queue instead of the outbox.
    void EventStreamSession::pump()
    {
        if (closed_ || writing_)
        {
            return;
        }
        if (outbox_.empty())
        {
            for (const auto &event : subscription_->drain())
            {
                outbox_.push_back(format_sse(event));
            }
        }
        write_next();
    }

    void EventStreamSession::write_next()
    {
        if (closed_ || writing_)
        {
            return;
        }
        if (outbox_.empty())
        {
            if (subscription_->closed())
            {
                close();
            }
            return;
        }
        writing_ = true;
        auto frame = std::make_shared<std::string>(std::move(outbox_.front()));
        outbox_.pop_front();
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*frame),
                          asio::bind_executor(strand_, [self, frame](const std::error_code &ec, std::size_t /*bytes*/)
                                              {
                              self->writing_ = false;
                              if (ec)
                              {
                                  self->close();
                                  return;
                              }
                              self->pump(); }));
    }

    void EventStreamSession::watch_disconnect()
    {
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(discard_),
                                asio::bind_executor(strand_, [self](const std::error_code &ec, std::size_t /*bytes*/)
                                                    {
                                    if (ec)
                                    {
                                        self->close();
                                        return;
                                    }
                                    self->watch_disconnect(); }));
    }

    void EventStreamSession::schedule_keepalive()
    {
        auto self = shared_from_this();
        keepalive_timer_.expires_after(keepalive_);
        keepalive_timer_.async_wait(asio::bind_executor(strand_, [self](const std::error_code &ec)
                                                        {
            if (ec || self->closed_)
            {
                return;
            }
            if (!self->writing_ && self->outbox_.empty())
            {
                self->outbox_.emplace_back(": keepalive\n\n");
                self->write_next();
            }
            self->schedule_keepalive(); }));
    }

    void EventStreamSession::close()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        keepalive_timer_.cancel();
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        subscription_->close();
        events_.unsubscribe(subscription_.get());
        if (const auto dropped = subscription_->dropped(); dropped > 0)
        {
            spdlog::info("Event stream closed after dropping {} events", dropped);
        }
        else
        {
            spdlog::debug("Event stream closed");
        }
    }

} // namespace drcv::server
