#include "drcv/server/http_server.hpp"

#include <algorithm>

#include <asio/buffers_iterator.hpp>
#include <asio/ip/address.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "drcv/protocol.hpp"

namespace drcv::server
{

    namespace
    {
        constexpr std::size_t kMaxHeadBytes = 16 * 1024;
        constexpr auto kContinue = "HTTP/1.1 100 Continue\r\n\r\n";
    } // namespace

    http::Response error_response(drcv::ErrorCode code, const std::string &message,
                                  std::optional<std::uint64_t> uploaded_bytes)
    {
        const protocol::ErrorBody body{.error = code, .message = message, .uploaded_bytes = uploaded_bytes};
        auto response = http::json_response(drcv::http_status(code), nlohmann::json(body).dump());
        if (uploaded_bytes)
        {
            response.set_header("x-uploaded-bytes", std::to_string(*uploaded_bytes));
        }
        return response;
    }

    HttpListener::HttpListener(asio::io_context &io_context, ListenerOptions options, Handler handler)
        : options_(std::move(options)),
          handler_(std::make_shared<const Handler>(std::move(handler))),
          acceptor_(io_context)
    {
        const auto address = asio::ip::make_address(options_.address);
        const asio::ip::tcp::endpoint endpoint(address, options_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        spdlog::info("{} listener on {}:{}", options_.name, options_.address, port());
    }

    void HttpListener::start()
    {
        accept_next();
    }

    void HttpListener::stop()
    {
        std::error_code ec;
        acceptor_.close(ec);
        if (ec)
        {
            spdlog::warn("Closing {} listener: {}", options_.name, ec.message());
        }
    }

    std::uint16_t HttpListener::port() const
    {
        return acceptor_.local_endpoint().port();
    }

    void HttpListener::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void HttpListener::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            auto session = std::make_shared<HttpSession>(std::move(socket), options_.body_limit, handler_);
            session->start();
        }
        if (!acceptor_.is_open())
        {
            return;
        }
        if (ec && ec != asio::error::operation_aborted)
        {
            spdlog::error("{} accept error: {}", options_.name, ec.message());
        }
        accept_next();
    }

    HttpSession::HttpSession(asio::ip::tcp::socket socket, std::size_t body_limit,
                             std::shared_ptr<const Handler> handler)
        : socket_(std::move(socket)), body_limit_(body_limit), handler_(std::move(handler)), buffer_(kMaxHeadBytes)
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        peer_ = ec ? std::string("unknown") : endpoint.address().to_string();
    }

    void HttpSession::start()
    {
        read_head();
    }

    void HttpSession::read_head()
    {
        auto self = shared_from_this();
        asio::async_read_until(socket_, buffer_, "\r\n\r\n",
                               [this, self](const std::error_code &ec, std::size_t head_bytes)
                               {
                                   if (ec == asio::error::not_found)
                                   {
                                       fail(drcv::ErrorCode::PayloadTooLarge, "Request head too large");
                                       return;
                                   }
                                   if (ec)
                                   {
                                       stop();
                                       return;
                                   }
                                   on_head(head_bytes);
                               });
    }

    void HttpSession::on_head(std::size_t head_bytes)
    {
        const auto begin = asio::buffers_begin(buffer_.data());
        const std::string head(begin, begin + static_cast<std::ptrdiff_t>(head_bytes));
        buffer_.consume(head_bytes);

        try
        {
            auto parsed = http::parse_request_head(head);
            request_ = std::move(parsed.request);
            content_length_ = parsed.content_length;
        }
        catch (const http::HttpParseError &ex)
        {
            fail(ex.code(), ex.what());
            return;
        }
        request_.remote_address = peer_;

        if (content_length_ > body_limit_)
        {
            fail(drcv::ErrorCode::PayloadTooLarge,
                 "Request body of " + std::to_string(content_length_) + " bytes exceeds the limit of " +
                     std::to_string(body_limit_));
            return;
        }

        const auto buffered = std::min(buffer_.size(), content_length_);
        const auto body_begin = asio::buffers_begin(buffer_.data());
        request_.body.assign(body_begin, body_begin + static_cast<std::ptrdiff_t>(buffered));
        buffer_.consume(buffered);
        if (buffered == content_length_)
        {
            dispatch();
            return;
        }

        const auto expect = request_.header("expect");
        if (expect && http::to_lower(*expect) == "100-continue")
        {
            auto self = shared_from_this();
            asio::async_write(socket_, asio::buffer(kContinue, std::char_traits<char>::length(kContinue)),
                              [this, self, buffered](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                              {
                                  if (ec)
                                  {
                                      stop();
                                      return;
                                  }
                                  read_body(buffered);
                              });
            return;
        }
        read_body(buffered);
    }

    void HttpSession::read_body(std::size_t have)
    {
        request_.body.resize(content_length_);
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(request_.body.data() + have, content_length_ - have),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 spdlog::debug("{} dropped while sending {} {}: {}", peer_, request_.method,
                                               request_.path, ec.message());
                                 stop();
                                 return;
                             }
                             dispatch();
                         });
    }

    void HttpSession::dispatch()
    {
        HttpReply reply;
        try
        {
            reply = (*handler_)(request_);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Unhandled error for {} {}: {}", request_.method, request_.path, ex.what());
            reply.response = error_response(drcv::ErrorCode::InternalError, "Internal server error");
        }
        spdlog::debug("{} {} {} -> {}", peer_, request_.method, request_.target, reply.response.status);

        if (reply.stream)
        {
            write_stream(std::move(reply));
            return;
        }
        write_response(reply.response, request_.keep_alive(), request_.method == "HEAD");
    }

    void HttpSession::write_response(const http::Response &response, bool keep_alive, bool head_request)
    {
        auto payload = std::make_shared<std::string>(http::serialize_response(response, keep_alive, head_request));
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*payload),
                          [this, self, payload, keep_alive](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec || !keep_alive)
                              {
                                  stop();
                                  return;
                              }
                              read_head();
                          });
    }

    void HttpSession::write_stream(HttpReply reply)
    {
        auto head = std::make_shared<std::string>(http::serialize_stream_head(reply.response));
        auto starter = std::make_shared<StreamStarter>(std::move(reply.stream));
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*head),
                          [this, self, head, starter](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                                  return;
                              }
                              (*starter)(std::move(socket_));
                          });
    }

    void HttpSession::fail(drcv::ErrorCode code, const std::string &message)
    {
        spdlog::debug("Rejecting request from {}: {}", peer_, message);
        write_response(error_response(code, message), false, false);
    }

    void HttpSession::stop()
    {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

} // namespace drcv::server
