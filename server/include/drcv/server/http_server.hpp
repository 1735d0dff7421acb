#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/streambuf.hpp>

#include "drcv/error_codes.hpp"
#include "drcv/http.hpp"

namespace drcv::server
{

    // Takes over the connection once the response head has been written.
    using StreamStarter = std::function<void(asio::ip::tcp::socket)>;

    struct HttpReply
    {
        http::Response response;
        StreamStarter stream;
    };

    using Handler = std::function<HttpReply(const http::Request &)>;

    // JSON error body {"error", "message", "uploaded_bytes"?} with the status mapped from `code`.
    http::Response error_response(drcv::ErrorCode code, const std::string &message,
                                  std::optional<std::uint64_t> uploaded_bytes = std::nullopt);

    struct ListenerOptions
    {
        std::string name;
        std::string address;
        std::uint16_t port{};
        std::size_t body_limit{};
    };

    class HttpListener
    {
    public:
        HttpListener(asio::io_context &io_context, ListenerOptions options, Handler handler);

        void start();
        void stop();

        // Actual bound port, useful when the configured port was 0.
        std::uint16_t port() const;

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);

        ListenerOptions options_;
        std::shared_ptr<const Handler> handler_;
        asio::ip::tcp::acceptor acceptor_;
    };

    class HttpSession : public std::enable_shared_from_this<HttpSession>
    {
    public:
        HttpSession(asio::ip::tcp::socket socket, std::size_t body_limit, std::shared_ptr<const Handler> handler);

        void start();

    private:
        void read_head();
        void on_head(std::size_t head_bytes);
        void read_body(std::size_t have);
        void dispatch();
        void write_response(const http::Response &response, bool keep_alive, bool head_request);
        void write_stream(HttpReply reply);
        void fail(drcv::ErrorCode code, const std::string &message);
        void stop();

        asio::ip::tcp::socket socket_;
        std::size_t body_limit_;
        std::shared_ptr<const Handler> handler_;
        asio::streambuf buffer_;
        http::Request request_;
        std::size_t content_length_{};
        std::string peer_;
    };

} // namespace drcv::server
