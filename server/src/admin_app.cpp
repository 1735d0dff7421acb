#include "drcv/server/admin_app.hpp"

#include <charconv>
#include <memory>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "drcv/protocol.hpp"
#include "drcv/server/event_broadcaster.hpp"
#include "drcv/server/event_stream.hpp"
#include "drcv/server/store.hpp"
#include "drcv/server/tunnel.hpp"
#include "drcv/server/upload_engine.hpp"

namespace drcv::server
{

    namespace
    {

        std::size_t parse_page(const http::Request &request)
        {
            const auto raw = request.query_param("page");
            if (!raw || raw->empty())
            {
                return 1;
            }
            long long value = 0;
            const auto [end, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
            if (ec == std::errc::invalid_argument || end != raw->data() + raw->size())
            {
                throw http::HttpParseError(drcv::ErrorCode::InvalidRequest, "page must be an integer");
            }
            if (ec == std::errc::result_out_of_range)
            {
                if (raw->front() == '-')
                {
                    return 1;
                }
                throw http::HttpParseError(drcv::ErrorCode::InvalidRequest, "page is out of range");
            }
            return value < 1 ? 1 : static_cast<std::size_t>(value);
        }

    } // namespace

    AdminApp::AdminApp(Store &store, EventBroadcaster &events, TunnelService &tunnel, UploadEngine &engine,
                       std::size_t page_size, std::chrono::seconds keepalive)
        : store_(store), events_(events), tunnel_(tunnel), engine_(engine), page_size_(page_size), keepalive_(keepalive) {}

    HttpReply AdminApp::handle(const http::Request &request)
    {
        HttpReply reply;
        if (request.method != "GET" && request.method != "HEAD")
        {
            reply.response = error_response(drcv::ErrorCode::MethodNotAllowed, "Admin endpoints are read-only");
            reply.response.set_header("Allow", "GET, HEAD");
            return reply;
        }
        try
        {
            if (request.path == "/data")
            {
                reply.response = data(request);
            }
            else if (request.path == "/clients")
            {
                reply.response = clients();
            }
            else if (request.path == "/tunnel")
            {
                reply.response = tunnel();
            }
            else if (request.path == "/stats")
            {
                reply.response = stats();
            }
            else if (request.path == "/events" && request.method == "GET")
            {
                reply = events();
            }
            else
            {
                reply.response = error_response(drcv::ErrorCode::NotFound, "No route for " + request.path);
            }
        }
        catch (const http::HttpParseError &ex)
        {
            reply.response = error_response(ex.code(), ex.what());
        }
        catch (const StoreError &ex)
        {
            spdlog::error("Admin query {} failed: {}", request.path, ex.what());
            reply.response = error_response(ex.code(), ex.what());
        }
        return reply;
    }

    http::Response AdminApp::data(const http::Request &request)
    {
        const auto page = parse_page(request);
        const auto query = request.query_param("q").value_or("");
        const auto result = store_.list_uploads(page, page_size_, query);
        return http::json_response(200, nlohmann::json(result).dump());
    }

    http::Response AdminApp::clients()
    {
        return http::json_response(200, nlohmann::json{{"clients", store_.list_clients()}}.dump());
    }

    http::Response AdminApp::tunnel()
    {
        return http::json_response(200, nlohmann::json(tunnel_.status()).dump());
    }

    http::Response AdminApp::stats()
    {
        const auto counts = store_.counts();
        nlohmann::json body{
            {"uploads", {
                            {"init", counts.init},
                            {"uploading", counts.uploading},
                            {"complete", counts.complete},
                            {"disconnected", counts.disconnected},
                        }},
            {"clients", {
                            {"connected", counts.clients_connected},
                            {"total", counts.clients_total},
                        }},
            {"open_sessions", engine_.open_sessions()},
            {"event_subscribers", events_.subscriber_count()},
            {"dropped_events", events_.dropped_total()},
        };
        return http::json_response(200, body.dump());
    }

    HttpReply AdminApp::events()
    {
        HttpReply reply;
        reply.response.status = 200;
        reply.response.set_header("Content-Type", "text/event-stream");
        reply.response.set_header("Cache-Control", "no-cache");
        reply.response.set_header("X-Accel-Buffering", "no");

        auto subscription = events_.subscribe();
        reply.stream = [&events = events_, subscription, keepalive = keepalive_](asio::ip::tcp::socket socket)
        {
            std::make_shared<EventStreamSession>(std::move(socket), events, subscription, keepalive)->start();
        };
        return reply;
    }

} // namespace drcv::server
