#include "drcv/server/upload_app.hpp"

#include <charconv>
#include <initializer_list>

#include <asio/ip/address.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "drcv/multipart.hpp"
#include "drcv/protocol.hpp"
#include "drcv/server/filesystem.hpp"
#include "drcv/server/liveness.hpp"
#include "drcv/server/store.hpp"
#include "drcv/server/upload_engine.hpp"
#include "drcv/version.hpp"

namespace drcv::server
{

    namespace
    {

        bool is_loopback(const std::string &address)
        {
            std::error_code ec;
            const auto parsed = asio::ip::make_address(address, ec);
            if (ec)
            {
                return false;
            }
            if (parsed.is_v6() && parsed.to_v6().is_v4_mapped())
            {
                return asio::ip::make_address_v4(asio::ip::v4_mapped, parsed.to_v6()).is_loopback();
            }
            return parsed.is_loopback();
        }

        std::uint64_t parse_field_number(const http::FormPart &part)
        {
            const auto text = http::trim(part.data);
            std::uint64_t value = 0;
            const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (text.empty() || ec != std::errc{} || end != text.data() + text.size())
            {
                throw UploadError(drcv::ErrorCode::InvalidRequest, "Field " + part.name + " must be a non-negative integer");
            }
            return value;
        }

        const http::FormPart &require_part(const std::vector<http::FormPart> &parts, std::string_view name)
        {
            const auto *part = http::find_part(parts, name);
            if (part == nullptr)
            {
                throw UploadError(drcv::ErrorCode::InvalidRequest, "Missing form field " + std::string(name));
            }
            return *part;
        }

        std::string user_agent(const http::Request &request)
        {
            return request.header("user-agent").value_or("");
        }

        void set_upload_headers(http::Response &response, std::int64_t id, std::uint64_t bytes,
                                protocol::UploadStatus status)
        {
            response.set_header("x-uploaded-bytes", std::to_string(bytes));
            response.set_header("x-upload-id", std::to_string(id));
            response.set_header("x-upload-status", std::string(protocol::to_string(status)));
        }

        http::Response method_not_allowed(std::string allow)
        {
            auto response = error_response(drcv::ErrorCode::MethodNotAllowed, "Method not allowed");
            response.set_header("Allow", std::move(allow));
            return response;
        }

    } // namespace

    std::string resolve_client_address(const http::Request &request, bool trust_proxy_headers)
    {
        if (!trust_proxy_headers || !is_loopback(request.remote_address))
        {
            return request.remote_address;
        }
        for (const auto *name : {"cf-connecting-ip", "x-forwarded-for"})
        {
            const auto value = request.header(name);
            if (!value)
            {
                continue;
            }
            const auto first = std::string(http::trim(std::string_view(*value).substr(0, value->find(','))));
            std::error_code ec;
            const auto parsed = asio::ip::make_address(first, ec);
            if (!ec)
            {
                return parsed.to_string();
            }
        }
        return request.remote_address;
    }

    UploadApp::UploadApp(UploadEngine &engine, LivenessTracker &liveness, bool trust_proxy_headers)
        : engine_(engine), liveness_(liveness), trust_proxy_headers_(trust_proxy_headers) {}

    HttpReply UploadApp::handle(const http::Request &request)
    {
        const auto client = resolve_client_address(request, trust_proxy_headers_);
        HttpReply reply;
        try
        {
            if (request.path == "/upload")
            {
                liveness_.touch_client(client, user_agent(request));
                if (request.method == "HEAD" || request.method == "GET")
                {
                    reply.response = resume_offset(request, client);
                }
                else if (request.method == "POST")
                {
                    reply.response = upload_chunk(request, client);
                }
                else
                {
                    reply.response = method_not_allowed("GET, HEAD, POST");
                }
            }
            else if (request.path == "/heartbeat")
            {
                reply.response = request.method == "POST" ? heartbeat(request, client) : method_not_allowed("POST");
            }
            else if (request.path == "/")
            {
                reply.response = http::text_response(200, "drcv " + std::string(drcv::version()) +
                                                              " is receiving files on this address\n");
            }
            else
            {
                reply.response = error_response(drcv::ErrorCode::NotFound, "No route for " + request.path);
            }
        }
        catch (const UploadError &ex)
        {
            spdlog::debug("Upload request from {} rejected ({}): {}", client, drcv::to_string(ex.code()), ex.what());
            reply.response = error_response(ex.code(), ex.what(), ex.uploaded_bytes());
        }
        catch (const http::HttpParseError &ex)
        {
            reply.response = error_response(ex.code(), ex.what());
        }
        catch (const FilesystemError &ex)
        {
            spdlog::error("Filesystem error for {}: {}", client, ex.what());
            reply.response = error_response(ex.code(), ex.what());
        }
        catch (const StoreError &ex)
        {
            spdlog::error("Store error for {}: {}", client, ex.what());
            reply.response = error_response(ex.code(), ex.what());
        }
        catch (const nlohmann::json::exception &ex)
        {
            reply.response = error_response(drcv::ErrorCode::InvalidRequest, ex.what());
        }
        return reply;
    }

    http::Response UploadApp::resume_offset(const http::Request &request, const std::string &client)
    {
        const auto filename = request.query_param("filename");
        if (!filename || filename->empty())
        {
            throw UploadError(drcv::ErrorCode::InvalidRequest, "Query parameter filename is required");
        }
        const auto result = engine_.resume_offset(*filename, client);
        auto response = http::json_response(200, nlohmann::json{
                                                     {"upload_id", result.upload_id},
                                                     {"uploaded_bytes", result.bytes},
                                                     {"status", std::string(protocol::to_string(result.status))},
                                                     {"chunk_size", engine_.limits().chunk_size},
                                                 }
                                                     .dump());
        set_upload_headers(response, result.upload_id, result.bytes, result.status);
        response.set_header("x-chunk-size", std::to_string(engine_.limits().chunk_size));
        return response;
    }

    http::Response UploadApp::upload_chunk(const http::Request &request, const std::string &client)
    {
        const auto boundary = http::boundary_from_content_type(request.header("content-type").value_or(""));
        if (!boundary)
        {
            throw UploadError(drcv::ErrorCode::InvalidRequest, "Expected a multipart/form-data body");
        }
        const auto parts = http::parse_multipart(request.body, *boundary);
        const auto &chunk = require_part(parts, "chunk");

        ChunkRequest chunk_request{};
        if (const auto *name = http::find_part(parts, "filename"))
        {
            chunk_request.filename = name->data;
        }
        else if (chunk.filename)
        {
            chunk_request.filename = *chunk.filename;
        }
        else
        {
            throw UploadError(drcv::ErrorCode::InvalidRequest, "Missing form field filename");
        }
        chunk_request.client_address = client;
        chunk_request.chunk_index = parse_field_number(require_part(parts, "chunk_index"));
        chunk_request.total_chunks = parse_field_number(require_part(parts, "total_chunks"));
        chunk_request.data = chunk.data;

        const auto result = engine_.accept_chunk(chunk_request);
        auto response = http::text_response(200, std::to_string(result.upload_id));
        set_upload_headers(response, result.upload_id, result.bytes, result.status);
        return response;
    }

    http::Response UploadApp::heartbeat(const http::Request &request, const std::string &client)
    {
        const auto body = nlohmann::json::parse(request.body);
        protocol::HeartbeatRequest heartbeat_request;
        try
        {
            heartbeat_request = body.get<protocol::HeartbeatRequest>();
        }
        catch (const std::logic_error &ex)
        {
            throw UploadError(drcv::ErrorCode::InvalidRequest, ex.what());
        }
        const auto result = liveness_.heartbeat(client, user_agent(request), heartbeat_request);
        return http::json_response(200, nlohmann::json(result).dump());
    }

} // namespace drcv::server
