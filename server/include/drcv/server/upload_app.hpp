#pragma once

#include <string>

#include "drcv/http.hpp"
#include "drcv/server/http_server.hpp"

namespace drcv::server
{

    class UploadEngine;
    class LivenessTracker;

    // The TCP peer, or the forwarded client when a local proxy (the tunnel) relays the request.
    std::string resolve_client_address(const http::Request &request, bool trust_proxy_headers);

    /**
     * Routes of the public listener:
     *   HEAD|GET /upload?filename=  resumable offset query
     *   POST /upload                multipart chunk (filename, chunk_index, total_chunks, chunk)
     *   POST /heartbeat             {"upload_ids": [...]}
     */
    class UploadApp
    {
    public:
        UploadApp(UploadEngine &engine, LivenessTracker &liveness, bool trust_proxy_headers);

        HttpReply handle(const http::Request &request);

    private:
        http::Response resume_offset(const http::Request &request, const std::string &client);
        http::Response upload_chunk(const http::Request &request, const std::string &client);
        http::Response heartbeat(const http::Request &request, const std::string &client);

        UploadEngine &engine_;
        LivenessTracker &liveness_;
        bool trust_proxy_headers_;
    };

} // namespace drcv::server
