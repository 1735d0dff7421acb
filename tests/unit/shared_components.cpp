#undef NDEBUG
#include <cassert>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "drcv/crypto.hpp"
#include "drcv/error_codes.hpp"
#include "drcv/http.hpp"
#include "drcv/multipart.hpp"
#include "drcv/protocol.hpp"

using namespace drcv;

void run_server_component_tests();

namespace
{

    template <typename Fn>
    ErrorCode expect_parse_error(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const http::HttpParseError &ex)
        {
            return ex.code();
        }
        assert(false && "expected HttpParseError");
        return ErrorCode::Ok;
    }

    void test_request_head()
    {
        const std::string head = "POST /upload?filename=a%20b.txt&flag HTTP/1.1\r\n"
                                 "Host: localhost\r\n"
                                 "Content-Length: 12\r\n"
                                 "X-Forwarded-For: 10.0.0.1\r\n"
                                 "x-forwarded-for: 10.0.0.2\r\n"
                                 "Connection: close\r\n"
                                 "\r\n";
        const auto parsed = http::parse_request_head(head);
        assert(parsed.request.method == "POST");
        assert(parsed.request.path == "/upload");
        assert(parsed.request.query_param("filename") == std::optional<std::string>("a b.txt"));
        assert(parsed.request.query_param("flag") == std::optional<std::string>(""));
        assert(!parsed.request.query_param("missing"));
        assert(parsed.content_length == 12);
        assert(parsed.request.header("HOST") == std::optional<std::string>("localhost"));
        assert(parsed.request.header("x-forwarded-for") == std::optional<std::string>("10.0.0.1, 10.0.0.2"));
        assert(!parsed.request.keep_alive());

        const auto legacy = http::parse_request_head("GET / HTTP/1.0\r\n\r\n");
        assert(legacy.request.version_minor == 0);
        assert(!legacy.request.keep_alive());
        assert(legacy.content_length == 0);
    }

    void test_request_head_rejections()
    {
        assert(expect_parse_error([]
                                  { http::parse_request_head("POST /upload HTTP/1.1\r\n"
                                                             "Transfer-Encoding: chunked\r\n\r\n"); }) ==
               ErrorCode::Unsupported);
        assert(expect_parse_error([]
                                  { http::parse_request_head("GET / HTTP/2.0\r\n\r\n"); }) == ErrorCode::Unsupported);
        assert(expect_parse_error([]
                                  { http::parse_request_head("garbage"); }) == ErrorCode::InvalidRequest);
        assert(expect_parse_error([]
                                  { http::parse_request_head("GET relative HTTP/1.1\r\n\r\n"); }) ==
               ErrorCode::InvalidRequest);
        assert(expect_parse_error([]
                                  { http::parse_request_head("POST / HTTP/1.1\r\nContent-Length: 1x\r\n\r\n"); }) ==
               ErrorCode::InvalidRequest);
        assert(expect_parse_error([]
                                  { http::parse_request_head("GET / HTTP/1.1\r\nNoColon\r\n\r\n"); }) ==
               ErrorCode::InvalidRequest);
    }

    void test_response_serialization()
    {
        auto response = http::json_response(200, "{}");
        response.set_header("x-uploaded-bytes", "10");
        response.set_header("X-Uploaded-Bytes", "20");

        const auto full = http::serialize_response(response, true, false);
        assert(full.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
        assert(full.find("x-uploaded-bytes: 20\r\n") != std::string::npos);
        assert(full.find("Content-Length: 2\r\n") != std::string::npos);
        assert(full.find("Connection: keep-alive\r\n\r\n{}") != std::string::npos);

        const auto head_only = http::serialize_response(response, false, true);
        assert(head_only.find("Content-Length: 2\r\n") != std::string::npos);
        assert(head_only.size() >= 4 && head_only.substr(head_only.size() - 4) == "\r\n\r\n");

        http::Response stream;
        stream.set_header("Content-Type", "text/event-stream");
        const auto stream_head = http::serialize_stream_head(stream);
        assert(stream_head.find("Content-Length") == std::string::npos);
        assert(stream_head.find("Content-Type: text/event-stream\r\n") != std::string::npos);

        assert(http::reason_phrase(413) == "Payload Too Large");
        assert(http::reason_phrase(799) == "Unknown");
    }

    void test_multipart()
    {
        assert(http::boundary_from_content_type("multipart/form-data; boundary=\"xyz\"") ==
               std::optional<std::string>("xyz"));
        assert(http::boundary_from_content_type("Multipart/Form-Data;boundary=abc") ==
               std::optional<std::string>("abc"));
        assert(!http::boundary_from_content_type("application/json"));
        assert(!http::boundary_from_content_type("multipart/form-data"));

        // Payload deliberately contains CRLF and a partial delimiter.
        const std::string payload = std::string("ab\r\n--xy\0cd", 11);
        std::string body;
        body += "--xyz\r\n";
        body += "Content-Disposition: form-data; name=\"filename\"\r\n\r\n";
        body += "report.pdf\r\n";
        body += "--xyz\r\n";
        body += "Content-Disposition: form-data; name=\"chunk\"; filename=\"blob\"\r\n";
        body += "Content-Type: application/octet-stream\r\n\r\n";
        body += payload;
        body += "\r\n--xyz--\r\n";

        const auto parts = http::parse_multipart(body, "xyz");
        assert(parts.size() == 2);
        const auto *filename = http::find_part(parts, "filename");
        assert(filename != nullptr && filename->data == "report.pdf");
        assert(!filename->filename);
        const auto *chunk = http::find_part(parts, "chunk");
        assert(chunk != nullptr);
        assert(chunk->data == payload);
        assert(chunk->filename == std::optional<std::string>("blob"));
        assert(chunk->content_type == "application/octet-stream");
        assert(http::find_part(parts, "missing") == nullptr);

        assert(expect_parse_error([]
                                  { http::parse_multipart("no delimiter here", "xyz"); }) == ErrorCode::InvalidRequest);
        assert(expect_parse_error([]
                                  { http::parse_multipart("--xyz\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\nvalue",
                                                          "xyz"); }) == ErrorCode::InvalidRequest);
        assert(expect_parse_error([]
                                  { http::parse_multipart("--xyz\r\nContent-Type: text/plain\r\n\r\nv\r\n--xyz--", "xyz"); }) ==
               ErrorCode::InvalidRequest);
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::InvalidChunk) == "invalid_chunk");
        assert(to_string(ErrorCode::DependencyMissing) == "dependency_missing");
        assert(http_status(ErrorCode::InvalidChunk) == 400);
        assert(http_status(ErrorCode::SizeExceeded) == 413);
        assert(http_status(ErrorCode::StoreError) == 503);
        assert(http_status(ErrorCode::NotFound) == 404);
        assert(to_string(ErrorCode::StaleSession) == "stale_session");
    }

    void test_crypto()
    {
        const auto first = crypto::random_identifier(6);
        const auto second = crypto::random_identifier(6);
        assert(first.size() == 6);
        for (const char c : first)
        {
            assert(std::islower(static_cast<unsigned char>(c)) || std::isdigit(static_cast<unsigned char>(c)));
        }
        // 36^6 possibilities; a collision here means the generator is broken.
        assert(first != second);

        assert(crypto::random_string(4, "x") == "xxxx");
        bool threw = false;
        try
        {
            (void)crypto::random_string(4, "");
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_protocol_records()
    {
        using namespace drcv::protocol;

        assert(format_timestamp(from_unix_millis(0)) == "1970-01-01T00:00:00.000Z");
        assert(format_timestamp(from_unix_millis(1714564800250)) == "2024-05-01T12:00:00.250Z");
        assert(to_unix_millis(from_unix_millis(1714564800250)) == 1714564800250);

        assert(upload_status_from_string("complete") == UploadStatus::Complete);
        assert(!upload_status_from_string("COMPLETE"));
        assert(is_terminal(UploadStatus::Disconnected));
        assert(!is_terminal(UploadStatus::Uploading));

        UploadRecord record{
            .id = 7,
            .filename = "a.bin",
            .client_address = "10.0.0.5",
            .size = 42,
            .status = UploadStatus::Uploading,
            .created_at = from_unix_millis(0),
            .updated_at = from_unix_millis(1000),
        };
        const nlohmann::json json = record;
        assert(json["id"] == 7);
        assert(json["status"] == "uploading");
        assert(json["completed_at"].is_null());

        const auto heartbeat = nlohmann::json::parse(R"({"upload_ids": [1, "2"]})").get<HeartbeatRequest>();
        assert((heartbeat.upload_ids == std::vector<std::int64_t>{1, 2}));
        const auto empty = nlohmann::json::parse(R"({})").get<HeartbeatRequest>();
        assert(empty.upload_ids.empty());

        bool threw = false;
        try
        {
            (void)nlohmann::json::parse(R"({"upload_ids": [true]})").get<HeartbeatRequest>();
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);

        const nlohmann::json error = ErrorBody{.error = ErrorCode::SizeExceeded, .message = "too big", .uploaded_bytes = 5};
        assert(error["error"] == "size_exceeded");
        assert(error["uploaded_bytes"] == 5);
    }

} // namespace

int main()
{
    try
    {
        test_request_head();
        test_request_head_rejections();
        test_response_serialization();
        test_multipart();
        test_error_codes();
        test_crypto();
        test_protocol_records();
        run_server_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
